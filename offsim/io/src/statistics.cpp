#include <offsim/io/statistics.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <utility>

namespace offsim::io {

namespace {

std::size_t tier_index(core::Tier tier) noexcept {
    return static_cast<std::size_t>(tier);
}

void write_app(rapidjson::Writer<rapidjson::StringBuffer>& writer, const AppSummary& app) {
    writer.StartObject();

    writer.Key("name");
    writer.String(app.name.c_str());

    writer.Key("total");
    writer.Uint64(app.total());
    writer.Key("completed");
    writer.Uint64(app.completed);
    writer.Key("rejected_capacity");
    writer.Uint64(app.rejected_capacity);
    writer.Key("rejected_bandwidth");
    writer.Uint64(app.rejected_bandwidth);
    writer.Key("failed_mobility");
    writer.Uint64(app.failed_mobility);
    writer.Key("incomplete");
    writer.Uint64(app.incomplete);
    writer.Key("failure_percent");
    writer.Double(app.failure_percent());

    writer.Key("completed_per_tier");
    writer.StartObject();
    for (auto tier : {core::Tier::Mobile, core::Tier::Edge, core::Tier::Cloud}) {
        auto name = core::to_string(tier);
        writer.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
        writer.Uint64(app.per_tier_completed[tier_index(tier)]);
    }
    writer.EndObject();

    writer.Key("failed_per_tier");
    writer.StartObject();
    for (auto tier : {core::Tier::Mobile, core::Tier::Edge, core::Tier::Cloud}) {
        auto name = core::to_string(tier);
        writer.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
        writer.Uint64(app.per_tier_failed[tier_index(tier)]);
    }
    writer.EndObject();

    writer.Key("service_time");
    writer.Double(app.service_time.mean());
    writer.Key("upload_delay");
    writer.Double(app.upload_delay.mean());
    writer.Key("processing_time");
    writer.Double(app.exec_delay.mean());
    writer.Key("download_delay");
    writer.Double(app.download_delay.mean());
    writer.Key("network_delay");
    writer.Double(app.network_delay.mean());

    writer.EndObject();
}

void accumulate(AppSummary& app, const core::TaskRecord& record) {
    auto tier = tier_index(record.tier);
    switch (record.outcome) {
    case core::Outcome::Completed:
        ++app.completed;
        ++app.per_tier_completed[tier];
        app.service_time.add(record.finished_at - record.created_at);
        app.upload_delay.add(record.upload_delay);
        app.exec_delay.add(record.exec_delay);
        app.download_delay.add(record.download_delay);
        app.network_delay.add(record.upload_delay + record.download_delay);
        return;
    case core::Outcome::RejectedCapacity:
        ++app.rejected_capacity;
        break;
    case core::Outcome::RejectedBandwidth:
        ++app.rejected_bandwidth;
        break;
    case core::Outcome::FailedMobility:
        ++app.failed_mobility;
        break;
    case core::Outcome::Incomplete:
        ++app.incomplete;
        return;
    }
    ++app.per_tier_failed[tier];
}

} // namespace

std::size_t MemoryRecordSink::count(core::Outcome outcome) const noexcept {
    return static_cast<std::size_t>(
        std::count_if(records_.begin(), records_.end(),
                      [outcome](const core::TaskRecord& r) { return r.outcome == outcome; }));
}

double AppSummary::failure_percent() const noexcept {
    uint64_t finished = completed + failed();
    if (finished == 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(failed()) / static_cast<double>(finished);
}

SummaryStatistics::SummaryStatistics(const std::vector<core::TaskType>& task_types,
                                     double warm_up)
    : warm_up_(warm_up) {
    overall_.name = "ALL_APPS";
    per_app_.reserve(task_types.size());
    for (const auto& type : task_types) {
        AppSummary app;
        app.name = type.name;
        per_app_.push_back(std::move(app));
    }
}

void SummaryStatistics::record(const core::TaskRecord& record) {
    if (record.created_at < warm_up_) {
        ++warm_up_records_;
        return;
    }
    accumulate(overall_, record);
    if (record.app_type < per_app_.size()) {
        accumulate(per_app_[record.app_type], record);
    }
}

void SummaryStatistics::record_vm_load(double edge, double cloud, double mobile) {
    vm_load_[tier_index(core::Tier::Edge)].add(edge);
    vm_load_[tier_index(core::Tier::Cloud)].add(cloud);
    vm_load_[tier_index(core::Tier::Mobile)].add(mobile);
}

double SummaryStatistics::average_vm_load(core::Tier tier) const noexcept {
    return vm_load_[tier_index(tier)].mean();
}

std::string summary_to_json(const SummaryStatistics& summary) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("overall");
    write_app(writer, summary.overall());

    writer.Key("apps");
    writer.StartArray();
    for (const auto& app : summary.per_app()) {
        write_app(writer, app);
    }
    writer.EndArray();

    writer.Key("vm_load");
    writer.StartObject();
    for (auto tier : {core::Tier::Mobile, core::Tier::Edge, core::Tier::Cloud}) {
        auto name = core::to_string(tier);
        writer.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
        writer.Double(summary.average_vm_load(tier));
    }
    writer.EndObject();

    writer.Key("warm_up_records");
    writer.Uint64(summary.warm_up_records());

    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

void write_summary_json(const SummaryStatistics& summary, std::ostream& out) {
    out << summary_to_json(summary) << "\n";
}

} // namespace offsim::io
