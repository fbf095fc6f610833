#pragma once

/// @file statistics.hpp
/// @brief Statistics sinks and the run summary.
///
/// MemoryRecordSink keeps every per-task record; SummaryStatistics reduces
/// them on the fly to outcome counts and mean delays per application type,
/// the figures the offloading studies compare across scenarios and policies.
///
/// @ingroup io_statistics

#include <offsim/core/config.hpp>
#include <offsim/core/statistics_sink.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace offsim::io {

/// @brief Sink that stores every record in arrival order.
/// @ingroup io_statistics
class MemoryRecordSink : public core::StatisticsSink {
public:
    void record(const core::TaskRecord& record) override { records_.push_back(record); }

    [[nodiscard]] const std::vector<core::TaskRecord>& records() const noexcept {
        return records_;
    }

    /// @brief Number of records with @p outcome.
    [[nodiscard]] std::size_t count(core::Outcome outcome) const noexcept;

    void clear() noexcept { records_.clear(); }

private:
    std::vector<core::TaskRecord> records_;
};

/// @brief Running mean of a sample.
/// @ingroup io_statistics
struct MeanAccumulator {
    uint64_t count{0};
    double total{0.0};

    void add(double value) noexcept {
        ++count;
        total += value;
    }

    [[nodiscard]] double mean() const noexcept {
        return count == 0 ? 0.0 : total / static_cast<double>(count);
    }
};

/// @brief Aggregated figures for one application type (or all of them).
///
/// Delay means are taken over completed tasks only. Rejections and failures
/// are split by reason; `per_tier_completed` is indexed by core::Tier.
///
/// @ingroup io_statistics
struct AppSummary {
    std::string name;
    uint64_t completed{0};
    uint64_t rejected_capacity{0};
    uint64_t rejected_bandwidth{0};
    uint64_t failed_mobility{0};
    uint64_t incomplete{0};
    std::array<uint64_t, 3> per_tier_completed{};
    std::array<uint64_t, 3> per_tier_failed{};

    MeanAccumulator service_time;   ///< created to completion
    MeanAccumulator upload_delay;
    MeanAccumulator exec_delay;
    MeanAccumulator download_delay;
    MeanAccumulator network_delay;  ///< upload + download

    /// @brief Tasks that left the system, incomplete ones included.
    [[nodiscard]] uint64_t total() const noexcept {
        return completed + failed() + incomplete;
    }

    /// @brief Rejections and mobility failures.
    [[nodiscard]] uint64_t failed() const noexcept {
        return rejected_capacity + rejected_bandwidth + failed_mobility;
    }

    /// @brief Percentage of finished tasks that failed, incomplete ones excluded.
    [[nodiscard]] double failure_percent() const noexcept;
};

/// @brief Sink reducing records to per-application summaries.
///
/// Records of tasks created before the warm-up period are counted in
/// warm_up_records() and otherwise ignored. VM load samples are averaged per
/// tier.
///
/// @ingroup io_statistics
class SummaryStatistics : public core::StatisticsSink {
public:
    /// @param task_types  Names label the per-application summaries.
    /// @param warm_up     Records created earlier (seconds) are skipped.
    SummaryStatistics(const std::vector<core::TaskType>& task_types, double warm_up);

    void record(const core::TaskRecord& record) override;

    /// @brief Add one sample of the mean VM utilization (percent) per tier.
    void record_vm_load(double edge, double cloud, double mobile);

    [[nodiscard]] const AppSummary& overall() const noexcept { return overall_; }
    [[nodiscard]] const std::vector<AppSummary>& per_app() const noexcept { return per_app_; }
    [[nodiscard]] uint64_t warm_up_records() const noexcept { return warm_up_records_; }

    /// @brief Mean of the VM load samples of @p tier.
    [[nodiscard]] double average_vm_load(core::Tier tier) const noexcept;

private:
    double warm_up_;
    AppSummary overall_;
    std::vector<AppSummary> per_app_;
    uint64_t warm_up_records_{0};
    std::array<MeanAccumulator, 3> vm_load_{};
};

/// @brief Serialise @p summary as a JSON object.
///
/// Layout: `{"overall": {...}, "apps": [{...}, ...], "vm_load": {...},
/// "warm_up_records": n}`; each application object carries its outcome
/// counts, failure percentage and mean delays in seconds.
///
/// @ingroup io_statistics
[[nodiscard]] std::string summary_to_json(const SummaryStatistics& summary);

/// @brief Write summary_to_json() followed by a newline to @p out.
/// @ingroup io_statistics
void write_summary_json(const SummaryStatistics& summary, std::ostream& out);

} // namespace offsim::io
