#include <offsim/io/statistics.hpp>

#include <rapidjson/document.h>

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using namespace offsim::io;
using namespace offsim::core;

class StatisticsTest : public ::testing::Test {
protected:
    StatisticsTest() {
        TaskType ar;
        ar.name = "augmented_reality";
        TaskType health;
        health.name = "health_app";
        types_ = {ar, health};
    }

    static TaskRecord completed(AppTypeId app, Tier tier, double created, double finished,
                                double upload, double exec, double download) {
        TaskRecord record;
        record.app_type = app;
        record.tier = tier;
        record.created_at = created;
        record.finished_at = finished;
        record.upload_delay = upload;
        record.exec_delay = exec;
        record.download_delay = download;
        record.outcome = Outcome::Completed;
        record.stage = Stage::Download;
        return record;
    }

    static TaskRecord ended(AppTypeId app, Tier tier, double created, Outcome outcome) {
        TaskRecord record;
        record.app_type = app;
        record.tier = tier;
        record.created_at = created;
        record.finished_at = created;
        record.outcome = outcome;
        return record;
    }

    std::vector<TaskType> types_;
};

TEST_F(StatisticsTest, MemorySinkCountsOutcomes) {
    MemoryRecordSink sink;
    sink.record(completed(0, Tier::Edge, 1.0, 2.0, 0.1, 0.8, 0.1));
    sink.record(ended(0, Tier::Cloud, 1.0, Outcome::RejectedBandwidth));
    sink.record(ended(1, Tier::Edge, 1.0, Outcome::RejectedBandwidth));

    EXPECT_EQ(sink.records().size(), 3u);
    EXPECT_EQ(sink.count(Outcome::RejectedBandwidth), 2u);
    EXPECT_EQ(sink.count(Outcome::FailedMobility), 0u);
}

TEST_F(StatisticsTest, SummaryAggregatesPerApplication) {
    SummaryStatistics summary(types_, 0.0);
    summary.record(completed(0, Tier::Edge, 10.0, 11.0, 0.2, 0.6, 0.2));
    summary.record(completed(0, Tier::Cloud, 20.0, 23.0, 0.5, 1.5, 1.0));
    summary.record(ended(0, Tier::Edge, 30.0, Outcome::RejectedCapacity));
    summary.record(ended(1, Tier::Edge, 30.0, Outcome::FailedMobility));
    summary.record(ended(1, Tier::Edge, 40.0, Outcome::Incomplete));

    const auto& ar = summary.per_app()[0];
    EXPECT_EQ(ar.name, "augmented_reality");
    EXPECT_EQ(ar.completed, 2u);
    EXPECT_EQ(ar.rejected_capacity, 1u);
    EXPECT_EQ(ar.total(), 3u);
    EXPECT_DOUBLE_EQ(ar.service_time.mean(), 2.0);
    EXPECT_NEAR(ar.exec_delay.mean(), 1.05, 1e-12);
    EXPECT_NEAR(ar.network_delay.mean(), 0.95, 1e-12);
    EXPECT_EQ(ar.per_tier_completed[static_cast<std::size_t>(Tier::Cloud)], 1u);
    EXPECT_NEAR(ar.failure_percent(), 100.0 / 3.0, 1e-12);

    const auto& overall = summary.overall();
    EXPECT_EQ(overall.total(), 5u);
    EXPECT_EQ(overall.failed(), 2u);
    EXPECT_EQ(overall.incomplete, 1u);
    EXPECT_EQ(overall.per_tier_failed[static_cast<std::size_t>(Tier::Edge)], 2u);
    // Incomplete tasks do not count against the failure rate
    EXPECT_DOUBLE_EQ(overall.failure_percent(), 50.0);
}

TEST_F(StatisticsTest, WarmUpRecordsAreSkipped) {
    SummaryStatistics summary(types_, 60.0);
    summary.record(completed(0, Tier::Edge, 59.9, 61.0, 0.1, 0.9, 0.1));
    summary.record(completed(0, Tier::Edge, 60.0, 61.0, 0.1, 0.8, 0.1));

    EXPECT_EQ(summary.warm_up_records(), 1u);
    EXPECT_EQ(summary.overall().completed, 1u);
}

TEST_F(StatisticsTest, VmLoadAveraged) {
    SummaryStatistics summary(types_, 0.0);
    summary.record_vm_load(10.0, 2.0, 0.0);
    summary.record_vm_load(30.0, 4.0, 0.0);

    EXPECT_DOUBLE_EQ(summary.average_vm_load(Tier::Edge), 20.0);
    EXPECT_DOUBLE_EQ(summary.average_vm_load(Tier::Cloud), 3.0);
    EXPECT_DOUBLE_EQ(summary.average_vm_load(Tier::Mobile), 0.0);
}

TEST_F(StatisticsTest, SummaryJsonIsParseable) {
    SummaryStatistics summary(types_, 0.0);
    summary.record(completed(1, Tier::Edge, 1.0, 1.5, 0.1, 0.3, 0.1));
    summary.record(ended(1, Tier::Cloud, 2.0, Outcome::RejectedBandwidth));

    std::ostringstream oss;
    write_summary_json(summary, oss);

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsObject());

    EXPECT_EQ(doc["overall"]["completed"].GetUint64(), 1u);
    ASSERT_EQ(doc["apps"].Size(), 2u);
    EXPECT_STREQ(doc["apps"][1]["name"].GetString(), "health_app");
    EXPECT_EQ(doc["apps"][1]["rejected_bandwidth"].GetUint64(), 1u);
    EXPECT_DOUBLE_EQ(doc["apps"][1]["service_time"].GetDouble(), 0.5);
    EXPECT_EQ(doc["apps"][1]["failed_per_tier"]["cloud"].GetUint64(), 1u);
    EXPECT_TRUE(doc["vm_load"].HasMember("edge"));
}
