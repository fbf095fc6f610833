#include <offsim/algo/queueing.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace offsim::algo;
using namespace offsim::core;

TEST(QueueingTest, MM1MeanResponseTime) {
    EXPECT_DOUBLE_EQ(mm1_delay(10.0, 5.0, 0.0), 0.2);
    EXPECT_DOUBLE_EQ(mm1_delay(10.0, 5.0, 0.05), 0.25);
}

TEST(QueueingTest, MM1SaturatesWhenArrivalsReachService) {
    EXPECT_LE(mm1_delay(10.0, 10.0, 0.0), 0.0);
    EXPECT_LE(mm1_delay(10.0, 12.0, 0.0), 0.0);
    EXPECT_LE(mm1_delay(10.0, 10.0, 1.0), 0.0);
}

TEST(QueueingTest, MM2MeanResponseTime) {
    // 4 * 10 / ((20 - 5) * (20 + 5))
    EXPECT_DOUBLE_EQ(mm2_delay(10.0, 5.0, 0.0), 40.0 / 375.0);
    EXPECT_GT(mm2_delay(10.0, 15.0, 0.0), 0.0);
    EXPECT_LE(mm2_delay(10.0, 20.0, 0.0), 0.0);
}

TEST(QueueingTest, ServiceAndArrivalRates) {
    // 100 000 Kbps = 12.5 MB/s; 1 000 KB messages
    EXPECT_DOUBLE_EQ(service_rate(100000.0, 1000.0), 12.5);
    EXPECT_DOUBLE_EQ(service_rate(100000.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(arrival_rate(10.0, 5.0), 2.0);
    EXPECT_DOUBLE_EQ(arrival_rate(10.0, 0.0), 0.0);
}

TEST(QueueingTest, TaskMixIsUsageWeighted) {
    std::vector<TaskType> types(3);
    types[0].usage_percent = 75.0;
    types[0].mean_input_kb = 100.0;
    types[0].mean_interarrival = 2.0;
    types[0].cloud_selection_percent = 0.0;
    types[1].usage_percent = 25.0;
    types[1].mean_input_kb = 500.0;
    types[1].mean_interarrival = 10.0;
    types[1].cloud_selection_percent = 40.0;
    types[2].usage_percent = 0.0;
    types[2].mean_input_kb = 1e9;

    TaskMix mix = TaskMix::from(types);

    EXPECT_DOUBLE_EQ(mix.mean_input_kb, 200.0);
    EXPECT_DOUBLE_EQ(mix.mean_interarrival, 4.0);
    EXPECT_DOUBLE_EQ(mix.cloud_share, 0.1);
}

class LinkDelayCalculatorTest : public ::testing::Test {
protected:
    LinkDelayCalculatorTest() {
        settings_.wlan_bandwidth_kbps = 100000.0;
        settings_.wan_bandwidth_kbps = 20000.0;
        settings_.lan_internal_delay = 0.005;
        mix_.mean_input_kb = 1000.0;
        mix_.mean_output_kb = 1000.0;
        mix_.mean_interarrival = 5.0;
    }

    NetworkSettings settings_;
    TaskMix mix_;
    Location device_{0, 0, 0.0, 0.0};
};

TEST_F(LinkDelayCalculatorTest, EdgeAtServingAccessPoint) {
    LinkDelayCalculator calc(settings_, mix_);

    double expected = 1.0 / (12.5 - 2.0);
    EXPECT_DOUBLE_EQ(calc.wlan_delay(1000.0, 10.0), expected);
    EXPECT_DOUBLE_EQ(
        calc.route_delay(Direction::Upload, device_, ResourceRef{Tier::Edge, 0, 0, 0}, 10.0, 0.0),
        expected);
}

TEST_F(LinkDelayCalculatorTest, RemoteEdgeAddsLanHops) {
    LinkDelayCalculator calc(settings_, mix_);
    ResourceRef remote{Tier::Edge, 3, 0, 2};
    double wlan = calc.wlan_delay(1000.0, 10.0);

    EXPECT_DOUBLE_EQ(calc.route_delay(Direction::Upload, device_, remote, 10.0, 0.0),
                     wlan + 0.005);
    EXPECT_DOUBLE_EQ(calc.route_delay(Direction::Download, device_, remote, 10.0, 0.0),
                     wlan + 0.010);
}

TEST_F(LinkDelayCalculatorTest, CloudRouteAddsWan) {
    LinkDelayCalculator calc(settings_, mix_);
    ResourceRef cloud{Tier::Cloud, 0, 0, 0};

    // WAN: mu = 2.5, lambda = 1 / 5
    double expected = calc.wlan_delay(1000.0, 10.0) + 1.0 / (2.5 - 0.2);
    EXPECT_DOUBLE_EQ(calc.route_delay(Direction::Upload, device_, cloud, 10.0, 1.0), expected);

    // 13 devices on the WAN saturate it (lambda = 2.6 > 2.5)
    EXPECT_LE(calc.route_delay(Direction::Upload, device_, cloud, 10.0, 13.0), 0.0);
}

TEST_F(LinkDelayCalculatorTest, SaturatedWlanSaturatesRoute) {
    LinkDelayCalculator calc(settings_, mix_);

    // lambda = 100 / 5 = 20 > 12.5
    EXPECT_LE(calc.wlan_delay(1000.0, 100.0), 0.0);
    EXPECT_LE(
        calc.route_delay(Direction::Upload, device_, ResourceRef{Tier::Edge, 0, 0, 0}, 100.0, 0.0),
        0.0);
}

TEST_F(LinkDelayCalculatorTest, DelaysAboveCapCountAsSaturated) {
    settings_.max_queueing_delay = 0.05;
    LinkDelayCalculator calc(settings_, mix_);

    EXPECT_LE(calc.wlan_delay(1000.0, 10.0), 0.0);
    EXPECT_GT(calc.wlan_delay(100.0, 10.0), 0.0);
}

TEST_F(LinkDelayCalculatorTest, MobileTargetHasNoNetworkDelay) {
    LinkDelayCalculator calc(settings_, mix_);

    EXPECT_DOUBLE_EQ(
        calc.route_delay(Direction::Upload, device_, ResourceRef{Tier::Mobile, 0, 0, 0}, 1.0, 0.0),
        0.0);
}

TEST_F(LinkDelayCalculatorTest, MM2DisciplineOnWlan) {
    settings_.wlan_discipline = QueueDiscipline::MM2;
    LinkDelayCalculator calc(settings_, mix_);

    EXPECT_DOUBLE_EQ(calc.wlan_delay(1000.0, 10.0), mm2_delay(12.5, 2.0, 0.0));
    // Stable for M/M/2 although an M/M/1 queue would saturate
    EXPECT_GT(calc.wlan_delay(1000.0, 75.0), 0.0);
}

TEST_F(LinkDelayCalculatorTest, EmptyOutputCostsOnlyPropagation) {
    settings_.wlan_propagation_delay = 0.01;
    settings_.wan_propagation_delay = 0.1;
    mix_.mean_input_kb = 20.0;
    mix_.mean_output_kb = 0.0;
    LinkDelayCalculator calc(settings_, mix_);

    EXPECT_DOUBLE_EQ(calc.wlan_delay(0.0, 10.0), 0.01);
    EXPECT_DOUBLE_EQ(calc.wan_delay(0.0, 10.0), 0.1);
    EXPECT_GT(calc.route_delay(Direction::Upload, device_, ResourceRef{Tier::Edge, 0, 0, 0}, 10.0,
                               0.0),
              0.01);
    EXPECT_DOUBLE_EQ(calc.route_delay(Direction::Download, device_,
                                      ResourceRef{Tier::Edge, 0, 0, 0}, 10.0, 0.0),
                     0.01);
    EXPECT_DOUBLE_EQ(calc.route_delay(Direction::Download, device_,
                                      ResourceRef{Tier::Cloud, 0, 0, 0}, 10.0, 5.0),
                     0.01 + 0.1);
}
