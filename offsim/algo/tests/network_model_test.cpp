#include <offsim/algo/access_point_load_network_model.hpp>
#include <offsim/algo/averaged_network_model.hpp>
#include <offsim/algo/contention_network_model.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>

using namespace offsim::algo;
using namespace offsim::core;

namespace {

// Single task type: 1 000 KB in and out, one task every 5 s per device
SimulationConfig edge_config(std::size_t access_points) {
    SimulationConfig config;
    config.network.wlan_bandwidth_kbps = 100000.0;
    config.network.wan_bandwidth_kbps = 100000.0;

    TaskType type;
    type.name = "augmented_reality";
    type.usage_percent = 100.0;
    type.mean_interarrival = 5.0;
    type.mean_input_kb = 1000.0;
    type.mean_output_kb = 1000.0;
    config.task_types.push_back(type);

    for (std::size_t i = 0; i < access_points; ++i) {
        EdgeDatacenterSpec dc;
        dc.access_point = AccessPoint{static_cast<AccessPointId>(i), 0,
                                      100.0 * static_cast<double>(i), 0.0};
        config.edge_datacenters.push_back(dc);
    }
    return config;
}

Task make_task() {
    TaskProperties props;
    props.input_kb = 1000.0;
    props.output_kb = 1000.0;
    return Task{0, props, TimePoint::epoch()};
}

bool within_relative(double actual, double expected, double tolerance) {
    return std::abs(actual - expected) <= tolerance * std::abs(expected);
}

} // namespace

TEST(AveragedNetworkModelTest, UploadDelayMatchesClosedForm) {
    // 100 devices over 10 access points: 10 devices per WLAN cell
    auto config = edge_config(10);
    AveragedNetworkModel model(config, 100);
    Task task = make_task();

    double mu = (100000.0 * 1000.0 / 8.0) / (1000.0 * 1000.0);
    double lambda = 10.0 / 5.0;
    double expected = 1.0 / (mu - lambda);

    double delay = model.upload_delay(task, Location{0, 4, 400.0, 0.0},
                                      ResourceRef{Tier::Edge, 4, 0, 4}, TimePoint::epoch());

    EXPECT_DOUBLE_EQ(model.devices_per_access_point(), 10.0);
    EXPECT_TRUE(within_relative(delay, expected, 1e-9)) << delay << " vs " << expected;
}

TEST(AveragedNetworkModelTest, SingleCellWithHundredDevicesSaturates) {
    auto config = edge_config(1);
    AveragedNetworkModel model(config, 100);
    Task task = make_task();

    double delay = model.upload_delay(task, Location{0, 0, 0.0, 0.0},
                                      ResourceRef{Tier::Edge, 0, 0, 0}, TimePoint::epoch());
    EXPECT_LE(delay, 0.0);
}

TEST(AccessPointLoadNetworkModelTest, CountsDevicesAtServingAccessPoint) {
    auto config = edge_config(2);
    MobilityModel mobility(config.access_points());
    Location first{0, 0, 0.0, 0.0};
    Location second{0, 1, 100.0, 0.0};
    for (int d = 0; d < 4; ++d) {
        auto& timeline = mobility.add_device(MotionKind::Discrete);
        timeline.append(TimePoint::epoch(), d < 3 ? first : second);
    }
    mobility.finalize(TimePoint::epoch());

    AccessPointLoadNetworkModel model(config, mobility);
    Task task = make_task();

    double crowded = model.upload_delay(task, first, ResourceRef{Tier::Edge, 0, 0, 0},
                                        time_from_seconds(1.0));
    double quiet = model.upload_delay(task, second, ResourceRef{Tier::Edge, 1, 0, 1},
                                      time_from_seconds(1.0));

    EXPECT_DOUBLE_EQ(crowded, 1.0 / (12.5 - 3.0 / 5.0));
    EXPECT_DOUBLE_EQ(quiet, 1.0 / (12.5 - 1.0 / 5.0));
}

TEST(ContentionNetworkModelTest, ActiveTransfersRaiseDelay) {
    auto config = edge_config(2);
    ContentionNetworkModel model(config);
    Task task = make_task();
    Location device{0, 0, 0.0, 0.0};
    ResourceRef edge{Tier::Edge, 0, 0, 0};

    double idle = model.upload_delay(task, device, edge, TimePoint::epoch());
    EXPECT_DOUBLE_EQ(idle, 1.0 / (12.5 - 1.0 / 5.0));

    model.upload_started(device, edge);
    model.upload_started(device, edge);
    EXPECT_EQ(model.links().active(Link::Wlan, 0), 2u);
    double busy = model.upload_delay(task, device, edge, TimePoint::epoch());
    EXPECT_DOUBLE_EQ(busy, 1.0 / (12.5 - 3.0 / 5.0));
    EXPECT_GT(busy, idle);

    model.upload_finished(device, edge);
    model.upload_finished(device, edge);
    EXPECT_DOUBLE_EQ(model.upload_delay(task, device, edge, TimePoint::epoch()), idle);
}

TEST(ContentionNetworkModelTest, OtherCellIsUnaffected) {
    auto config = edge_config(2);
    ContentionNetworkModel model(config);
    Task task = make_task();
    Location here{0, 0, 0.0, 0.0};
    Location there{0, 1, 100.0, 0.0};

    model.download_started(here, ResourceRef{Tier::Edge, 0, 0, 0});

    EXPECT_DOUBLE_EQ(
        model.download_delay(task, there, ResourceRef{Tier::Edge, 1, 0, 1}, TimePoint::epoch()),
        1.0 / (12.5 - 1.0 / 5.0));
    model.download_finished(here, ResourceRef{Tier::Edge, 0, 0, 0});
    EXPECT_EQ(model.links().active(Link::Wlan, 0), 0u);
}
