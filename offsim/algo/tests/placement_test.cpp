#include <offsim/algo/basic_orchestration_policy.hpp>
#include <offsim/algo/best_fit_selector.hpp>
#include <offsim/algo/first_fit_selector.hpp>
#include <offsim/algo/next_fit_selector.hpp>
#include <offsim/algo/random_fit_selector.hpp>
#include <offsim/algo/vm_capacity_oracle.hpp>
#include <offsim/algo/worst_fit_selector.hpp>

#include <offsim/core/error.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

using namespace offsim::algo;
using namespace offsim::core;

namespace {

// Two edge datacenters (AP 0: one host with 2 VMs, AP 1: one host with 1 VM),
// a cloud host with 2 VMs and mobile VMs on each device
SimulationConfig placement_config() {
    SimulationConfig config;

    TaskType type;
    type.name = "face_recognition";
    type.usage_percent = 100.0;
    type.cloud_selection_percent = 0.0;
    type.edge_utilization = 30.0;
    type.cloud_utilization = 10.0;
    type.mobile_utilization = 0.0;
    config.task_types.push_back(type);

    VmSpec edge_vm;
    edge_vm.mips = 10000.0;
    HostSpec two_vms;
    two_vms.vms = {edge_vm, edge_vm};
    HostSpec one_vm;
    one_vm.vms = {edge_vm};

    config.edge_datacenters.push_back(EdgeDatacenterSpec{AccessPoint{0, 0, 0.0, 0.0}, {two_vms}});
    config.edge_datacenters.push_back(EdgeDatacenterSpec{AccessPoint{1, 0, 100.0, 0.0}, {one_vm}});

    config.cloud.host_count = 1;
    config.cloud.vms_per_host = 2;
    config.cloud.vm.mips = 20000.0;

    config.mobile.enabled = true;
    config.mobile.vm.mips = 4000.0;
    return config;
}

Task make_task(TaskId id, DeviceId device, double length_mi = 20000.0) {
    TaskProperties props;
    props.device = device;
    props.app_type = 0;
    props.length_mi = length_mi;
    return Task{id, props, TimePoint::epoch()};
}

} // namespace

class VmCapacityOracleTest : public ::testing::Test {
protected:
    SimulationConfig config_ = placement_config();
};

TEST_F(VmCapacityOracleTest, EnumeratesCandidatesPerTier) {
    VmCapacityOracle oracle(config_, 3);

    auto all_edge = oracle.candidates(Tier::Edge, 0, std::nullopt);
    ASSERT_EQ(all_edge.size(), 3u);
    EXPECT_EQ(all_edge[2], (ResourceRef{Tier::Edge, 1, 0, 1}));

    auto at_first = oracle.candidates(Tier::Edge, 0, AccessPointId{0});
    ASSERT_EQ(at_first.size(), 2u);
    EXPECT_EQ(at_first[1], (ResourceRef{Tier::Edge, 0, 1, 0}));

    EXPECT_EQ(oracle.candidates(Tier::Cloud, 0, std::nullopt).size(), 2u);

    auto mobile = oracle.candidates(Tier::Mobile, 2, std::nullopt);
    ASSERT_EQ(mobile.size(), 1u);
    EXPECT_EQ(mobile[0].host, 2u);
}

TEST_F(VmCapacityOracleTest, BindComputesServiceTime) {
    VmCapacityOracle oracle(config_, 1);
    Task task = make_task(0, 0);
    ResourceRef vm{Tier::Edge, 0, 0, 0};

    auto estimate = oracle.bind(vm, task);
    ASSERT_TRUE(estimate.has_value());
    EXPECT_EQ(estimate->service_time, duration_from_seconds(2.0));
    EXPECT_DOUBLE_EQ(estimate->utilization, 30.0);
    EXPECT_DOUBLE_EQ(oracle.utilization(vm), 30.0);
    EXPECT_DOUBLE_EQ(oracle.residual_capacity(vm), 70.0);
}

TEST_F(VmCapacityOracleTest, BindFailsWhenBudgetExceeded) {
    VmCapacityOracle oracle(config_, 1);
    ResourceRef vm{Tier::Edge, 1, 0, 1};

    for (TaskId id = 0; id < 3; ++id) {
        ASSERT_TRUE(oracle.bind(vm, make_task(id, 0)).has_value());
    }
    EXPECT_FALSE(oracle.check_capacity(vm, make_task(3, 0)));
    EXPECT_FALSE(oracle.bind(vm, make_task(3, 0)).has_value());
    EXPECT_DOUBLE_EQ(oracle.utilization(vm), 90.0);

    oracle.release(vm, make_task(0, 0));
    EXPECT_TRUE(oracle.check_capacity(vm, make_task(3, 0)));
}

TEST_F(VmCapacityOracleTest, ReleaseNeverGoesNegative) {
    VmCapacityOracle oracle(config_, 1);
    ResourceRef vm{Tier::Cloud, 0, 1, 0};

    oracle.release(vm, make_task(0, 0));
    EXPECT_DOUBLE_EQ(oracle.utilization(vm), 0.0);
}

TEST_F(VmCapacityOracleTest, AverageUtilizationPerTier) {
    VmCapacityOracle oracle(config_, 1);
    (void)oracle.bind(ResourceRef{Tier::Edge, 0, 0, 0}, make_task(0, 0));
    (void)oracle.bind(ResourceRef{Tier::Edge, 0, 1, 0}, make_task(1, 0));

    EXPECT_DOUBLE_EQ(oracle.average_utilization(Tier::Edge), 20.0);
    EXPECT_DOUBLE_EQ(oracle.average_utilization(Tier::Cloud), 0.0);
}

TEST_F(VmCapacityOracleTest, UnknownResourceThrows) {
    VmCapacityOracle oracle(config_, 2);
    Task task = make_task(0, 0);

    EXPECT_THROW((void)oracle.bind(ResourceRef{Tier::Edge, 5, 0, 0}, task), OutOfRangeError);
    EXPECT_THROW((void)oracle.residual_capacity(ResourceRef{Tier::Edge, 1, 1, 1}),
                 OutOfRangeError);
    EXPECT_THROW((void)oracle.residual_capacity(ResourceRef{Tier::Mobile, 2, 0, 0}),
                 OutOfRangeError);
    EXPECT_THROW((void)oracle.predict_utilization(Tier::Edge, 4), OutOfRangeError);
}

TEST_F(VmCapacityOracleTest, MobileDisabledHasNoDeviceVms) {
    config_.mobile.enabled = false;
    VmCapacityOracle oracle(config_, 4);

    EXPECT_TRUE(oracle.candidates(Tier::Mobile, 0, std::nullopt).empty());
}

class VmSelectorTest : public ::testing::Test {
protected:
    VmSelectorTest()
        : oracle_(config_, 1) {
        // Residual capacities: 70, 40, 100
        (void)oracle_.bind(vms_[0], make_task(0, 0));
        (void)oracle_.bind(vms_[1], make_task(1, 0));
        (void)oracle_.bind(vms_[1], make_task(2, 0));
    }

    SimulationConfig config_ = placement_config();
    VmCapacityOracle oracle_;
    std::vector<ResourceRef> vms_{ResourceRef{Tier::Edge, 0, 0, 0},
                                  ResourceRef{Tier::Edge, 0, 1, 0},
                                  ResourceRef{Tier::Edge, 1, 0, 1}};
    std::mt19937 rng_{17};
};

TEST_F(VmSelectorTest, FirstFitTakesEarliestFit) {
    FirstFitSelector selector;

    EXPECT_EQ(selector.select(vms_, 30.0, oracle_, rng_), 0u);
    EXPECT_EQ(selector.select(vms_, 80.0, oracle_, rng_), 2u);
    EXPECT_FALSE(selector.select(vms_, 101.0, oracle_, rng_).has_value());
}

TEST_F(VmSelectorTest, BestFitTakesTightestFit) {
    BestFitSelector selector;

    EXPECT_EQ(selector.select(vms_, 30.0, oracle_, rng_), 1u);
    EXPECT_EQ(selector.select(vms_, 50.0, oracle_, rng_), 0u);
}

TEST_F(VmSelectorTest, WorstFitTakesLargestResidual) {
    WorstFitSelector selector;

    EXPECT_EQ(selector.select(vms_, 30.0, oracle_, rng_), 2u);
    EXPECT_FALSE(selector.select(vms_, 120.0, oracle_, rng_).has_value());
}

TEST_F(VmSelectorTest, NextFitResumesAfterLastChoice) {
    NextFitSelector selector;

    EXPECT_EQ(selector.select(vms_, 30.0, oracle_, rng_), 0u);
    EXPECT_EQ(selector.select(vms_, 30.0, oracle_, rng_), 1u);
    EXPECT_EQ(selector.select(vms_, 30.0, oracle_, rng_), 2u);
    EXPECT_EQ(selector.select(vms_, 30.0, oracle_, rng_), 0u);
    // Only the last VM fits; the scan wraps around to it
    EXPECT_EQ(selector.select(vms_, 90.0, oracle_, rng_), 2u);
}

TEST_F(VmSelectorTest, RandomFitDoesNotSearch) {
    RandomFitSelector selector;
    int accepted = 0;
    int rejected = 0;

    // Only the last of the three VMs has room for 80 %
    for (int i = 0; i < 300; ++i) {
        auto index = selector.select(vms_, 80.0, oracle_, rng_);
        if (index) {
            EXPECT_EQ(*index, 2u);
            ++accepted;
        } else {
            ++rejected;
        }
    }
    EXPECT_GT(accepted, 0);
    EXPECT_GT(rejected, 0);
}

TEST_F(VmSelectorTest, EmptyCandidateList) {
    std::vector<ResourceRef> none;
    for (auto name : {"RANDOM_FIT", "FIRST_FIT", "NEXT_FIT", "BEST_FIT", "WORST_FIT"}) {
        auto selector = make_vm_selector(name);
        ASSERT_TRUE(selector != nullptr) << name;
        EXPECT_EQ(selector->name(), name);
        EXPECT_FALSE(selector->select(none, 10.0, oracle_, rng_).has_value());
    }
    EXPECT_TRUE(make_vm_selector("BEST_EFFORT") == nullptr);
}

class BasicOrchestrationPolicyTest : public ::testing::Test {
protected:
    std::unique_ptr<BasicOrchestrationPolicy> make_policy(Scenario scenario,
                                                          const char* rule = "FIRST_FIT",
                                                          uint64_t seed = 1) {
        return std::make_unique<BasicOrchestrationPolicy>(scenario, config_.task_types,
                                                          make_vm_selector(rule), seed);
    }

    SystemSnapshot snapshot_at(AccessPointId ap, const VmCapacityOracle& oracle) const {
        return SystemSnapshot{TimePoint::epoch(), Location{0, ap, 100.0 * ap, 0.0}, oracle};
    }

    SimulationConfig config_ = placement_config();
};

TEST_F(BasicOrchestrationPolicyTest, SingleTierUsesServingHost) {
    VmCapacityOracle oracle(config_, 1);
    auto policy = make_policy(Scenario::SingleTier);

    auto decision = policy->select_target(make_task(0, 0), snapshot_at(1, oracle));

    ASSERT_FALSE(decision.rejected());
    EXPECT_EQ(decision.tier, Tier::Edge);
    EXPECT_EQ(*decision.resource, (ResourceRef{Tier::Edge, 1, 0, 1}));
}

TEST_F(BasicOrchestrationPolicyTest, EdgeOrchestratorSeesAllHosts) {
    VmCapacityOracle oracle(config_, 1);
    auto policy = make_policy(Scenario::TwoTierWithEo);

    auto decision = policy->select_target(make_task(0, 0), snapshot_at(1, oracle));

    ASSERT_FALSE(decision.rejected());
    EXPECT_EQ(*decision.resource, (ResourceRef{Tier::Edge, 0, 0, 0}));
}

TEST_F(BasicOrchestrationPolicyTest, FullServingHostRejects) {
    VmCapacityOracle oracle(config_, 1);
    ResourceRef only{Tier::Edge, 1, 0, 1};
    for (TaskId id = 0; id < 3; ++id) {
        ASSERT_TRUE(oracle.bind(only, make_task(id, 0)).has_value());
    }
    auto policy = make_policy(Scenario::SingleTier);

    auto decision = policy->select_target(make_task(9, 0), snapshot_at(1, oracle));

    EXPECT_TRUE(decision.rejected());
    EXPECT_EQ(decision.tier, Tier::Edge);
}

TEST_F(BasicOrchestrationPolicyTest, CloudSelectionUsesWorstFit) {
    config_.task_types[0].cloud_selection_percent = 100.0;
    VmCapacityOracle oracle(config_, 1);
    (void)oracle.bind(ResourceRef{Tier::Cloud, 0, 0, 0}, make_task(0, 0));
    auto policy = make_policy(Scenario::TwoTier, "FIRST_FIT");

    auto decision = policy->select_target(make_task(1, 0), snapshot_at(0, oracle));

    ASSERT_FALSE(decision.rejected());
    EXPECT_EQ(decision.tier, Tier::Cloud);
    EXPECT_EQ(*decision.resource, (ResourceRef{Tier::Cloud, 0, 1, 0}));
}

TEST_F(BasicOrchestrationPolicyTest, ZeroCloudShareStaysOnEdge) {
    VmCapacityOracle oracle(config_, 1);
    auto policy = make_policy(Scenario::TwoTier);

    for (TaskId id = 0; id < 50; ++id) {
        EXPECT_EQ(policy->select_target(make_task(id, 0), snapshot_at(0, oracle)).tier,
                  Tier::Edge);
    }
}

TEST_F(BasicOrchestrationPolicyTest, ThreeTierPrefersDeviceVm) {
    config_.task_types[0].mobile_utilization = 60.0;
    VmCapacityOracle oracle(config_, 3);
    auto policy = make_policy(Scenario::ThreeTier);

    auto local = policy->select_target(make_task(0, 2), snapshot_at(0, oracle));
    ASSERT_FALSE(local.rejected());
    EXPECT_EQ(local.tier, Tier::Mobile);
    EXPECT_EQ(local.resource->host, 2u);

    // Device VM busy: falls back to the edge
    ASSERT_TRUE(oracle.bind(*local.resource, make_task(0, 2)).has_value());
    auto offloaded = policy->select_target(make_task(1, 2), snapshot_at(0, oracle));
    ASSERT_FALSE(offloaded.rejected());
    EXPECT_EQ(offloaded.tier, Tier::Edge);
}

TEST_F(BasicOrchestrationPolicyTest, DecisionsDoNotTouchOracle) {
    config_.task_types[0].cloud_selection_percent = 50.0;
    VmCapacityOracle oracle(config_, 1);
    auto policy = make_policy(Scenario::TwoTier, "WORST_FIT");

    for (TaskId id = 0; id < 20; ++id) {
        (void)policy->select_target(make_task(id, 0), snapshot_at(0, oracle));
    }
    EXPECT_DOUBLE_EQ(oracle.average_utilization(Tier::Edge), 0.0);
    EXPECT_DOUBLE_EQ(oracle.average_utilization(Tier::Cloud), 0.0);
}

TEST_F(BasicOrchestrationPolicyTest, SameSeedSameDecisions) {
    config_.task_types[0].cloud_selection_percent = 50.0;
    VmCapacityOracle oracle(config_, 1);
    auto first = make_policy(Scenario::TwoTier, "RANDOM_FIT", 77);
    auto second = make_policy(Scenario::TwoTier, "RANDOM_FIT", 77);

    for (TaskId id = 0; id < 100; ++id) {
        auto a = first->select_target(make_task(id, 0), snapshot_at(0, oracle));
        auto b = second->select_target(make_task(id, 0), snapshot_at(0, oracle));
        EXPECT_EQ(a.tier, b.tier);
        EXPECT_EQ(a.resource, b.resource);
    }
}

TEST_F(BasicOrchestrationPolicyTest, RequiresSelector) {
    EXPECT_THROW(BasicOrchestrationPolicy(Scenario::TwoTier, config_.task_types, nullptr, 1),
                 OutOfRangeError);
}
