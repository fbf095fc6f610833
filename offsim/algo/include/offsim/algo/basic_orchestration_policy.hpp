#pragma once

#include <offsim/algo/vm_selector.hpp>

#include <offsim/core/config.hpp>
#include <offsim/core/orchestration.hpp>

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

namespace offsim::algo {

/// @brief Scenario-driven placement policy.
///
/// The tier is chosen first:
/// - SingleTier: always edge.
/// - TwoTier, TwoTierWithEo: cloud with the task type's cloud selection
///   probability, edge otherwise.
/// - ThreeTier: the device's own VM when the task type has a positive mobile
///   utilization and the VM has room; otherwise as TwoTier.
///
/// Edge candidates are the VMs behind the device's serving access point, or
/// every edge VM when the edge orchestrator balances load (TwoTierWithEo).
/// The configured VmSelector picks among edge candidates; cloud candidates
/// always go through worst-fit.
///
/// The policy owns its random stream and selector state and never writes to
/// the oracle.
///
/// @ingroup algo_orchestration
class BasicOrchestrationPolicy : public core::OrchestrationPolicy {
public:
    /// @param scenario Architecture being simulated.
    /// @param task_types Task-type table; must outlive the policy.
    /// @param edge_selector Placement rule for edge VMs (must not be null).
    /// @param seed Seed of the policy's random stream.
    /// @throws core::OutOfRangeError if @p edge_selector is null.
    BasicOrchestrationPolicy(core::Scenario scenario,
                             const std::vector<core::TaskType>& task_types,
                             std::unique_ptr<VmSelector> edge_selector, uint64_t seed);

    [[nodiscard]] core::OrchestrationDecision select_target(
        const core::Task& task, const core::SystemSnapshot& snapshot) override;

    [[nodiscard]] core::Scenario scenario() const noexcept { return scenario_; }
    [[nodiscard]] const VmSelector& edge_selector() const noexcept { return *edge_selector_; }

private:
    [[nodiscard]] bool draw_cloud(const core::TaskType& type);
    [[nodiscard]] core::OrchestrationDecision place_on(core::Tier tier, VmSelector& selector,
                                                       const core::Task& task,
                                                       const core::SystemSnapshot& snapshot);

    core::Scenario scenario_;
    const std::vector<core::TaskType>& task_types_;
    std::unique_ptr<VmSelector> edge_selector_;
    std::unique_ptr<VmSelector> cloud_selector_;
    std::mt19937 rng_;
};

} // namespace offsim::algo
