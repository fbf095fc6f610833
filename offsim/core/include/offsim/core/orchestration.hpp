#pragma once

#include <offsim/core/location.hpp>
#include <offsim/core/task.hpp>
#include <offsim/core/types.hpp>

#include <optional>
#include <string_view>

namespace offsim::core {

class ComputeResourceOracle;

/// @brief Architecture a run simulates.
/// @ingroup core_orchestration
enum class Scenario {
    SingleTier,    ///< Edge only, serving access point's host.
    TwoTier,       ///< Edge or cloud.
    TwoTierWithEo, ///< Edge or cloud; an edge orchestrator balances across all edge hosts.
    ThreeTier,     ///< Mobile device, edge or cloud.
};

/// @brief Configuration name of a scenario (e.g. `"TWO_TIER_WITH_EO"`).
[[nodiscard]] std::string_view to_string(Scenario scenario) noexcept;

/// @brief Parse a configuration name; `std::nullopt` if unknown.
[[nodiscard]] std::optional<Scenario> parse_scenario(std::string_view name) noexcept;

/// @brief Read-only view of the system handed to a policy.
/// @ingroup core_orchestration
struct SystemSnapshot {
    TimePoint now;
    Location device_location;
    const ComputeResourceOracle& resources;
};

/// @brief Target chosen for a task, or a rejection.
/// @ingroup core_orchestration
struct OrchestrationDecision {
    Tier tier{Tier::Edge};
    std::optional<ResourceRef> resource; ///< Empty when the task is rejected.

    [[nodiscard]] bool rejected() const noexcept { return !resource.has_value(); }

    static OrchestrationDecision reject(Tier tier) { return {tier, std::nullopt}; }
    static OrchestrationDecision place(const ResourceRef& ref) { return {ref.tier, ref}; }
};

/// @brief Pluggable offloading decision.
///
/// Implementations must not modify the oracle or any other shared state;
/// the only state they may change is their own (random stream, cursors).
///
/// @ingroup core_orchestration
class OrchestrationPolicy {
public:
    virtual ~OrchestrationPolicy() = default;

    /// @brief Choose tier and resource for @p task.
    [[nodiscard]] virtual OrchestrationDecision select_target(const Task& task,
                                                              const SystemSnapshot& snapshot) = 0;

protected:
    OrchestrationPolicy() = default;
    OrchestrationPolicy(const OrchestrationPolicy&) = default;
    OrchestrationPolicy& operator=(const OrchestrationPolicy&) = default;
};

} // namespace offsim::core
