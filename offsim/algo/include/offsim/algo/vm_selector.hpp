#pragma once

#include <offsim/core/compute_oracle.hpp>
#include <offsim/core/task.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <string_view>

namespace offsim::algo {

/// @brief Placement rule choosing one VM among a candidate list.
///
/// Selectors only read the oracle. A candidate fits when the utilization the
/// task would add does not exceed the candidate's residual capacity.
///
/// Concrete rules (RandomFitSelector, FirstFitSelector, NextFitSelector,
/// BestFitSelector, WorstFitSelector) differ in which fitting candidate wins.
///
/// @ingroup algo_selectors
/// @see BasicOrchestrationPolicy
class VmSelector {
public:
    virtual ~VmSelector() = default;

    /// @brief Pick a candidate.
    /// @param candidates Resources in enumeration order (ties go to the earliest).
    /// @param required Utilization (percent) the task adds on these VMs.
    /// @param resources Read-only capacity view.
    /// @param rng Random stream of the owning policy.
    /// @return Index into @p candidates, or `std::nullopt` if none is accepted.
    [[nodiscard]] virtual std::optional<std::size_t> select(
        std::span<const core::ResourceRef> candidates, double required,
        const core::ComputeResourceOracle& resources, std::mt19937& rng) = 0;

    /// @brief Configuration name of the rule (e.g. `"BEST_FIT"`).
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

protected:
    VmSelector() = default;
    VmSelector(const VmSelector&) = default;
    VmSelector& operator=(const VmSelector&) = default;
};

/// @brief Whether @p resource has room for @p required percent.
[[nodiscard]] bool fits(const core::ComputeResourceOracle& resources,
                        const core::ResourceRef& resource, double required);

/// @brief Build the selector named @p name (`RANDOM_FIT`, `FIRST_FIT`,
///        `NEXT_FIT`, `BEST_FIT`, `WORST_FIT`).
/// @return The selector, or `nullptr` if @p name is unknown.
[[nodiscard]] std::unique_ptr<VmSelector> make_vm_selector(std::string_view name);

} // namespace offsim::algo
