#pragma once

#include <offsim/algo/vm_selector.hpp>

namespace offsim::algo {

/// @brief Worst-Fit: among fitting candidates, the one with the largest
///        residual capacity.
///
/// Spreads load across VMs. Ties are broken by enumeration order (earlier
/// candidate wins). Cloud placement always uses this rule.
///
/// @ingroup algo_selectors
/// @see BestFitSelector
class WorstFitSelector : public VmSelector {
public:
    [[nodiscard]] std::optional<std::size_t> select(std::span<const core::ResourceRef> candidates,
                                                    double required,
                                                    const core::ComputeResourceOracle& resources,
                                                    std::mt19937& rng) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "WORST_FIT"; }
};

} // namespace offsim::algo
