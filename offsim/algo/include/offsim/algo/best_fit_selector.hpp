#pragma once

#include <offsim/algo/vm_selector.hpp>

namespace offsim::algo {

/// @brief Best-Fit: among fitting candidates, the one with the smallest
///        residual capacity.
///
/// Packs tasks tightly so that other VMs stay free for large tasks. Ties are
/// broken by enumeration order (earlier candidate wins).
///
/// @ingroup algo_selectors
/// @see WorstFitSelector
class BestFitSelector : public VmSelector {
public:
    [[nodiscard]] std::optional<std::size_t> select(std::span<const core::ResourceRef> candidates,
                                                    double required,
                                                    const core::ComputeResourceOracle& resources,
                                                    std::mt19937& rng) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "BEST_FIT"; }
};

} // namespace offsim::algo
