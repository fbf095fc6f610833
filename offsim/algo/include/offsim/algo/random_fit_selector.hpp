#pragma once

#include <offsim/algo/vm_selector.hpp>

namespace offsim::algo {

/// @brief Random-Fit: draw one candidate uniformly and accept it only if it
///        fits.
///
/// No search is performed after a miss, so the task is rejected even when
/// another candidate would have had room.
///
/// @ingroup algo_selectors
class RandomFitSelector : public VmSelector {
public:
    [[nodiscard]] std::optional<std::size_t> select(std::span<const core::ResourceRef> candidates,
                                                    double required,
                                                    const core::ComputeResourceOracle& resources,
                                                    std::mt19937& rng) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "RANDOM_FIT"; }
};

} // namespace offsim::algo
