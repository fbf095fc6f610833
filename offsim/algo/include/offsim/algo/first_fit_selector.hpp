#pragma once

#include <offsim/algo/vm_selector.hpp>

namespace offsim::algo {

/// @brief First-Fit: the first candidate, in enumeration order, that fits.
/// @ingroup algo_selectors
class FirstFitSelector : public VmSelector {
public:
    [[nodiscard]] std::optional<std::size_t> select(std::span<const core::ResourceRef> candidates,
                                                    double required,
                                                    const core::ComputeResourceOracle& resources,
                                                    std::mt19937& rng) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "FIRST_FIT"; }
};

} // namespace offsim::algo
