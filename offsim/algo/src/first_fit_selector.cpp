#include <offsim/algo/first_fit_selector.hpp>

namespace offsim::algo {

std::optional<std::size_t> FirstFitSelector::select(
    std::span<const core::ResourceRef> candidates, double required,
    const core::ComputeResourceOracle& resources, std::mt19937& /*rng*/) {
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (fits(resources, candidates[i], required)) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace offsim::algo
