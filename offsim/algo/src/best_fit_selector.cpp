#include <offsim/algo/best_fit_selector.hpp>

#include <limits>

namespace offsim::algo {

std::optional<std::size_t> BestFitSelector::select(
    std::span<const core::ResourceRef> candidates, double required,
    const core::ComputeResourceOracle& resources, std::mt19937& /*rng*/) {
    std::optional<std::size_t> best;
    double best_remaining = std::numeric_limits<double>::infinity();

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (fits(resources, candidates[i], required)) {
            double remaining = resources.residual_capacity(candidates[i]);
            if (remaining < best_remaining) {
                best_remaining = remaining;
                best = i;
            }
        }
    }
    return best;
}

} // namespace offsim::algo
