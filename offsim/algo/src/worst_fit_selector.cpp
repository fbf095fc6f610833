#include <offsim/algo/worst_fit_selector.hpp>

namespace offsim::algo {

std::optional<std::size_t> WorstFitSelector::select(
    std::span<const core::ResourceRef> candidates, double required,
    const core::ComputeResourceOracle& resources, std::mt19937& /*rng*/) {
    std::optional<std::size_t> best;
    double best_remaining = -1.0;

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (fits(resources, candidates[i], required)) {
            double remaining = resources.residual_capacity(candidates[i]);
            if (remaining > best_remaining) {
                best_remaining = remaining;
                best = i;
            }
        }
    }
    return best;
}

} // namespace offsim::algo
