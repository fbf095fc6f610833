#include <offsim/algo/random_fit_selector.hpp>

namespace offsim::algo {

std::optional<std::size_t> RandomFitSelector::select(
    std::span<const core::ResourceRef> candidates, double required,
    const core::ComputeResourceOracle& resources, std::mt19937& rng) {
    if (candidates.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
    std::size_t index = pick(rng);
    if (!fits(resources, candidates[index], required)) {
        return std::nullopt;
    }
    return index;
}

} // namespace offsim::algo
