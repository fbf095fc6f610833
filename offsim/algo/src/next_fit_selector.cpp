#include <offsim/algo/next_fit_selector.hpp>

namespace offsim::algo {

std::optional<std::size_t> NextFitSelector::select(
    std::span<const core::ResourceRef> candidates, double required,
    const core::ComputeResourceOracle& resources, std::mt19937& /*rng*/) {
    if (candidates.empty()) {
        return std::nullopt;
    }

    CursorKey key{candidates.front().tier, candidates.front().host, candidates.size()};
    auto it = cursors_.try_emplace(key, candidates.size() - 1).first;

    std::size_t index = it->second;
    for (std::size_t tries = 0; tries < candidates.size(); ++tries) {
        index = (index + 1) % candidates.size();
        if (fits(resources, candidates[index], required)) {
            it->second = index;
            return index;
        }
    }
    return std::nullopt;
}

} // namespace offsim::algo
