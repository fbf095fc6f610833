#pragma once

#include <offsim/algo/vm_selector.hpp>

#include <cstdint>
#include <map>
#include <tuple>

namespace offsim::algo {

/// @brief Next-Fit: round-robin scan resuming after the last accepted
///        candidate.
///
/// The cursor persists across calls. A separate cursor is kept per candidate
/// list, identified by its tier, its first host and its length, so the
/// per-access-point edge lists of different hosts do not disturb each other.
///
/// @ingroup algo_selectors
class NextFitSelector : public VmSelector {
public:
    [[nodiscard]] std::optional<std::size_t> select(std::span<const core::ResourceRef> candidates,
                                                    double required,
                                                    const core::ComputeResourceOracle& resources,
                                                    std::mt19937& rng) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "NEXT_FIT"; }

private:
    using CursorKey = std::tuple<core::Tier, uint32_t, std::size_t>;

    // Index of the last accepted candidate per list
    std::map<CursorKey, std::size_t> cursors_;
};

} // namespace offsim::algo
