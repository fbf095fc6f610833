#pragma once

#include <offsim/core/config.hpp>
#include <offsim/core/mobility.hpp>
#include <offsim/core/types.hpp>

#include <cstddef>
#include <random>

namespace offsim::algo {

/// @brief Build nomadic (discrete jump) timelines for @p device_count devices.
///
/// Each device starts at a uniformly random access point at time 0 and
/// stays there for an exponentially distributed time whose mean is the
/// dwell time of the access point's attractiveness class. It then jumps to a
/// uniformly random other access point (the same one when there is only
/// one), until its timeline reaches @p horizon.
///
/// @param config Access point layout and `mobility.mean_dwell_time`.
/// @param device_count Number of devices.
/// @param horizon End of the run; every timeline is extended past it.
/// @param rng Random stream of the run.
/// @return Finalized mobility model.
/// @throws OutOfRangeError if an access point has a class without a
///         positive mean dwell time.
/// @ingroup algo_mobility
[[nodiscard]] core::MobilityModel generate_nomadic_mobility(const core::SimulationConfig& config,
                                                            std::size_t device_count,
                                                            core::TimePoint horizon,
                                                            std::mt19937& rng);

/// @brief Build continuous random-waypoint timelines for @p device_count devices.
///
/// Each device starts at a uniformly random position in the configured area,
/// then repeatedly travels in a straight line to a uniformly random
/// destination at a speed drawn from `[min_speed, max_speed]` and pauses
/// there for a time drawn from `[min_pause, max_pause]`. Positions between
/// keyframes are interpolated and bound to the nearest access point.
///
/// @return Finalized mobility model.
/// @throws OutOfRangeError if the area or the speed range is empty.
/// @ingroup algo_mobility
[[nodiscard]] core::MobilityModel generate_waypoint_mobility(const core::SimulationConfig& config,
                                                             std::size_t device_count,
                                                             core::TimePoint horizon,
                                                             std::mt19937& rng);

} // namespace offsim::algo
