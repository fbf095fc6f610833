#pragma once

#include <offsim/core/config.hpp>
#include <offsim/core/task.hpp>
#include <offsim/core/types.hpp>

#include <cstddef>
#include <optional>
#include <random>
#include <span>
#include <vector>

namespace offsim::algo {

/// @brief A task creation drawn before the run starts.
/// @ingroup algo_load
struct TaskArrival {
    core::TimePoint time;
    core::TaskProperties properties;
};

/// @brief Pick an application type by its usage percentage.
///
/// Draws uniformly in `[0, 100)` and walks the cumulative usage of
/// @p types. Returns `std::nullopt` when the draw falls past the total
/// usage (the device runs no application).
///
/// @ingroup algo_load
[[nodiscard]] std::optional<core::AppTypeId> pick_app_type(std::span<const core::TaskType> types,
                                                           std::mt19937& rng);

/// @brief Idle/active Poisson workload for @p device_count devices.
///
/// Every device runs one application type chosen with pick_app_type(). Its
/// first active period starts uniformly within one active period after
/// `simulation.task_start_offset`. Within an active period tasks arrive with
/// exponential inter-arrival times; when an arrival would fall past the end
/// of the period the device stays idle for `idle_period` and a new active
/// period begins. Input size, output size and length of each task are
/// exponential around the type's means.
///
/// @return Arrivals before `simulation.duration`, sorted by time (devices in
///         id order on ties).
/// @throws OutOfRangeError if a used type has a non-positive active period
///         or mean inter-arrival time.
/// @ingroup algo_load
[[nodiscard]] std::vector<TaskArrival> generate_idle_active_load(
    const core::SimulationConfig& config, std::size_t device_count, std::mt19937& rng);

} // namespace offsim::algo
