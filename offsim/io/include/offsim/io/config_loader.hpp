#pragma once

/// @file config_loader.hpp
/// @brief Loading the simulation configuration from JSON.
/// @ingroup io_loaders

#include <offsim/core/config.hpp>

#include <filesystem>
#include <string_view>

namespace offsim::io {

/// @brief Load a simulation configuration from a JSON file.
///
/// The document holds the sections `simulation`, `network`, `mobility`,
/// `task_types`, `edge_datacenters`, `cloud` and (optionally) `mobile`.
/// Missing optional fields keep the defaults of core::SimulationConfig.
///
/// @param path  Filesystem path to the JSON configuration.
/// @return The validated configuration.
///
/// @throws ConfigError  If the file cannot be read, the JSON is malformed, or
///                      a value fails validation. The message names the
///                      offending field path (e.g. `task_types[2]`).
///
/// @see load_config_from_string, validate_config
[[nodiscard]] core::SimulationConfig load_config(const std::filesystem::path& path);

/// @brief Load a simulation configuration from a JSON string.
/// @throws ConfigError  See load_config.
[[nodiscard]] core::SimulationConfig load_config_from_string(std::string_view json);

/// @brief Check cross-field constraints of a configuration.
///
/// Called by the loaders; exposed for configurations built in code.
///
/// - at least one edge datacenter, access point ids equal to their
///   datacenter index;
/// - task-type usage percentages summing to at most 100, positive
///   inter-arrival and active periods for used types;
/// - positive link bandwidths and simulation duration, warm-up shorter than
///   the duration;
/// - a mean dwell time for every place class when mobility is nomadic;
/// - known scenario names.
///
/// @throws ConfigError  On the first violated constraint.
void validate_config(const core::SimulationConfig& config);

} // namespace offsim::io
