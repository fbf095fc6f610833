#pragma once

#include <offsim/core/config.hpp>
#include <offsim/core/mobility.hpp>
#include <offsim/core/network_model.hpp>
#include <offsim/core/orchestration.hpp>
#include <offsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string_view>

namespace offsim::sim {

/// @brief Build the mobility timelines selected by `config.mobility.kind`.
///
/// The returned model is finalized against @p horizon.
///
/// @ingroup sim_factories
[[nodiscard]] core::MobilityModel make_mobility(const core::SimulationConfig& config,
                                                std::size_t device_count,
                                                core::TimePoint horizon, std::mt19937& rng);

/// @brief Build the network delay model selected by `config.network.model`.
///
/// @p mobility must outlive the returned model (the access point load model
/// keeps a reference to it).
///
/// @ingroup sim_factories
[[nodiscard]] std::unique_ptr<core::NetworkModel> make_network_model(
    const core::SimulationConfig& config, std::size_t device_count,
    const core::MobilityModel& mobility);

/// @brief Build the orchestration policy for one run.
/// @param policy Edge VM selection rule name (e.g. `"WORST_FIT"`).
/// @throws io::ConfigError if @p policy names no known rule.
/// @ingroup sim_factories
[[nodiscard]] std::unique_ptr<core::OrchestrationPolicy> make_policy(
    const core::SimulationConfig& config, core::Scenario scenario, std::string_view policy,
    uint64_t seed);

} // namespace offsim::sim
