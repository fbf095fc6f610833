#include <offsim/sim/factories.hpp>

#include <offsim/algo/access_point_load_network_model.hpp>
#include <offsim/algo/averaged_network_model.hpp>
#include <offsim/algo/basic_orchestration_policy.hpp>
#include <offsim/algo/contention_network_model.hpp>
#include <offsim/algo/mobility_generators.hpp>
#include <offsim/algo/vm_selector.hpp>
#include <offsim/io/error.hpp>

#include <string>
#include <utility>

namespace offsim::sim {

core::MobilityModel make_mobility(const core::SimulationConfig& config, std::size_t device_count,
                                  core::TimePoint horizon, std::mt19937& rng) {
    switch (config.mobility.kind) {
    case core::MobilityKind::Nomadic:
        return algo::generate_nomadic_mobility(config, device_count, horizon, rng);
    case core::MobilityKind::Waypoint:
        return algo::generate_waypoint_mobility(config, device_count, horizon, rng);
    }
    throw io::ConfigError("unknown mobility model", "mobility.model");
}

std::unique_ptr<core::NetworkModel> make_network_model(const core::SimulationConfig& config,
                                                       std::size_t device_count,
                                                       const core::MobilityModel& mobility) {
    switch (config.network.model) {
    case core::NetworkModelKind::Averaged:
        return std::make_unique<algo::AveragedNetworkModel>(config, device_count);
    case core::NetworkModelKind::AccessPointLoad:
        return std::make_unique<algo::AccessPointLoadNetworkModel>(config, mobility);
    case core::NetworkModelKind::Contention:
        return std::make_unique<algo::ContentionNetworkModel>(config);
    }
    throw io::ConfigError("unknown network model", "network.model");
}

std::unique_ptr<core::OrchestrationPolicy> make_policy(const core::SimulationConfig& config,
                                                       core::Scenario scenario,
                                                       std::string_view policy, uint64_t seed) {
    auto selector = algo::make_vm_selector(policy);
    if (!selector) {
        throw io::ConfigError("unknown orchestration policy '" + std::string(policy) + "'",
                              "simulation.policies");
    }
    return std::make_unique<algo::BasicOrchestrationPolicy>(scenario, config.task_types,
                                                            std::move(selector), seed);
}

} // namespace offsim::sim
