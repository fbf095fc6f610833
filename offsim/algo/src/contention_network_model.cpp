#include <offsim/algo/contention_network_model.hpp>

namespace offsim::algo {

ContentionNetworkModel::ContentionNetworkModel(const core::SimulationConfig& config)
    : calculator_(config.network, TaskMix::from(config.task_types))
    , links_(config.edge_datacenters.size()) {}

double ContentionNetworkModel::delay(Direction direction, const core::Location& device_location,
                                     const core::ResourceRef& resource) const {
    auto ap = device_location.access_point;
    double wlan = links_.active(core::Link::Wlan, ap) + 1.0;
    double wan = links_.active(core::Link::Wan, ap) + 1.0;
    return calculator_.route_delay(direction, device_location, resource, wlan, wan);
}

double ContentionNetworkModel::upload_delay(const core::Task& /*task*/,
                                            const core::Location& device_location,
                                            const core::ResourceRef& target,
                                            core::TimePoint /*now*/) const {
    return delay(Direction::Upload, device_location, target);
}

double ContentionNetworkModel::download_delay(const core::Task& /*task*/,
                                              const core::Location& device_location,
                                              const core::ResourceRef& source,
                                              core::TimePoint /*now*/) const {
    return delay(Direction::Download, device_location, source);
}

void ContentionNetworkModel::upload_started(const core::Location& device_location,
                                            const core::ResourceRef& target) {
    links_.begin_transfer(device_location, target);
}

void ContentionNetworkModel::upload_finished(const core::Location& device_location,
                                             const core::ResourceRef& target) {
    links_.end_transfer(device_location, target);
}

void ContentionNetworkModel::download_started(const core::Location& device_location,
                                              const core::ResourceRef& source) {
    links_.begin_transfer(device_location, source);
}

void ContentionNetworkModel::download_finished(const core::Location& device_location,
                                               const core::ResourceRef& source) {
    links_.end_transfer(device_location, source);
}

} // namespace offsim::algo
