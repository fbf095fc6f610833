#include <offsim/algo/access_point_load_network_model.hpp>

namespace offsim::algo {

AccessPointLoadNetworkModel::AccessPointLoadNetworkModel(const core::SimulationConfig& config,
                                                         const core::MobilityModel& mobility)
    : calculator_(config.network, TaskMix::from(config.task_types))
    , mobility_(mobility) {}

double AccessPointLoadNetworkModel::delay(Direction direction,
                                          const core::Location& device_location,
                                          const core::ResourceRef& resource,
                                          core::TimePoint now) const {
    auto devices = static_cast<double>(mobility_.devices_at(device_location.access_point, now));
    return calculator_.route_delay(direction, device_location, resource, devices,
                                   devices * calculator_.mix().cloud_share);
}

double AccessPointLoadNetworkModel::upload_delay(const core::Task& /*task*/,
                                                 const core::Location& device_location,
                                                 const core::ResourceRef& target,
                                                 core::TimePoint now) const {
    return delay(Direction::Upload, device_location, target, now);
}

double AccessPointLoadNetworkModel::download_delay(const core::Task& /*task*/,
                                                   const core::Location& device_location,
                                                   const core::ResourceRef& source,
                                                   core::TimePoint now) const {
    return delay(Direction::Download, device_location, source, now);
}

} // namespace offsim::algo
