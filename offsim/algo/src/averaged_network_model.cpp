#include <offsim/algo/averaged_network_model.hpp>

namespace offsim::algo {

AveragedNetworkModel::AveragedNetworkModel(const core::SimulationConfig& config,
                                           std::size_t device_count)
    : calculator_(config.network, TaskMix::from(config.task_types))
    , devices_per_ap_(0.0) {
    std::size_t aps = config.edge_datacenters.size();
    if (aps > 0) {
        devices_per_ap_ = static_cast<double>(device_count) / static_cast<double>(aps);
    }
}

double AveragedNetworkModel::upload_delay(const core::Task& /*task*/,
                                          const core::Location& device_location,
                                          const core::ResourceRef& target,
                                          core::TimePoint /*now*/) const {
    return calculator_.route_delay(Direction::Upload, device_location, target, devices_per_ap_,
                                   devices_per_ap_ * calculator_.mix().cloud_share);
}

double AveragedNetworkModel::download_delay(const core::Task& /*task*/,
                                            const core::Location& device_location,
                                            const core::ResourceRef& source,
                                            core::TimePoint /*now*/) const {
    return calculator_.route_delay(Direction::Download, device_location, source, devices_per_ap_,
                                   devices_per_ap_ * calculator_.mix().cloud_share);
}

} // namespace offsim::algo
