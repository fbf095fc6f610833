#pragma once

#include <offsim/algo/queueing.hpp>

#include <offsim/core/config.hpp>
#include <offsim/core/network_model.hpp>

#include <cstddef>

namespace offsim::algo {

/// @brief Network model with a fixed, averaged load per access point.
///
/// Every access point is assumed to serve `device_count / access_points`
/// devices for the whole run, so delays only depend on the configuration.
/// Cloud transfers see the cloud-bound share of those devices on the WAN.
/// The transfer hooks are no-ops.
///
/// @ingroup algo_network
/// @see LinkDelayCalculator
class AveragedNetworkModel : public core::NetworkModel {
public:
    /// @param config Simulation configuration (links and task mix).
    /// @param device_count Number of devices in the run.
    AveragedNetworkModel(const core::SimulationConfig& config, std::size_t device_count);

    [[nodiscard]] double upload_delay(const core::Task& task, const core::Location& device_location,
                                      const core::ResourceRef& target,
                                      core::TimePoint now) const override;
    [[nodiscard]] double download_delay(const core::Task& task,
                                        const core::Location& device_location,
                                        const core::ResourceRef& source,
                                        core::TimePoint now) const override;

    void upload_started(const core::Location&, const core::ResourceRef&) override {}
    void upload_finished(const core::Location&, const core::ResourceRef&) override {}
    void download_started(const core::Location&, const core::ResourceRef&) override {}
    void download_finished(const core::Location&, const core::ResourceRef&) override {}

    /// @brief Devices assumed to compete on one WLAN.
    [[nodiscard]] double devices_per_access_point() const noexcept { return devices_per_ap_; }

private:
    LinkDelayCalculator calculator_;
    double devices_per_ap_;
};

} // namespace offsim::algo
