#pragma once

#include <offsim/algo/queueing.hpp>

#include <offsim/core/config.hpp>
#include <offsim/core/mobility.hpp>
#include <offsim/core/network_model.hpp>

namespace offsim::algo {

/// @brief Network model whose load follows the devices around.
///
/// The WLAN leg of a transfer competes with every device served by the same
/// access point at the time of the request, as reported by the mobility
/// model. The WAN leg competes with the cloud-bound share of them. Any leg
/// slower than the configured maximum queueing delay counts as saturated.
///
/// @ingroup algo_network
/// @see MobilityModel, LinkDelayCalculator
class AccessPointLoadNetworkModel : public core::NetworkModel {
public:
    /// @param config Simulation configuration (links and task mix).
    /// @param mobility Mobility of the run; must outlive the model.
    AccessPointLoadNetworkModel(const core::SimulationConfig& config,
                                const core::MobilityModel& mobility);

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

private:
    [[nodiscard]] double delay(Direction direction, const core::Location& device_location,
                               const core::ResourceRef& resource, core::TimePoint now) const;

    LinkDelayCalculator calculator_;
    const core::MobilityModel& mobility_;
};

} // namespace offsim::algo
