#pragma once

#include <offsim/algo/queueing.hpp>

#include <offsim/core/config.hpp>
#include <offsim/core/network_link_state.hpp>
#include <offsim/core/network_model.hpp>

namespace offsim::algo {

/// @brief Network model driven by the live occupancy of each link.
///
/// The transfer hooks keep a NetworkLinkState up to date; a new transfer
/// competes with the transfers currently active on its WLAN (and WAN for
/// the cloud) plus itself.
///
/// @ingroup algo_network
/// @see NetworkLinkState, LinkDelayCalculator
class ContentionNetworkModel : public core::NetworkModel {
public:
    explicit ContentionNetworkModel(const core::SimulationConfig& config);

    [[nodiscard]] double upload_delay(const core::Task& task, const core::Location& device_location,
                                      const core::ResourceRef& target,
                                      core::TimePoint now) const override;
    [[nodiscard]] double download_delay(const core::Task& task,
                                        const core::Location& device_location,
                                        const core::ResourceRef& source,
                                        core::TimePoint now) const override;

    void upload_started(const core::Location& device_location,
                        const core::ResourceRef& target) override;
    void upload_finished(const core::Location& device_location,
                         const core::ResourceRef& target) override;
    void download_started(const core::Location& device_location,
                          const core::ResourceRef& source) override;
    void download_finished(const core::Location& device_location,
                           const core::ResourceRef& source) override;

    [[nodiscard]] const core::NetworkLinkState& links() const noexcept { return links_; }

private:
    [[nodiscard]] double delay(Direction direction, const core::Location& device_location,
                               const core::ResourceRef& resource) const;

    LinkDelayCalculator calculator_;
    core::NetworkLinkState links_;
};

} // namespace offsim::algo
