#pragma once

#include <offsim/core/config.hpp>
#include <offsim/core/location.hpp>
#include <offsim/core/task.hpp>

#include <span>

namespace offsim::algo {

/// @brief Sentinel returned by the queueing functions for an unstable link.
/// @ingroup algo_network
inline constexpr double kSaturated = -1.0;

/// @brief Mean response time of an M/M/1 queue plus propagation delay.
///
/// `1 / (mu - lambda) + propagation`.
///
/// @param service_rate Service rate mu (transfers per second).
/// @param arrival_rate Arrival rate lambda (transfers per second).
/// @param propagation Fixed propagation delay in seconds.
/// @return Delay in seconds, or kSaturated when `mu <= lambda`.
/// @ingroup algo_network
[[nodiscard]] double mm1_delay(double service_rate, double arrival_rate,
                               double propagation) noexcept;

/// @brief Mean response time of an M/M/2 queue plus propagation delay.
///
/// `4 mu / ((2 mu - lambda)(2 mu + lambda)) + propagation`.
///
/// @return Delay in seconds, or kSaturated when `2 mu <= lambda`.
/// @ingroup algo_network
[[nodiscard]] double mm2_delay(double service_rate, double arrival_rate,
                               double propagation) noexcept;

/// @brief Transfers per second a link of @p bandwidth_kbps serves for
///        messages of @p size_kb.
///
/// Bandwidth is converted from Kbps to bytes per second, size from KB to bytes.
///
/// @ingroup algo_network
[[nodiscard]] double service_rate(double bandwidth_kbps, double size_kb) noexcept;

/// @brief Aggregate request rate of @p devices devices each generating one
///        transfer every @p mean_interarrival seconds.
/// @ingroup algo_network
[[nodiscard]] double arrival_rate(double devices, double mean_interarrival) noexcept;

/// @brief Usage-weighted averages over the task-type table.
///
/// Task types with a zero usage percentage do not take part.
///
/// @ingroup algo_network
struct TaskMix {
    double mean_input_kb{0.0};
    double mean_output_kb{0.0};
    double mean_interarrival{0.0};
    double cloud_share{0.0}; ///< Expected fraction (0..1) of tasks sent to the cloud.

    [[nodiscard]] static TaskMix from(std::span<const core::TaskType> types) noexcept;
};

/// @brief Direction of a transfer.
/// @ingroup algo_network
enum class Direction {
    Upload,
    Download,
};

/// @brief Route delay calculator shared by the network models.
///
/// Combines the WLAN leg (M/M/1 or M/M/2 per configuration), the WAN leg for
/// cloud transfers (M/M/1) and the internal LAN penalty for edge hosts
/// attached to another access point. The models differ only in how they
/// count the devices competing for each leg.
///
/// @ingroup algo_network
class LinkDelayCalculator {
public:
    LinkDelayCalculator(const core::NetworkSettings& settings, const TaskMix& mix) noexcept
        : settings_(settings)
        , mix_(mix) {}

    /// @brief WLAN delay for messages of @p size_kb with @p devices competing.
    ///
    /// A zero-size message costs only the propagation delay.
    [[nodiscard]] double wlan_delay(double size_kb, double devices) const noexcept;

    /// @brief WAN delay for messages of @p size_kb with @p devices competing.
    [[nodiscard]] double wan_delay(double size_kb, double devices) const noexcept;

    /// @brief End-to-end delay between a device and @p resource.
    /// @param direction Upload (task input) or download (task output).
    /// @param device Device location; its access point is the WLAN entry point.
    /// @param resource Target (upload) or source (download) of the transfer.
    /// @param wlan_devices Devices competing on the WLAN leg.
    /// @param wan_devices Devices competing on the WAN leg (cloud only).
    /// @return Delay in seconds, or kSaturated if any leg is saturated.
    [[nodiscard]] double route_delay(Direction direction, const core::Location& device,
                                     const core::ResourceRef& resource, double wlan_devices,
                                     double wan_devices) const noexcept;

    [[nodiscard]] const TaskMix& mix() const noexcept { return mix_; }

private:
    [[nodiscard]] double capped(double delay) const noexcept;

    core::NetworkSettings settings_;
    TaskMix mix_;
};

} // namespace offsim::algo
