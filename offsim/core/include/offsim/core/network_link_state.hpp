#pragma once

#include <offsim/core/location.hpp>
#include <offsim/core/task.hpp>
#include <offsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace offsim::core {

/// @brief Link classes a transfer can cross.
/// @ingroup core_network
enum class Link {
    Wlan, ///< Wireless access link of one access point.
    Wan,  ///< Uplink from one access point to the cloud.
    Lan,  ///< Internal network between edge sites.
};

/// @brief Counters of active transfers per link.
///
/// WLAN and WAN counters are kept per access point, the internal LAN has a
/// single counter. Counters only change through the transfer hooks of a
/// NetworkModel, which the event loop serialises.
///
/// @ingroup core_network
class NetworkLinkState {
public:
    explicit NetworkLinkState(std::size_t access_point_count);

    /// @brief Mark every link used by a device-to-@p resource transfer as busy.
    void begin_transfer(const Location& device_location, const ResourceRef& resource);

    /// @brief Release the links taken by begin_transfer().
    /// @throws InvariantViolation if a counter would become negative.
    void end_transfer(const Location& device_location, const ResourceRef& resource);

    /// @brief Active transfers on @p link at @p access_point (ignored for Lan).
    [[nodiscard]] uint32_t active(Link link, AccessPointId access_point) const;

private:
    uint32_t& counter(Link link, AccessPointId access_point);

    std::vector<uint32_t> wlan_;
    std::vector<uint32_t> wan_;
    uint32_t lan_{0};
};

} // namespace offsim::core
