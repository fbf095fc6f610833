#include <offsim/core/network_link_state.hpp>
#include <offsim/core/error.hpp>

#include <string>

namespace offsim::core {

NetworkLinkState::NetworkLinkState(std::size_t access_point_count)
    : wlan_(access_point_count, 0)
    , wan_(access_point_count, 0) {}

uint32_t& NetworkLinkState::counter(Link link, AccessPointId access_point) {
    if (link == Link::Lan) {
        return lan_;
    }
    auto& counters = (link == Link::Wlan) ? wlan_ : wan_;
    if (access_point >= counters.size()) {
        throw OutOfRangeError("No link counters for access point " +
                              std::to_string(access_point));
    }
    return counters[access_point];
}

uint32_t NetworkLinkState::active(Link link, AccessPointId access_point) const {
    if (link == Link::Lan) {
        return lan_;
    }
    const auto& counters = (link == Link::Wlan) ? wlan_ : wan_;
    if (access_point >= counters.size()) {
        throw OutOfRangeError("No link counters for access point " +
                              std::to_string(access_point));
    }
    return counters[access_point];
}

void NetworkLinkState::begin_transfer(const Location& device_location,
                                      const ResourceRef& resource) {
    ++counter(Link::Wlan, device_location.access_point);
    if (resource.tier == Tier::Cloud) {
        ++counter(Link::Wan, device_location.access_point);
    } else if (resource.tier == Tier::Edge &&
               resource.access_point != device_location.access_point) {
        ++counter(Link::Lan, 0);
    }
}

void NetworkLinkState::end_transfer(const Location& device_location,
                                    const ResourceRef& resource) {
    auto release = [this](Link link, AccessPointId ap) {
        uint32_t& value = counter(link, ap);
        if (value == 0) {
            throw InvariantViolation("Link counter underflow at access point " +
                                     std::to_string(ap));
        }
        --value;
    };
    release(Link::Wlan, device_location.access_point);
    if (resource.tier == Tier::Cloud) {
        release(Link::Wan, device_location.access_point);
    } else if (resource.tier == Tier::Edge &&
               resource.access_point != device_location.access_point) {
        release(Link::Lan, 0);
    }
}

} // namespace offsim::core
