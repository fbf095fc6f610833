#pragma once

#include <offsim/core/types.hpp>

namespace offsim::core {

/// @brief Position of a device at one instant.
///
/// `place_class` is the attractiveness class of the serving access point
/// (0-based) and selects the mean dwell time of the nomadic mobility model.
/// `x`/`y` are only meaningful for continuous mobility; the nomadic model
/// copies the access point coordinates.
///
/// @ingroup core_mobility
struct Location {
    int place_class{0};
    AccessPointId access_point{0};
    double x{0.0};
    double y{0.0};

    bool operator==(const Location&) const = default;
};

/// @brief A wireless access point and the edge site attached to it.
/// @ingroup core_mobility
struct AccessPoint {
    AccessPointId id{0};
    int place_class{0};
    double x{0.0};
    double y{0.0};
};

} // namespace offsim::core
