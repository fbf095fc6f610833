#pragma once

#include <offsim/core/location.hpp>
#include <offsim/core/types.hpp>

#include <cstddef>
#include <span>
#include <vector>

namespace offsim::core {

/// @brief How a device moves between two keyframes.
/// @ingroup core_mobility
enum class MotionKind {
    Discrete,   ///< The location jumps at each keyframe (nomadic model).
    Continuous, ///< The position is interpolated between keyframes (waypoint model).
};

/// @brief One point of a mobility timeline.
/// @ingroup core_mobility
struct Keyframe {
    TimePoint time;
    Location location;
};

/// @brief Precomputed location trajectory of one device.
///
/// Keyframes are stored in a vector sorted by strictly increasing time, so
/// lookups are a binary search for the largest keyframe time not after the
/// query time.
///
/// @see MobilityModel
/// @ingroup core_mobility
class MobilityTimeline {
public:
    MobilityTimeline(DeviceId device, MotionKind motion) noexcept
        : device_(device)
        , motion_(motion) {}

    [[nodiscard]] DeviceId device() const noexcept { return device_; }
    [[nodiscard]] MotionKind motion() const noexcept { return motion_; }

    /// @brief Append a keyframe at the end of the timeline.
    /// @throws InvariantViolation if @p time is not after the last keyframe.
    void append(TimePoint time, const Location& location);

    [[nodiscard]] std::span<const Keyframe> keyframes() const noexcept { return keyframes_; }
    [[nodiscard]] bool empty() const noexcept { return keyframes_.empty(); }

    /// @brief Time of the last keyframe, or epoch when empty.
    [[nodiscard]] TimePoint last_time() const noexcept;

    /// @brief Index of the keyframe active at @p time, or size() when @p time
    ///        precedes the first keyframe.
    [[nodiscard]] std::size_t floor_index(TimePoint time) const noexcept;

private:
    DeviceId device_;
    MotionKind motion_;
    std::vector<Keyframe> keyframes_;
};

/// @brief Mobility timelines of every device plus the access point layout.
///
/// Devices are registered with add_device() in id order while the model is
/// built, then finalize() checks that every timeline covers the run. After
/// that location() is defined for every device and every time in
/// `[0, horizon]`.
///
/// Continuous positions are bound to the nearest access point (Euclidean
/// distance, the first access point wins ties).
///
/// @ingroup core_mobility
class MobilityModel {
public:
    /// @param access_points Access point layout; ids must equal their index.
    /// @throws OutOfRangeError if the layout is empty or ids are not dense.
    explicit MobilityModel(std::vector<AccessPoint> access_points);

    MobilityModel(const MobilityModel&) = delete;
    MobilityModel& operator=(const MobilityModel&) = delete;
    MobilityModel(MobilityModel&&) = default;
    MobilityModel& operator=(MobilityModel&&) = default;

    /// @brief Register the next device and return its (empty) timeline.
    ///
    /// The reference stays valid until the next add_device() call.
    MobilityTimeline& add_device(MotionKind motion);

    /// @brief Verify that every timeline starts at epoch and reaches @p horizon.
    /// @throws InvariantViolation naming the first device that is not covered.
    void finalize(TimePoint horizon);

    [[nodiscard]] bool is_finalized() const noexcept { return finalized_; }
    [[nodiscard]] TimePoint horizon() const noexcept { return horizon_; }

    /// @brief Location of @p device at @p time.
    /// @throws InvariantViolation if the device is unknown or @p time precedes
    ///         its first keyframe.
    [[nodiscard]] Location location(DeviceId device, TimePoint time) const;

    /// @brief Number of devices served by @p access_point at @p time.
    [[nodiscard]] std::size_t devices_at(AccessPointId access_point, TimePoint time) const;

    [[nodiscard]] std::size_t device_count() const noexcept { return timelines_.size(); }

    [[nodiscard]] const MobilityTimeline& timeline(DeviceId device) const;

    [[nodiscard]] std::span<const AccessPoint> access_points() const noexcept {
        return access_points_;
    }

    /// @brief Access point closest to (@p x, @p y).
    [[nodiscard]] const AccessPoint& nearest_access_point(double x, double y) const noexcept;

    /// @brief Location value for a continuous position bound to its nearest access point.
    [[nodiscard]] Location bind(double x, double y) const noexcept;

private:
    std::vector<AccessPoint> access_points_;
    std::vector<MobilityTimeline> timelines_;
    TimePoint horizon_{};
    bool finalized_{false};
};

} // namespace offsim::core
