#pragma once

#include <compare>
#include <cstdint>

namespace offsim::core {

/// @brief Identifier of a simulated mobile device (0-based, dense).
/// @ingroup core_types
using DeviceId = uint32_t;

/// @brief Identifier of a task, unique within a run and assigned in creation order.
/// @ingroup core_types
using TaskId = uint64_t;

/// @brief Identifier of a wireless access point (0-based, dense).
/// @ingroup core_types
using AccessPointId = uint32_t;

/// @brief Index of an application type in the task-type table.
/// @ingroup core_types
using AppTypeId = uint32_t;

/// @brief Virtual-time interval stored as an integer nanosecond count.
///
/// The constructor is private; values are created with the bridge
/// functions so every conversion between `double` seconds (the unit of all
/// delay formulas) and the integer clock is explicit and rounds the same
/// way.
///
/// @see duration_from_seconds, duration_to_seconds, TimePoint
/// @ingroup core_types
class Duration {
    int64_t ns_;

    explicit constexpr Duration(int64_t ns) noexcept : ns_(ns) {}

    // Round double seconds to nearest nanosecond
    static constexpr int64_t secs_to_ns(double s) noexcept {
        return static_cast<int64_t>(s * 1e9 + (s >= 0.0 ? 0.5 : -0.5));
    }

    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : ns_(0) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Convert to seconds (double).
    [[nodiscard]] constexpr double seconds() const noexcept {
        return static_cast<double>(ns_) * 1e-9;
    }

    /// @brief Return the raw nanosecond count.
    [[nodiscard]] constexpr int64_t nanoseconds() const noexcept {
        return ns_;
    }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{ns_ + rhs.ns_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{ns_ - rhs.ns_};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ns_ += rhs.ns_;
        return *this;
    }

    constexpr Duration operator-() const noexcept {
        return Duration{-ns_};
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute virtual time as a Duration offset from the start of the run.
///
/// TimePoint +/- Duration yields a TimePoint and TimePoint - TimePoint
/// yields a Duration. Two TimePoints cannot be added.
///
/// @see time_from_seconds, time_to_seconds, Duration
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_seconds(double s) noexcept;

public:
    /// @brief Default constructor: epoch (time zero).
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    /// @brief Named factory returning the epoch (time zero).
    static constexpr TimePoint epoch() noexcept {
        return TimePoint{Duration::zero()};
    }

    /// @brief Return the duration elapsed since epoch.
    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept {
        return since_epoch_;
    }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_epoch_ + d};
    }

    constexpr TimePoint operator-(Duration d) const noexcept {
        return TimePoint{since_epoch_ - d};
    }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

// ============================================================================
// Bridge functions: the canonical API for Duration/TimePoint conversion
// ============================================================================

/// @brief Create a Duration from a value in seconds (round to nearest ns).
/// @param s Time interval in seconds.
/// @return Duration rounded to the nearest nanosecond.
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{Duration::secs_to_ns(s)};
}

/// @brief Convert a Duration to seconds (double).
[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept {
    return d.seconds();
}

/// @brief Create a Duration from a raw nanosecond count.
[[nodiscard]] constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept {
    return Duration{ns};
}

/// @brief Create a TimePoint from a value in seconds since the start of the run.
/// @param s Absolute time in seconds.
/// @return TimePoint at @p s seconds from epoch.
/// @see time_to_seconds
[[nodiscard]] constexpr TimePoint time_from_seconds(double s) noexcept {
    return TimePoint{duration_from_seconds(s)};
}

/// @brief Convert a TimePoint to seconds since the start of the run (double).
/// @see time_from_seconds
[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

} // namespace offsim::core
