#include <offsim/core/mobility.hpp>
#include <offsim/core/error.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace offsim::core {

namespace {

std::string describe(DeviceId device, TimePoint time) {
    return "device " + std::to_string(device) + " at " +
           std::to_string(time_to_seconds(time)) + " s";
}

} // namespace

void MobilityTimeline::append(TimePoint time, const Location& location) {
    if (!keyframes_.empty() && time <= keyframes_.back().time) {
        throw InvariantViolation("Mobility keyframe out of order for " +
                                 describe(device_, time));
    }
    keyframes_.push_back(Keyframe{time, location});
}

TimePoint MobilityTimeline::last_time() const noexcept {
    return keyframes_.empty() ? TimePoint::epoch() : keyframes_.back().time;
}

std::size_t MobilityTimeline::floor_index(TimePoint time) const noexcept {
    // First keyframe strictly after `time`; the floor is the one before it
    auto it = std::upper_bound(keyframes_.begin(), keyframes_.end(), time,
                               [](TimePoint t, const Keyframe& kf) { return t < kf.time; });
    if (it == keyframes_.begin()) {
        return keyframes_.size();
    }
    return static_cast<std::size_t>(std::distance(keyframes_.begin(), it)) - 1;
}

MobilityModel::MobilityModel(std::vector<AccessPoint> access_points)
    : access_points_(std::move(access_points)) {
    if (access_points_.empty()) {
        throw OutOfRangeError("Mobility model needs at least one access point");
    }
    for (std::size_t i = 0; i < access_points_.size(); ++i) {
        if (access_points_[i].id != i) {
            throw OutOfRangeError("Access point ids must be dense: expected " +
                                  std::to_string(i) + ", got " +
                                  std::to_string(access_points_[i].id));
        }
    }
}

MobilityTimeline& MobilityModel::add_device(MotionKind motion) {
    auto id = static_cast<DeviceId>(timelines_.size());
    timelines_.emplace_back(id, motion);
    finalized_ = false;
    return timelines_.back();
}

void MobilityModel::finalize(TimePoint horizon) {
    for (const auto& timeline : timelines_) {
        if (timeline.empty() || timeline.keyframes().front().time > TimePoint::epoch()) {
            throw InvariantViolation("Mobility timeline does not start at time 0 for " +
                                     describe(timeline.device(), TimePoint::epoch()));
        }
        if (timeline.last_time() < horizon) {
            throw InvariantViolation("Mobility timeline of device " +
                                     std::to_string(timeline.device()) + " ends at " +
                                     std::to_string(time_to_seconds(timeline.last_time())) +
                                     " s, before the horizon " +
                                     std::to_string(time_to_seconds(horizon)) + " s");
        }
    }
    horizon_ = horizon;
    finalized_ = true;
}

const MobilityTimeline& MobilityModel::timeline(DeviceId device) const {
    if (device >= timelines_.size()) {
        throw InvariantViolation("No mobility timeline for " +
                                 describe(device, TimePoint::epoch()));
    }
    return timelines_[device];
}

Location MobilityModel::location(DeviceId device, TimePoint time) const {
    if (device >= timelines_.size()) {
        throw InvariantViolation("Location query for unknown " + describe(device, time));
    }
    const auto& timeline = timelines_[device];
    auto keyframes = timeline.keyframes();
    std::size_t index = timeline.floor_index(time);
    if (index >= keyframes.size()) {
        throw InvariantViolation("No mobility keyframe covers " + describe(device, time));
    }

    const Keyframe& floor = keyframes[index];
    if (timeline.motion() == MotionKind::Discrete || index + 1 == keyframes.size()) {
        return floor.location;
    }

    const Keyframe& ceiling = keyframes[index + 1];
    if (floor.location.x == ceiling.location.x && floor.location.y == ceiling.location.y) {
        return floor.location;
    }
    double ratio = (time - floor.time).seconds() / (ceiling.time - floor.time).seconds();
    double x = floor.location.x + (ceiling.location.x - floor.location.x) * ratio;
    double y = floor.location.y + (ceiling.location.y - floor.location.y) * ratio;
    return bind(x, y);
}

std::size_t MobilityModel::devices_at(AccessPointId access_point, TimePoint time) const {
    std::size_t count = 0;
    for (const auto& timeline : timelines_) {
        if (location(timeline.device(), time).access_point == access_point) {
            ++count;
        }
    }
    return count;
}

const AccessPoint& MobilityModel::nearest_access_point(double x, double y) const noexcept {
    const AccessPoint* best = &access_points_.front();
    double best_distance = -1.0;
    for (const auto& ap : access_points_) {
        double dx = ap.x - x;
        double dy = ap.y - y;
        double distance = dx * dx + dy * dy;
        if (best_distance < 0.0 || distance < best_distance) {
            best = &ap;
            best_distance = distance;
        }
    }
    return *best;
}

Location MobilityModel::bind(double x, double y) const noexcept {
    const AccessPoint& ap = nearest_access_point(x, y);
    return Location{ap.place_class, ap.id, x, y};
}

} // namespace offsim::core
