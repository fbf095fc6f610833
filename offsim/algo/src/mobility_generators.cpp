#include <offsim/algo/mobility_generators.hpp>

#include <offsim/core/error.hpp>

#include <cmath>
#include <string>

namespace offsim::algo {

namespace {

core::Location location_of(const core::AccessPoint& ap) {
    return core::Location{ap.place_class, ap.id, ap.x, ap.y};
}

// Keyframes need strictly increasing times
core::Duration at_least_one_tick(double seconds) {
    core::Duration d = core::duration_from_seconds(seconds);
    if (d <= core::Duration::zero()) {
        return core::duration_from_nanoseconds(1);
    }
    return d;
}

} // namespace

core::MobilityModel generate_nomadic_mobility(const core::SimulationConfig& config,
                                              std::size_t device_count, core::TimePoint horizon,
                                              std::mt19937& rng) {
    core::MobilityModel model(config.access_points());
    auto aps = model.access_points();
    const auto& dwell = config.mobility.mean_dwell_time;

    for (const auto& ap : aps) {
        auto place = static_cast<std::size_t>(ap.place_class);
        if (ap.place_class < 0 || place >= dwell.size() || dwell[place] <= 0.0) {
            throw core::OutOfRangeError("No mean dwell time for place class " +
                                        std::to_string(ap.place_class) + " of access point " +
                                        std::to_string(ap.id));
        }
    }

    std::uniform_int_distribution<std::size_t> pick_start(0, aps.size() - 1);
    for (std::size_t d = 0; d < device_count; ++d) {
        auto& timeline = model.add_device(core::MotionKind::Discrete);

        std::size_t current = pick_start(rng);
        core::TimePoint t = core::TimePoint::epoch();
        timeline.append(t, location_of(aps[current]));

        while (t < horizon) {
            double mean = dwell[static_cast<std::size_t>(aps[current].place_class)];
            std::exponential_distribution<double> stay(1.0 / mean);
            t += at_least_one_tick(stay(rng));

            if (aps.size() > 1) {
                std::uniform_int_distribution<std::size_t> pick_other(0, aps.size() - 2);
                std::size_t next = pick_other(rng);
                if (next >= current) {
                    ++next;
                }
                current = next;
            }
            timeline.append(t, location_of(aps[current]));
        }
    }

    model.finalize(horizon);
    return model;
}

core::MobilityModel generate_waypoint_mobility(const core::SimulationConfig& config,
                                               std::size_t device_count, core::TimePoint horizon,
                                               std::mt19937& rng) {
    const auto& settings = config.mobility;
    if (settings.area_width <= 0.0 || settings.area_height <= 0.0) {
        throw core::OutOfRangeError("Waypoint mobility needs a non-empty area");
    }
    if (settings.min_speed <= 0.0 || settings.max_speed < settings.min_speed) {
        throw core::OutOfRangeError("Waypoint mobility needs 0 < min_speed <= max_speed");
    }
    if (settings.min_pause < 0.0 || settings.max_pause < settings.min_pause) {
        throw core::OutOfRangeError("Waypoint mobility needs 0 <= min_pause <= max_pause");
    }

    core::MobilityModel model(config.access_points());
    std::uniform_real_distribution<double> pick_x(0.0, settings.area_width);
    std::uniform_real_distribution<double> pick_y(0.0, settings.area_height);
    std::uniform_real_distribution<double> pick_speed(settings.min_speed, settings.max_speed);
    std::uniform_real_distribution<double> pick_pause(settings.min_pause, settings.max_pause);

    for (std::size_t d = 0; d < device_count; ++d) {
        auto& timeline = model.add_device(core::MotionKind::Continuous);

        double x = pick_x(rng);
        double y = pick_y(rng);
        core::TimePoint t = core::TimePoint::epoch();
        timeline.append(t, model.bind(x, y));

        while (t < horizon) {
            double dest_x = pick_x(rng);
            double dest_y = pick_y(rng);
            double distance = std::hypot(dest_x - x, dest_y - y);
            t += at_least_one_tick(distance / pick_speed(rng));
            timeline.append(t, model.bind(dest_x, dest_y));
            x = dest_x;
            y = dest_y;

            double pause = pick_pause(rng);
            if (pause > 0.0) {
                t += at_least_one_tick(pause);
                timeline.append(t, model.bind(x, y));
            }
        }
    }

    model.finalize(horizon);
    return model;
}

} // namespace offsim::algo
