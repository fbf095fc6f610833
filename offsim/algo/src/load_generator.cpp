#include <offsim/algo/load_generator.hpp>

#include <offsim/core/error.hpp>

#include <algorithm>
#include <string>

namespace offsim::algo {

namespace {

double sample_exponential(double mean, std::mt19937& rng) {
    if (mean <= 0.0) {
        return 0.0;
    }
    std::exponential_distribution<double> dist(1.0 / mean);
    return dist(rng);
}

} // namespace

std::optional<core::AppTypeId> pick_app_type(std::span<const core::TaskType> types,
                                              std::mt19937& rng) {
    std::uniform_real_distribution<double> draw(0.0, 100.0);
    double value = draw(rng);
    double cumulative = 0.0;
    for (std::size_t i = 0; i < types.size(); ++i) {
        cumulative += types[i].usage_percent;
        if (types[i].usage_percent > 0.0 && value < cumulative) {
            return static_cast<core::AppTypeId>(i);
        }
    }
    return std::nullopt;
}

std::vector<TaskArrival> generate_idle_active_load(const core::SimulationConfig& config,
                                                   std::size_t device_count,
                                                   std::mt19937& rng) {
    const auto& settings = config.simulation;
    std::vector<TaskArrival> arrivals;

    for (std::size_t d = 0; d < device_count; ++d) {
        auto app = pick_app_type(config.task_types, rng);
        if (!app) {
            continue;
        }
        const core::TaskType& type = config.task_types[*app];
        if (type.active_period <= 0.0 || type.mean_interarrival <= 0.0) {
            throw core::OutOfRangeError("Task type '" + type.name +
                                        "' needs a positive active period and inter-arrival time");
        }

        std::uniform_real_distribution<double> first_start(
            settings.task_start_offset, settings.task_start_offset + type.active_period);
        double period_start = first_start(rng);
        double t = period_start;

        while (t < settings.duration) {
            double interval = sample_exponential(type.mean_interarrival, rng);
            if (interval <= 0.0) {
                continue;
            }
            t += interval;
            if (t > period_start + type.active_period) {
                period_start += type.active_period + type.idle_period;
                t = period_start;
                continue;
            }
            if (t >= settings.duration) {
                break;
            }

            core::TaskProperties props;
            props.device = static_cast<core::DeviceId>(d);
            props.app_type = *app;
            props.input_kb = sample_exponential(type.mean_input_kb, rng);
            props.output_kb = sample_exponential(type.mean_output_kb, rng);
            props.length_mi = sample_exponential(type.mean_length_mi, rng);
            arrivals.push_back(TaskArrival{core::time_from_seconds(t), props});
        }
    }

    std::stable_sort(arrivals.begin(), arrivals.end(),
                     [](const TaskArrival& a, const TaskArrival& b) { return a.time < b.time; });
    return arrivals;
}

} // namespace offsim::algo
