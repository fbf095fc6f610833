#include <offsim/algo/queueing.hpp>

namespace offsim::algo {

double mm1_delay(double service_rate, double arrival_rate, double propagation) noexcept {
    if (service_rate <= arrival_rate) {
        return kSaturated;
    }
    return 1.0 / (service_rate - arrival_rate) + propagation;
}

double mm2_delay(double service_rate, double arrival_rate, double propagation) noexcept {
    double two_mu = 2.0 * service_rate;
    if (two_mu <= arrival_rate) {
        return kSaturated;
    }
    return (4.0 * service_rate) / ((two_mu - arrival_rate) * (two_mu + arrival_rate)) +
           propagation;
}

double service_rate(double bandwidth_kbps, double size_kb) noexcept {
    double bytes_per_second = bandwidth_kbps * 1000.0 / 8.0;
    double bytes = size_kb * 1000.0;
    if (bytes <= 0.0) {
        return 0.0;
    }
    return bytes_per_second / bytes;
}

double arrival_rate(double devices, double mean_interarrival) noexcept {
    if (mean_interarrival <= 0.0) {
        return 0.0;
    }
    return devices / mean_interarrival;
}

TaskMix TaskMix::from(std::span<const core::TaskType> types) noexcept {
    TaskMix mix;
    double total_weight = 0.0;
    for (const auto& type : types) {
        double weight = type.usage_percent;
        if (weight <= 0.0) {
            continue;
        }
        total_weight += weight;
        mix.mean_input_kb += weight * type.mean_input_kb;
        mix.mean_output_kb += weight * type.mean_output_kb;
        mix.mean_interarrival += weight * type.mean_interarrival;
        mix.cloud_share += weight * type.cloud_selection_percent / 100.0;
    }
    if (total_weight > 0.0) {
        mix.mean_input_kb /= total_weight;
        mix.mean_output_kb /= total_weight;
        mix.mean_interarrival /= total_weight;
        mix.cloud_share /= total_weight;
    }
    return mix;
}

double LinkDelayCalculator::capped(double delay) const noexcept {
    if (delay <= 0.0) {
        return kSaturated;
    }
    if (settings_.max_queueing_delay > 0.0 && delay > settings_.max_queueing_delay) {
        return kSaturated;
    }
    return delay;
}

double LinkDelayCalculator::wlan_delay(double size_kb, double devices) const noexcept {
    // An empty message never queues
    if (size_kb <= 0.0) {
        return capped(settings_.wlan_propagation_delay);
    }
    double mu = service_rate(settings_.wlan_bandwidth_kbps, size_kb);
    double lambda = arrival_rate(devices, mix_.mean_interarrival);
    double delay = (settings_.wlan_discipline == core::QueueDiscipline::MM2)
                       ? mm2_delay(mu, lambda, settings_.wlan_propagation_delay)
                       : mm1_delay(mu, lambda, settings_.wlan_propagation_delay);
    return capped(delay);
}

double LinkDelayCalculator::wan_delay(double size_kb, double devices) const noexcept {
    if (size_kb <= 0.0) {
        return capped(settings_.wan_propagation_delay);
    }
    double mu = service_rate(settings_.wan_bandwidth_kbps, size_kb);
    double lambda = arrival_rate(devices, mix_.mean_interarrival);
    return capped(mm1_delay(mu, lambda, settings_.wan_propagation_delay));
}

double LinkDelayCalculator::route_delay(Direction direction, const core::Location& device,
                                        const core::ResourceRef& resource, double wlan_devices,
                                        double wan_devices) const noexcept {
    double size = (direction == Direction::Upload) ? mix_.mean_input_kb : mix_.mean_output_kb;

    double delay = wlan_delay(size, wlan_devices);
    if (delay <= 0.0) {
        return kSaturated;
    }

    switch (resource.tier) {
    case core::Tier::Cloud: {
        double wan = wan_delay(size, wan_devices);
        if (wan <= 0.0) {
            return kSaturated;
        }
        delay += wan;
        break;
    }
    case core::Tier::Edge:
        // Relayed over the internal LAN when the host sits behind another AP
        if (resource.access_point != device.access_point) {
            double hops = (direction == Direction::Upload) ? 1.0 : 2.0;
            delay += hops * settings_.lan_internal_delay;
        }
        break;
    case core::Tier::Mobile:
        return 0.0;
    }
    return delay;
}

} // namespace offsim::algo
