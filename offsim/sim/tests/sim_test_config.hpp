#pragma once

#include <offsim/core/config.hpp>

#include <cstdint>

namespace offsim::sim::test_support {

// Ten single-host edge datacenters on a line, one task type generating
// 1 000 KB transfers every 5 s per device on 100 000 Kbps links
inline core::SimulationConfig small_config() {
    core::SimulationConfig config;
    config.simulation.duration = 200.0;
    config.simulation.load_log_interval = 50.0;
    config.simulation.seed = 42;
    config.simulation.device_counts = {100};
    config.simulation.scenarios = {"SINGLE_TIER"};
    config.simulation.policies = {"WORST_FIT"};

    config.network.model = core::NetworkModelKind::Averaged;
    config.network.wlan_bandwidth_kbps = 100000.0;
    config.network.wan_bandwidth_kbps = 100000.0;

    config.mobility.kind = core::MobilityKind::Nomadic;
    config.mobility.mean_dwell_time = {60.0};

    core::TaskType type;
    type.name = "augmented_reality";
    type.usage_percent = 100.0;
    type.mean_interarrival = 5.0;
    type.active_period = 3600.0;
    type.mean_input_kb = 1000.0;
    type.mean_output_kb = 1000.0;
    type.mean_length_mi = 1000.0;
    type.edge_utilization = 10.0;
    type.cloud_utilization = 5.0;
    config.task_types.push_back(type);

    for (uint32_t i = 0; i < 10; ++i) {
        core::EdgeDatacenterSpec dc;
        dc.access_point = core::AccessPoint{i, 0, 100.0 * i, 0.0};
        core::HostSpec host;
        host.cores = 8;
        host.mips = 20000.0;
        host.vms = {core::VmSpec{2, 10000.0, 0.0, 0.0}, core::VmSpec{2, 10000.0, 0.0, 0.0}};
        dc.hosts.push_back(host);
        config.edge_datacenters.push_back(dc);
    }

    config.cloud.host_count = 1;
    config.cloud.vms_per_host = 4;
    config.cloud.vm = core::VmSpec{4, 20000.0, 0.0, 0.0};
    return config;
}

} // namespace offsim::sim::test_support
