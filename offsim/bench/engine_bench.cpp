#include <offsim/core/config.hpp>
#include <offsim/core/engine.hpp>
#include <offsim/core/event.hpp>
#include <offsim/core/types.hpp>

#include <offsim/sim/simulation_context.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>

using namespace offsim::core;
using namespace offsim::sim;

// ---------------------------------------------------------------------------
// BM_EventQueue: insert + pop N timers
// ---------------------------------------------------------------------------

static void BM_EventQueue(benchmark::State& state) {
    const int64_t n = state.range(0);

    for (auto _ : state) {
        state.PauseTiming();
        Engine engine;
        int fired = 0;
        for (int64_t i = 0; i < n; ++i) {
            double t = static_cast<double>(i + 1) * 0.001;
            engine.add_timer(time_from_seconds(t), [&fired]() { ++fired; });
        }
        state.ResumeTiming();

        engine.run();
        benchmark::DoNotOptimize(fired);
    }
}
BENCHMARK(BM_EventQueue)->Arg(1000)->Arg(10000);

// ---------------------------------------------------------------------------
// BM_TaskEvents: N task events at colliding times, dispatched in FIFO order
// ---------------------------------------------------------------------------

static void BM_TaskEvents(benchmark::State& state) {
    const int64_t n = state.range(0);

    for (auto _ : state) {
        state.PauseTiming();
        Engine engine;
        uint64_t handled = 0;
        engine.set_task_event_handler([&handled](TaskEvent&) { ++handled; });
        for (int64_t i = 0; i < n; ++i) {
            auto delay = duration_from_seconds(static_cast<double>(i % 100) * 0.01);
            engine.schedule(delay, UploadCompletedEvent{static_cast<TaskId>(i)});
        }
        state.ResumeTiming();

        engine.run();
        benchmark::DoNotOptimize(handled);
    }
}
BENCHMARK(BM_TaskEvents)->Arg(1000)->Arg(10000);

// ---------------------------------------------------------------------------
// BM_SingleRun: two-tier run, 10 edge datacenters, no trace
// ---------------------------------------------------------------------------

static SimulationConfig bench_config() {
    SimulationConfig config;
    config.simulation.duration = 300.0;
    config.simulation.seed = 1;

    config.network.model = NetworkModelKind::AccessPointLoad;
    config.network.wlan_bandwidth_kbps = 300000.0;
    config.network.wan_bandwidth_kbps = 20000.0;
    config.network.wan_propagation_delay = 0.1;

    config.mobility.mean_dwell_time = {120.0, 60.0, 30.0};

    TaskType type;
    type.name = "health_app";
    type.usage_percent = 100.0;
    type.cloud_selection_percent = 20.0;
    type.mean_interarrival = 3.0;
    type.active_period = 45.0;
    type.idle_period = 90.0;
    type.mean_input_kb = 20.0;
    type.mean_output_kb = 20.0;
    type.mean_length_mi = 3000.0;
    type.edge_utilization = 8.0;
    type.cloud_utilization = 0.8;
    config.task_types.push_back(type);

    for (uint32_t i = 0; i < 10; ++i) {
        EdgeDatacenterSpec dc;
        dc.access_point = AccessPoint{i, static_cast<int>(i % 3), 100.0 * i, 0.0};
        HostSpec host;
        host.cores = 8;
        host.mips = 40000.0;
        host.vms = {VmSpec{2, 10000.0, 0.0, 0.0}, VmSpec{2, 10000.0, 0.0, 0.0}};
        dc.hosts.push_back(host);
        config.edge_datacenters.push_back(dc);
    }

    config.cloud.host_count = 4;
    config.cloud.vms_per_host = 4;
    config.cloud.vm = VmSpec{4, 100000.0, 0.0, 0.0};
    return config;
}

static void BM_SingleRun(benchmark::State& state) {
    auto config = bench_config();
    RunParameters params{static_cast<std::size_t>(state.range(0)), Scenario::TwoTierWithEo,
                         "WORST_FIT", 0};

    for (auto _ : state) {
        SimulationContext context(config, params);
        auto report = context.run();
        benchmark::DoNotOptimize(report.tasks_created);
    }
}
BENCHMARK(BM_SingleRun)->Arg(100)->Arg(500);
