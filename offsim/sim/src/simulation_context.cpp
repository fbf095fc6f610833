#include <offsim/sim/simulation_context.hpp>

#include <offsim/algo/load_generator.hpp>
#include <offsim/core/error.hpp>
#include <offsim/core/event.hpp>
#include <offsim/sim/factories.hpp>

#include <array>
#include <utility>
#include <vector>

namespace offsim::sim {

RunSeeds derive_run_seeds(uint64_t seed, const RunParameters& parameters) {
    std::vector<uint32_t> material{
        static_cast<uint32_t>(seed),
        static_cast<uint32_t>(seed >> 32),
        static_cast<uint32_t>(parameters.device_count),
        static_cast<uint32_t>(parameters.scenario),
        parameters.iteration,
    };
    for (char c : parameters.policy) {
        material.push_back(static_cast<unsigned char>(c));
    }

    std::seed_seq sequence(material.begin(), material.end());
    std::array<uint32_t, 4> words{};
    sequence.generate(words.begin(), words.end());

    return RunSeeds{words[0], words[1], (static_cast<uint64_t>(words[2]) << 32) | words[3]};
}

SimulationContext::SimulationContext(const core::SimulationConfig& config,
                                     RunParameters parameters, core::TraceWriter* trace,
                                     core::StatisticsSink* extra_sink)
    : config_(config)
    , parameters_(std::move(parameters))
    , seeds_(derive_run_seeds(config.simulation.seed, parameters_))
    , horizon_(core::time_from_seconds(config.simulation.duration))
    , mobility_rng_(seeds_.mobility)
    , load_rng_(seeds_.load)
    , mobility_(make_mobility(config, parameters_.device_count, horizon_, mobility_rng_))
    , oracle_(config, parameters_.device_count)
    , network_(make_network_model(config, parameters_.device_count, mobility_))
    , policy_(make_policy(config, parameters_.scenario, parameters_.policy, seeds_.policy))
    , summary_(config.task_types, config.simulation.warm_up)
    , sink_(summary_, extra_sink)
    , manager_(engine_, mobility_, *network_, oracle_, *policy_, sink_) {
    engine_.set_trace_writer(trace);
}

void SimulationContext::schedule_arrivals() {
    auto arrivals = algo::generate_idle_active_load(config_, parameters_.device_count, load_rng_);
    for (auto& arrival : arrivals) {
        engine_.schedule(arrival.time - engine_.time(),
                         core::TaskCreatedEvent{std::move(arrival.properties)});
    }
}

void SimulationContext::schedule_load_sample(core::TimePoint when) {
    engine_.add_timer(when, [this]() {
        double edge = oracle_.average_utilization(core::Tier::Edge);
        double cloud = oracle_.average_utilization(core::Tier::Cloud);
        double mobile = oracle_.average_utilization(core::Tier::Mobile);
        summary_.record_vm_load(edge, cloud, mobile);

        engine_.trace([&](core::TraceWriter& w) {
            w.type("vm_load");
            w.field("edge", edge);
            w.field("cloud", cloud);
            w.field("mobile", mobile);
        });

        auto next = engine_.time() +
                    core::duration_from_seconds(config_.simulation.load_log_interval);
        if (next <= horizon_) {
            schedule_load_sample(next);
        }
    });
}

void SimulationContext::schedule_progress(unsigned percent) {
    auto offset = core::duration_from_seconds(config_.simulation.duration * percent / 100.0);
    engine_.add_timer(core::TimePoint::epoch() + offset, [this, percent]() {
        progress_(percent);
        if (percent < 100) {
            schedule_progress(percent + 10);
        }
    });
}

RunReport SimulationContext::run() {
    if (has_run_) {
        throw core::InvariantViolation("Simulation context has already run");
    }
    has_run_ = true;

    engine_.trace([&](core::TraceWriter& w) {
        w.type("run_started");
        w.field("devices", static_cast<uint64_t>(parameters_.device_count));
        w.field("scenario", core::to_string(parameters_.scenario));
        w.field("policy", parameters_.policy);
        w.field("iteration", static_cast<uint64_t>(parameters_.iteration));
    });

    schedule_arrivals();

    double interval = config_.simulation.load_log_interval;
    if (interval > 0.0 && interval <= config_.simulation.duration) {
        schedule_load_sample(core::time_from_seconds(interval));
    }
    if (progress_) {
        schedule_progress(10);
    }

    engine_.run(horizon_);
    manager_.finish();

    engine_.trace([&](core::TraceWriter& w) {
        w.type("run_finished");
        w.field("tasks_created", manager_.created());
        w.field("events_dispatched", engine_.dispatched_events());
    });

    RunReport report;
    report.parameters = parameters_;
    report.status = RunStatus::Ok;
    report.tasks_created = manager_.created();
    report.events_dispatched = engine_.dispatched_events();
    report.summary = summary_;
    return report;
}

} // namespace offsim::sim
