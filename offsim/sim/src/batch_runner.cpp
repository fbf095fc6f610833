#include <offsim/sim/batch_runner.hpp>

#include <offsim/core/error.hpp>
#include <offsim/io/error.hpp>
#include <offsim/io/statistics.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>

namespace offsim::sim {

BatchPlan plan_from_config(const core::SimulationConfig& config) {
    const auto& settings = config.simulation;
    BatchPlan plan;

    for (auto count : settings.device_counts) {
        plan.device_counts.push_back(count);
    }
    for (const auto& name : settings.scenarios) {
        auto scenario = core::parse_scenario(name);
        if (!scenario) {
            throw io::ConfigError("unknown scenario '" + name + "'", "simulation.scenarios");
        }
        plan.scenarios.push_back(*scenario);
    }
    plan.policies = settings.policies;
    plan.iterations = settings.iterations;

    if (plan.device_counts.empty()) {
        throw io::ConfigError("at least one device count is required",
                              "simulation.device_counts");
    }
    if (plan.scenarios.empty()) {
        throw io::ConfigError("at least one scenario is required", "simulation.scenarios");
    }
    if (plan.policies.empty()) {
        throw io::ConfigError("at least one policy is required", "simulation.policies");
    }
    if (plan.iterations == 0) {
        throw io::ConfigError("must be at least 1", "simulation.iterations");
    }
    return plan;
}

namespace {

RunReport execute(const core::SimulationConfig& config, const RunParameters& parameters,
                  const BatchHooks& hooks) {
    try {
        SimulationContext context(config, parameters, hooks.trace);
        if (hooks.on_progress) {
            context.set_progress_callback(hooks.on_progress);
        }
        return context.run();
    } catch (const core::SimulationError& e) {
        RunReport report;
        report.parameters = parameters;
        report.status = RunStatus::Failed;
        report.message = e.what();
        return report;
    } catch (const io::ConfigError& e) {
        RunReport report;
        report.parameters = parameters;
        report.status = RunStatus::Failed;
        report.message = e.what();
        return report;
    }
}

} // namespace

std::vector<RunReport> run_batch(const core::SimulationConfig& config, const BatchPlan& plan,
                                 const BatchHooks& hooks) {
    std::vector<RunReport> reports;
    reports.reserve(plan.size());

    for (uint32_t iteration = 0; iteration < plan.iterations; ++iteration) {
        for (auto device_count : plan.device_counts) {
            for (auto scenario : plan.scenarios) {
                for (const auto& policy : plan.policies) {
                    RunParameters parameters{device_count, scenario, policy, iteration};
                    if (hooks.on_start) {
                        hooks.on_start(parameters);
                    }
                    reports.push_back(execute(config, parameters, hooks));
                    if (hooks.on_finish) {
                        hooks.on_finish(reports.back());
                    }
                }
            }
        }
    }
    return reports;
}

std::size_t failed_runs(const std::vector<RunReport>& reports) noexcept {
    return static_cast<std::size_t>(std::count_if(
        reports.begin(), reports.end(), [](const RunReport& report) { return !report.ok(); }));
}

std::string batch_to_json(const std::vector<RunReport>& reports) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartArray();
    for (const auto& report : reports) {
        const auto& parameters = report.parameters;
        auto scenario = core::to_string(parameters.scenario);

        writer.StartObject();
        writer.Key("devices");
        writer.Uint64(parameters.device_count);
        writer.Key("scenario");
        writer.String(scenario.data(), static_cast<rapidjson::SizeType>(scenario.size()));
        writer.Key("policy");
        writer.String(parameters.policy.c_str(),
                      static_cast<rapidjson::SizeType>(parameters.policy.size()));
        writer.Key("iteration");
        writer.Uint(parameters.iteration);
        writer.Key("status");
        writer.String(report.ok() ? "ok" : "failed");

        if (!report.ok()) {
            writer.Key("error");
            writer.String(report.message.c_str(),
                          static_cast<rapidjson::SizeType>(report.message.size()));
        } else {
            writer.Key("tasks_created");
            writer.Uint64(report.tasks_created);
            writer.Key("events_dispatched");
            writer.Uint64(report.events_dispatched);
            if (report.summary) {
                auto summary = io::summary_to_json(*report.summary);
                writer.Key("summary");
                writer.RawValue(summary.c_str(), summary.size(), rapidjson::kObjectType);
            }
        }
        writer.EndObject();
    }
    writer.EndArray();

    return buffer.GetString();
}

void write_batch_json(const std::vector<RunReport>& reports, std::ostream& out) {
    out << batch_to_json(reports) << '\n';
}

} // namespace offsim::sim
