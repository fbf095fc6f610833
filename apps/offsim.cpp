#include <offsim/core/config.hpp>
#include <offsim/core/orchestration.hpp>
#include <offsim/core/trace_writer.hpp>

#include <offsim/algo/vm_selector.hpp>

#include <offsim/io/config_loader.hpp>
#include <offsim/io/error.hpp>
#include <offsim/io/trace_writers.hpp>

#include <offsim/sim/batch_runner.hpp>

#include <cxxopts.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace core = offsim::core;
namespace algo = offsim::algo;
namespace io = offsim::io;
namespace sim = offsim::sim;

struct Options {
    std::string config_file;
    std::vector<uint32_t> devices;
    std::vector<std::string> scenarios;
    std::vector<std::string> policies;
    uint32_t iterations{0};  // 0 = from config
    bool has_seed{false};
    uint64_t seed{0};
    std::string trace_file;  // empty = no trace
    std::string format{"json"};
    std::string summary_file{"-"};
    bool verbose{false};
};

Options parse_args(int argc, char** argv) {
    cxxopts::Options options("offsim", "Mobile/edge/cloud task offloading simulator");

    options.add_options()
        ("c,config", "Simulation configuration (JSON)", cxxopts::value<std::string>())
        ("d,devices", "Device counts, overrides the config (e.g. 100,200)", cxxopts::value<std::vector<uint32_t>>())
        ("s,scenario", "Scenarios: SINGLE_TIER|TWO_TIER|TWO_TIER_WITH_EO|THREE_TIER", cxxopts::value<std::vector<std::string>>())
        ("p,policy", "Edge VM selection: RANDOM_FIT|FIRST_FIT|NEXT_FIT|BEST_FIT|WORST_FIT", cxxopts::value<std::vector<std::string>>())
        ("n,iterations", "Iterations per configuration (default: from config)", cxxopts::value<uint32_t>())
        ("seed", "Base random seed (default: from config)", cxxopts::value<uint64_t>())
        ("t,trace", "Trace output, - for stdout (default: none)", cxxopts::value<std::string>())
        ("format", "Trace format: json|text|null (default: json)", cxxopts::value<std::string>()->default_value("json"))
        ("o,summary", "Batch summary output (default: stdout)", cxxopts::value<std::string>()->default_value("-"))
        ("v,verbose", "Verbose output")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("config") == 0U) {
        std::cerr << "Error: --config is required" << std::endl;
        std::exit(64);
    }

    Options opts;
    opts.config_file = result["config"].as<std::string>();
    if (result.count("devices") != 0U) {
        opts.devices = result["devices"].as<std::vector<uint32_t>>();
    }
    if (result.count("scenario") != 0U) {
        opts.scenarios = result["scenario"].as<std::vector<std::string>>();
    }
    if (result.count("policy") != 0U) {
        opts.policies = result["policy"].as<std::vector<std::string>>();
    }
    if (result.count("iterations") != 0U) {
        opts.iterations = result["iterations"].as<uint32_t>();
    }
    if (result.count("seed") != 0U) {
        opts.has_seed = true;
        opts.seed = result["seed"].as<uint64_t>();
    }
    if (result.count("trace") != 0U) {
        opts.trace_file = result["trace"].as<std::string>();
    }
    opts.format = result["format"].as<std::string>();
    opts.summary_file = result["summary"].as<std::string>();
    opts.verbose = result.count("verbose") != 0U;

    if (opts.format != "json" && opts.format != "text" && opts.format != "null") {
        std::cerr << "Error: unknown trace format: " << opts.format << std::endl;
        std::exit(64);
    }
    if (opts.trace_file == "-" && opts.summary_file == "-" && opts.format != "null") {
        std::cerr << "Error: --trace and --summary cannot both write to stdout" << std::endl;
        std::exit(64);
    }

    return opts;
}

void apply_overrides(core::SimulationConfig& config, const Options& opts) {
    auto& settings = config.simulation;
    if (!opts.devices.empty()) {
        settings.device_counts = opts.devices;
    }
    if (!opts.scenarios.empty()) {
        settings.scenarios = opts.scenarios;
    }
    if (!opts.policies.empty()) {
        settings.policies = opts.policies;
    }
    if (opts.iterations > 0) {
        settings.iterations = opts.iterations;
    }
    if (opts.has_seed) {
        settings.seed = opts.seed;
    }

    for (const auto& policy : settings.policies) {
        if (!algo::make_vm_selector(policy)) {
            throw io::ConfigError("unknown orchestration policy '" + policy + "'",
                                  "simulation.policies");
        }
    }
}

std::string describe(const sim::RunParameters& params) {
    return "devices=" + std::to_string(params.device_count) + " scenario=" +
           std::string(core::to_string(params.scenario)) + " policy=" + params.policy +
           " iteration=" + std::to_string(params.iteration);
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto opts = parse_args(argc, argv);

        if (opts.verbose) {
            std::cerr << "Loading configuration from: " << opts.config_file << std::endl;
        }

        // 1. Load configuration and apply command line overrides
        auto config = io::load_config(opts.config_file);
        apply_overrides(config, opts);
        auto plan = sim::plan_from_config(config);

        // 2. Setup trace writer
        // The writer may still flush into trace_file when it is destroyed
        std::ofstream trace_file;
        std::unique_ptr<core::TraceWriter> writer;

        if (!opts.trace_file.empty()) {
            std::ostream* trace_out = &std::cout;
            if (opts.format == "null") {
                writer = std::make_unique<io::NullTraceWriter>();
            } else {
                if (opts.trace_file != "-") {
                    trace_file.open(opts.trace_file);
                    if (!trace_file) {
                        std::cerr << "Error: cannot open trace file: " << opts.trace_file
                                  << std::endl;
                        return 1;
                    }
                    trace_out = &trace_file;
                }
                if (opts.format == "text") {
                    writer = std::make_unique<io::TextualTraceWriter>(*trace_out);
                } else {
                    writer = std::make_unique<io::JsonTraceWriter>(*trace_out);
                }
            }
        }

        // 3. Run the batch
        std::size_t index = 0;
        sim::BatchHooks hooks;
        hooks.trace = writer.get();
        hooks.on_start = [&](const sim::RunParameters& params) {
            ++index;
            if (opts.verbose) {
                std::cerr << "Run " << index << "/" << plan.size() << ": " << describe(params)
                          << std::endl;
            }
        };
        hooks.on_finish = [&](const sim::RunReport& report) {
            if (!report.ok()) {
                std::cerr << "Run failed (" << describe(report.parameters)
                          << "): " << report.message << std::endl;
            } else if (opts.verbose) {
                std::cerr << "  " << report.tasks_created << " tasks, "
                          << report.events_dispatched << " events" << std::endl;
            }
        };
        if (opts.verbose) {
            hooks.on_progress = [](unsigned percent) {
                std::cerr << "  " << percent << "%" << std::endl;
            };
        }

        auto reports = sim::run_batch(config, plan, hooks);

        // 4. Finalize output
        if (auto* json = dynamic_cast<io::JsonTraceWriter*>(writer.get())) {
            json->finalize();
        }

        if (opts.summary_file == "-") {
            sim::write_batch_json(reports, std::cout);
        } else {
            std::ofstream summary_file(opts.summary_file);
            if (!summary_file) {
                std::cerr << "Error: cannot open summary file: " << opts.summary_file
                          << std::endl;
                return 1;
            }
            sim::write_batch_json(reports, summary_file);
        }

        auto failed = sim::failed_runs(reports);
        if (opts.verbose || failed > 0) {
            std::cerr << (reports.size() - failed) << "/" << reports.size()
                      << " runs completed" << std::endl;
        }
        return failed == 0 ? 0 : 1;
    }
    catch (const io::ConfigError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 78;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
