#pragma once

#include <offsim/core/config.hpp>
#include <offsim/core/orchestration.hpp>
#include <offsim/core/trace_writer.hpp>
#include <offsim/sim/simulation_context.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace offsim::sim {

/// @brief Cartesian product of run coordinates executed by run_batch().
/// @ingroup sim_batch
struct BatchPlan {
    std::vector<std::size_t> device_counts;
    std::vector<core::Scenario> scenarios;
    std::vector<std::string> policies;
    uint32_t iterations{1};

    /// @brief Number of runs in the plan.
    [[nodiscard]] std::size_t size() const noexcept {
        return device_counts.size() * scenarios.size() * policies.size() * iterations;
    }
};

/// @brief Build the plan described by the `simulation` section.
/// @throws io::ConfigError on an unknown scenario name or an empty list.
/// @ingroup sim_batch
[[nodiscard]] BatchPlan plan_from_config(const core::SimulationConfig& config);

/// @brief Optional observers of a batch.
/// @ingroup sim_batch
struct BatchHooks {
    core::TraceWriter* trace{nullptr};                      ///< Shared by all runs, not owned.
    std::function<void(const RunParameters&)> on_start;
    std::function<void(const RunReport&)> on_finish;
    SimulationContext::ProgressCallback on_progress;
};

/// @brief Execute every run of @p plan sequentially.
///
/// Runs are ordered by iteration, then device count, scenario and policy.
/// A run that raises core::SimulationError or io::ConfigError is reported as
/// Failed with the error message; the remaining runs still execute.
///
/// @ingroup sim_batch
[[nodiscard]] std::vector<RunReport> run_batch(const core::SimulationConfig& config,
                                               const BatchPlan& plan,
                                               const BatchHooks& hooks = {});

/// @brief Number of failed runs in @p reports.
/// @ingroup sim_batch
[[nodiscard]] std::size_t failed_runs(const std::vector<RunReport>& reports) noexcept;

/// @brief Serialise batch reports as a JSON array.
/// @ingroup sim_batch
[[nodiscard]] std::string batch_to_json(const std::vector<RunReport>& reports);

void write_batch_json(const std::vector<RunReport>& reports, std::ostream& out);

} // namespace offsim::sim
