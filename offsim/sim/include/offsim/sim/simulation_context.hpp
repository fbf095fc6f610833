#pragma once

#include <offsim/algo/vm_capacity_oracle.hpp>
#include <offsim/core/config.hpp>
#include <offsim/core/engine.hpp>
#include <offsim/core/mobility.hpp>
#include <offsim/core/network_model.hpp>
#include <offsim/core/offloading_manager.hpp>
#include <offsim/core/orchestration.hpp>
#include <offsim/core/statistics_sink.hpp>
#include <offsim/core/trace_writer.hpp>
#include <offsim/core/types.hpp>
#include <offsim/io/statistics.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>

namespace offsim::sim {

/// @brief Coordinates of one run inside a batch.
/// @ingroup sim_runs
struct RunParameters {
    std::size_t device_count{0};
    core::Scenario scenario{core::Scenario::SingleTier};
    std::string policy;
    uint32_t iteration{0};
};

/// @brief Independent random streams of one run.
/// @ingroup sim_runs
struct RunSeeds {
    uint32_t mobility{0};
    uint32_t load{0};
    uint64_t policy{0};
};

/// @brief Derive the random streams of a run from the base seed.
///
/// Every coordinate of @p parameters takes part, so two runs of a batch never
/// share a stream and the same coordinates always give the same streams.
///
/// @ingroup sim_runs
[[nodiscard]] RunSeeds derive_run_seeds(uint64_t seed, const RunParameters& parameters);

/// @brief Whether a run reached its horizon.
/// @ingroup sim_runs
enum class RunStatus {
    Ok,
    Failed,
};

/// @brief Result of one run.
/// @ingroup sim_runs
struct RunReport {
    RunParameters parameters;
    RunStatus status{RunStatus::Ok};
    std::string message;         ///< Error message of a failed run.
    uint64_t tasks_created{0};
    uint64_t events_dispatched{0};
    std::optional<io::SummaryStatistics> summary; ///< Empty for a failed run.

    [[nodiscard]] bool ok() const noexcept { return status == RunStatus::Ok; }
};

/// @brief Everything one simulation run owns.
///
/// Builds the engine, mobility timelines, VM oracle, network model, policy,
/// statistics and offloading manager for one set of RunParameters. Nothing
/// is shared between contexts, so independent runs can never observe each
/// other.
///
/// Construction raises io::ConfigError for an unknown policy name and
/// core::SimulationError for inputs the generators reject.
///
/// @code
/// SimulationContext context(config, RunParameters{100, Scenario::TwoTier, "WORST_FIT", 0});
/// RunReport report = context.run();
/// @endcode
///
/// @ingroup sim_runs
class SimulationContext {
public:
    /// @brief Called at every tenth of the horizon with the percentage reached.
    using ProgressCallback = std::function<void(unsigned percent)>;

    /// @param trace Optional trace writer, not owned.
    /// @param extra_sink Optional sink receiving every record next to the summary.
    SimulationContext(const core::SimulationConfig& config, RunParameters parameters,
                      core::TraceWriter* trace = nullptr,
                      core::StatisticsSink* extra_sink = nullptr);

    SimulationContext(const SimulationContext&) = delete;
    SimulationContext& operator=(const SimulationContext&) = delete;
    SimulationContext(SimulationContext&&) = delete;
    SimulationContext& operator=(SimulationContext&&) = delete;

    void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

    /// @brief Generate the load, run to the horizon and report.
    ///
    /// Tasks still in flight at the horizon are recorded as incomplete.
    ///
    /// @throws core::InvariantViolation if the context has already run.
    /// @throws core::SimulationError raised by any component during the run.
    [[nodiscard]] RunReport run();

    [[nodiscard]] const RunParameters& parameters() const noexcept { return parameters_; }
    [[nodiscard]] core::TimePoint horizon() const noexcept { return horizon_; }
    [[nodiscard]] core::Engine& engine() noexcept { return engine_; }
    [[nodiscard]] const core::MobilityModel& mobility() const noexcept { return mobility_; }
    [[nodiscard]] const algo::VmCapacityOracle& oracle() const noexcept { return oracle_; }
    [[nodiscard]] const io::SummaryStatistics& summary() const noexcept { return summary_; }

private:
    // Forwards every record to the summary and the optional extra sink
    class RecordFanout : public core::StatisticsSink {
    public:
        RecordFanout(core::StatisticsSink& primary, core::StatisticsSink* secondary)
            : primary_(primary)
            , secondary_(secondary) {}

        void record(const core::TaskRecord& record) override {
            primary_.record(record);
            if (secondary_) {
                secondary_->record(record);
            }
        }

    private:
        core::StatisticsSink& primary_;
        core::StatisticsSink* secondary_;
    };

    void schedule_arrivals();
    void schedule_load_sample(core::TimePoint when);
    void schedule_progress(unsigned percent);

    const core::SimulationConfig& config_;
    RunParameters parameters_;
    RunSeeds seeds_;
    core::TimePoint horizon_;
    std::mt19937 mobility_rng_;
    std::mt19937 load_rng_;

    core::Engine engine_;
    core::MobilityModel mobility_;
    algo::VmCapacityOracle oracle_;
    std::unique_ptr<core::NetworkModel> network_;
    std::unique_ptr<core::OrchestrationPolicy> policy_;
    io::SummaryStatistics summary_;
    RecordFanout sink_;
    core::TaskOffloadingManager manager_;

    ProgressCallback progress_;
    bool has_run_{false};
};

} // namespace offsim::sim
