#pragma once

#include <offsim/core/task.hpp>
#include <offsim/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace offsim::core {

/// @brief Final outcome of a task.
/// @ingroup core_statistics
enum class Outcome : uint8_t {
    Completed,
    RejectedCapacity,
    RejectedBandwidth,
    FailedMobility,
    Incomplete, ///< Still in flight when the run stopped.
};

/// @brief Lifecycle step at which a task ended.
/// @ingroup core_statistics
enum class Stage : uint8_t {
    Decision,
    Upload,
    Execution,
    Download,
};

[[nodiscard]] std::string_view to_string(Outcome outcome) noexcept;
[[nodiscard]] std::string_view to_string(Stage stage) noexcept;

/// @brief Statistics record emitted once per task.
///
/// Delays are in seconds and are zero for phases the task never finished.
///
/// @ingroup core_statistics
struct TaskRecord {
    TaskId task{0};
    DeviceId device{0};
    AppTypeId app_type{0};
    Tier tier{Tier::Edge};
    double input_kb{0.0};
    double output_kb{0.0};
    double length_mi{0.0};
    double created_at{0.0};
    double finished_at{0.0};
    double upload_delay{0.0};
    double exec_delay{0.0};
    double download_delay{0.0};
    Outcome outcome{Outcome::Incomplete};
    Stage stage{Stage::Decision};
};

/// @brief Consumer of per-task statistics records.
/// @ingroup core_statistics
class StatisticsSink {
public:
    virtual ~StatisticsSink() = default;

    /// @brief Called exactly once per task when it leaves the system.
    virtual void record(const TaskRecord& record) = 0;

protected:
    StatisticsSink() = default;
    StatisticsSink(const StatisticsSink&) = default;
    StatisticsSink& operator=(const StatisticsSink&) = default;
};

} // namespace offsim::core
