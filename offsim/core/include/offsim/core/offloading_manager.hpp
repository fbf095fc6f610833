#pragma once

#include <offsim/core/event.hpp>
#include <offsim/core/statistics_sink.hpp>
#include <offsim/core/task.hpp>
#include <offsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>

namespace offsim::core {

class ComputeResourceOracle;
class Engine;
class MobilityModel;
class NetworkModel;
class OrchestrationPolicy;

/// @brief Drives every task through its lifecycle.
///
/// The manager registers itself as the engine's task event handler and owns
/// all tasks in flight. For a task offloaded to the edge or the cloud:
///
///  1. creation: ask the policy for a target (none: RejectedCapacity)
///  2. upload: ask the network for the upload delay (saturated:
///     RejectedBandwidth), remember the device location, schedule arrival
///  3. arrival: bind the task on the oracle (full: RejectedCapacity),
///     schedule the end of execution
///  4. execution end: release the VM, ask for the download delay (saturated:
///     RejectedBandwidth) and check that the device is still served by the
///     access point it uploaded from once the download would finish
///     (otherwise FailedMobility), schedule delivery
///  5. delivery: Completed
///
/// A task placed on its own device skips both transfers. Each task produces
/// exactly one TaskRecord; rejections and failures are outcomes, not errors.
///
/// @see Engine, StatisticsSink
/// @ingroup core_tasks
class TaskOffloadingManager {
public:
    /// @throws HandlerAlreadySetError if @p engine already has a task event handler.
    TaskOffloadingManager(Engine& engine, const MobilityModel& mobility, NetworkModel& network,
                          ComputeResourceOracle& resources, OrchestrationPolicy& policy,
                          StatisticsSink& sink);

    TaskOffloadingManager(const TaskOffloadingManager&) = delete;
    TaskOffloadingManager& operator=(const TaskOffloadingManager&) = delete;
    TaskOffloadingManager(TaskOffloadingManager&&) = delete;
    TaskOffloadingManager& operator=(TaskOffloadingManager&&) = delete;

    /// @brief Dispatch one lifecycle event.
    /// @throws InvariantViolation if the event names a task that is not in flight.
    void handle(TaskEvent& event);

    /// @brief Emit an Incomplete record for every task still in flight.
    ///
    /// Called once when the run stops; tasks are reported in id order.
    void finish();

    [[nodiscard]] std::size_t in_flight() const noexcept { return tasks_.size(); }
    [[nodiscard]] uint64_t created() const noexcept { return next_id_; }

private:
    void on_created(const TaskCreatedEvent& ev);
    void on_upload_completed(const UploadCompletedEvent& ev);
    void on_execution_completed(const ExecutionCompletedEvent& ev);
    void on_download_completed(const DownloadCompletedEvent& ev);

    void start_execution(Task& task);
    Task& find(TaskId id);
    void terminate(Task& task, TaskState state, Outcome outcome, Stage stage);
    void emit(const Task& task, Outcome outcome, Stage stage);

    Engine& engine_;
    const MobilityModel& mobility_;
    NetworkModel& network_;
    ComputeResourceOracle& resources_;
    OrchestrationPolicy& policy_;
    StatisticsSink& sink_;

    std::map<TaskId, Task> tasks_;
    TaskId next_id_{0};
};

} // namespace offsim::core
