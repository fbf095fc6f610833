#include <offsim/core/offloading_manager.hpp>
#include <offsim/core/compute_oracle.hpp>
#include <offsim/core/engine.hpp>
#include <offsim/core/error.hpp>
#include <offsim/core/mobility.hpp>
#include <offsim/core/network_model.hpp>
#include <offsim/core/orchestration.hpp>

#include <string>
#include <type_traits>

namespace offsim::core {

namespace {

double elapsed(const std::optional<TimePoint>& from, const std::optional<TimePoint>& to) {
    if (!from || !to) {
        return 0.0;
    }
    return (*to - *from).seconds();
}

Stage stage_of(TaskState state) noexcept {
    switch (state) {
    case TaskState::Uploading:
        return Stage::Upload;
    case TaskState::QueuedRemote:
    case TaskState::Executing:
        return Stage::Execution;
    case TaskState::Downloading:
        return Stage::Download;
    default:
        return Stage::Decision;
    }
}

std::string_view trace_type(Outcome outcome) noexcept {
    switch (outcome) {
    case Outcome::Completed: return "task_completed";
    case Outcome::FailedMobility: return "task_failed";
    case Outcome::Incomplete: return "task_incomplete";
    default: return "task_rejected";
    }
}

} // namespace

TaskOffloadingManager::TaskOffloadingManager(Engine& engine, const MobilityModel& mobility,
                                             NetworkModel& network,
                                             ComputeResourceOracle& resources,
                                             OrchestrationPolicy& policy, StatisticsSink& sink)
    : engine_(engine)
    , mobility_(mobility)
    , network_(network)
    , resources_(resources)
    , policy_(policy)
    , sink_(sink) {
    engine_.set_task_event_handler([this](TaskEvent& ev) { handle(ev); });
}

void TaskOffloadingManager::handle(TaskEvent& event) {
    std::visit([this](auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, TaskCreatedEvent>) {
            on_created(ev);
        } else if constexpr (std::is_same_v<T, UploadCompletedEvent>) {
            on_upload_completed(ev);
        } else if constexpr (std::is_same_v<T, ExecutionCompletedEvent>) {
            on_execution_completed(ev);
        } else if constexpr (std::is_same_v<T, DownloadCompletedEvent>) {
            on_download_completed(ev);
        } else {
            static_assert(dependent_false_v<T>, "unhandled task event");
        }
    }, event);
}

void TaskOffloadingManager::on_created(const TaskCreatedEvent& ev) {
    TimePoint now = engine_.time();
    TaskId id = next_id_++;
    auto [it, inserted] = tasks_.emplace(id, Task{id, ev.properties, now});
    Task& task = it->second;

    engine_.trace([&](TraceWriter& w) {
        w.type("task_created");
        w.field("task_id", static_cast<uint64_t>(id));
        w.field("device_id", static_cast<uint64_t>(task.device()));
        w.field("app_type", static_cast<uint64_t>(task.app_type()));
    });

    Location here = mobility_.location(task.device(), now);
    SystemSnapshot snapshot{now, here, resources_};
    OrchestrationDecision decision = policy_.select_target(task, snapshot);
    task.set_tier(decision.tier);
    if (decision.rejected()) {
        terminate(task, TaskState::RejectedCapacity, Outcome::RejectedCapacity, Stage::Decision);
        return;
    }

    const ResourceRef target = *decision.resource;
    task.assign(target);
    task.transition(TaskState::Decided);
    task.set_submitted_location(here);

    engine_.trace([&](TraceWriter& w) {
        w.type("task_decided");
        w.field("task_id", static_cast<uint64_t>(id));
        w.field("tier", to_string(target.tier));
        w.field("host", static_cast<uint64_t>(target.host));
        w.field("vm", static_cast<uint64_t>(target.vm));
    });

    if (target.tier == Tier::Mobile) {
        task.transition(TaskState::QueuedRemote);
        start_execution(task);
        return;
    }

    double delay = network_.upload_delay(task, here, target, now);
    if (delay <= 0.0) {
        terminate(task, TaskState::RejectedBandwidth, Outcome::RejectedBandwidth, Stage::Upload);
        return;
    }

    network_.upload_started(here, target);
    task.timestamps().upload_start = now;
    task.transition(TaskState::Uploading);

    engine_.trace([&](TraceWriter& w) {
        w.type("upload_started");
        w.field("task_id", static_cast<uint64_t>(id));
        w.field("access_point", static_cast<uint64_t>(here.access_point));
        w.field("delay", delay);
    });

    engine_.schedule(duration_from_seconds(delay), UploadCompletedEvent{id});
}

void TaskOffloadingManager::on_upload_completed(const UploadCompletedEvent& ev) {
    Task& task = find(ev.task);
    if (task.state() != TaskState::Uploading) {
        throw InvariantViolation("Task " + std::to_string(task.id()) +
                                 ": upload completed while " +
                                 std::string(to_string(task.state())));
    }

    network_.upload_finished(*task.submitted_location(), *task.resource());
    task.timestamps().upload_end = engine_.time();
    task.transition(TaskState::QueuedRemote);
    start_execution(task);
}

void TaskOffloadingManager::start_execution(Task& task) {
    const ResourceRef& target = *task.resource();
    auto estimate = resources_.bind(target, task);
    if (!estimate) {
        terminate(task, TaskState::RejectedCapacity, Outcome::RejectedCapacity, Stage::Execution);
        return;
    }

    task.transition(TaskState::Executing);
    task.timestamps().exec_start = engine_.time();

    engine_.trace([&](TraceWriter& w) {
        w.type("task_bound");
        w.field("task_id", static_cast<uint64_t>(task.id()));
        w.field("service_time", estimate->service_time.seconds());
        w.field("utilization", estimate->utilization);
    });

    engine_.schedule(estimate->service_time, ExecutionCompletedEvent{task.id()});
}

void TaskOffloadingManager::on_execution_completed(const ExecutionCompletedEvent& ev) {
    Task& task = find(ev.task);
    if (task.state() != TaskState::Executing) {
        throw InvariantViolation("Task " + std::to_string(task.id()) +
                                 ": execution completed while " +
                                 std::string(to_string(task.state())));
    }

    TimePoint now = engine_.time();
    const ResourceRef target = *task.resource();
    task.timestamps().exec_end = now;
    resources_.release(target, task);

    engine_.trace([&](TraceWriter& w) {
        w.type("execution_finished");
        w.field("task_id", static_cast<uint64_t>(task.id()));
    });

    if (target.tier == Tier::Mobile) {
        terminate(task, TaskState::Completed, Outcome::Completed, Stage::Execution);
        return;
    }

    Location here = mobility_.location(task.device(), now);
    double delay = network_.download_delay(task, here, target, now);
    if (delay <= 0.0) {
        terminate(task, TaskState::RejectedBandwidth, Outcome::RejectedBandwidth, Stage::Download);
        return;
    }

    // Delivery goes through the access point used for the upload
    Duration transfer = duration_from_seconds(delay);
    const Location& submitted = *task.submitted_location();
    Location arrival = mobility_.location(task.device(), now + transfer);
    if (arrival.access_point != submitted.access_point) {
        terminate(task, TaskState::FailedMobility, Outcome::FailedMobility, Stage::Download);
        return;
    }

    network_.download_started(submitted, target);
    task.timestamps().download_start = now;
    task.transition(TaskState::Downloading);

    engine_.trace([&](TraceWriter& w) {
        w.type("download_started");
        w.field("task_id", static_cast<uint64_t>(task.id()));
        w.field("delay", delay);
    });

    engine_.schedule(transfer, DownloadCompletedEvent{task.id()});
}

void TaskOffloadingManager::on_download_completed(const DownloadCompletedEvent& ev) {
    Task& task = find(ev.task);
    if (task.state() != TaskState::Downloading) {
        throw InvariantViolation("Task " + std::to_string(task.id()) +
                                 ": download completed while " +
                                 std::string(to_string(task.state())));
    }

    network_.download_finished(*task.submitted_location(), *task.resource());
    task.timestamps().download_end = engine_.time();
    terminate(task, TaskState::Completed, Outcome::Completed, Stage::Download);
}

Task& TaskOffloadingManager::find(TaskId id) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        throw InvariantViolation("Event for task " + std::to_string(id) +
                                 " which is not in flight at " +
                                 std::to_string(time_to_seconds(engine_.time())) + " s");
    }
    return it->second;
}

void TaskOffloadingManager::terminate(Task& task, TaskState state, Outcome outcome, Stage stage) {
    task.transition(state);
    emit(task, outcome, stage);
    tasks_.erase(task.id());
}

void TaskOffloadingManager::emit(const Task& task, Outcome outcome, Stage stage) {
    const auto& ts = task.timestamps();
    const auto& props = task.properties();

    TaskRecord record;
    record.task = task.id();
    record.device = props.device;
    record.app_type = props.app_type;
    record.tier = task.tier();
    record.input_kb = props.input_kb;
    record.output_kb = props.output_kb;
    record.length_mi = props.length_mi;
    record.created_at = time_to_seconds(ts.created);
    record.finished_at = time_to_seconds(engine_.time());
    record.upload_delay = elapsed(ts.upload_start, ts.upload_end);
    record.exec_delay = elapsed(ts.exec_start, ts.exec_end);
    record.download_delay = elapsed(ts.download_start, ts.download_end);
    record.outcome = outcome;
    record.stage = stage;

    engine_.trace([&](TraceWriter& w) {
        w.type(trace_type(outcome));
        w.field("task_id", record.task);
        w.field("outcome", to_string(outcome));
        w.field("stage", to_string(stage));
    });

    sink_.record(record);
}

void TaskOffloadingManager::finish() {
    for (const auto& [id, task] : tasks_) {
        emit(task, Outcome::Incomplete, stage_of(task.state()));
    }
    tasks_.clear();
}

} // namespace offsim::core
