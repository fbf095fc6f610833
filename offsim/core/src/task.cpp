#include <offsim/core/task.hpp>
#include <offsim/core/error.hpp>

#include <string>

namespace offsim::core {

namespace {

bool allowed(TaskState from, TaskState to) noexcept {
    switch (from) {
    case TaskState::Created:
        return to == TaskState::Decided || to == TaskState::RejectedCapacity;
    case TaskState::Decided:
        // QueuedRemote directly: local execution skips the upload
        return to == TaskState::Uploading || to == TaskState::QueuedRemote ||
               to == TaskState::RejectedBandwidth;
    case TaskState::Uploading:
        return to == TaskState::QueuedRemote;
    case TaskState::QueuedRemote:
        return to == TaskState::Executing || to == TaskState::RejectedCapacity;
    case TaskState::Executing:
        return to == TaskState::Downloading || to == TaskState::Completed ||
               to == TaskState::RejectedBandwidth || to == TaskState::FailedMobility;
    case TaskState::Downloading:
        return to == TaskState::Completed;
    case TaskState::Completed:
    case TaskState::RejectedCapacity:
    case TaskState::RejectedBandwidth:
    case TaskState::FailedMobility:
        return false;
    }
    return false;
}

} // namespace

bool is_terminal(TaskState state) noexcept {
    switch (state) {
    case TaskState::Completed:
    case TaskState::RejectedCapacity:
    case TaskState::RejectedBandwidth:
    case TaskState::FailedMobility:
        return true;
    default:
        return false;
    }
}

std::string_view to_string(TaskState state) noexcept {
    switch (state) {
    case TaskState::Created: return "created";
    case TaskState::Decided: return "decided";
    case TaskState::Uploading: return "uploading";
    case TaskState::QueuedRemote: return "queued_remote";
    case TaskState::Executing: return "executing";
    case TaskState::Downloading: return "downloading";
    case TaskState::Completed: return "completed";
    case TaskState::RejectedCapacity: return "rejected_capacity";
    case TaskState::RejectedBandwidth: return "rejected_bandwidth";
    case TaskState::FailedMobility: return "failed_mobility";
    }
    return "unknown";
}

std::string_view to_string(Tier tier) noexcept {
    switch (tier) {
    case Tier::Mobile: return "mobile";
    case Tier::Edge: return "edge";
    case Tier::Cloud: return "cloud";
    }
    return "unknown";
}

Task::Task(TaskId id, const TaskProperties& properties, TimePoint created)
    : id_(id)
    , properties_(properties) {
    timestamps_.created = created;
}

void Task::transition(TaskState next) {
    if (!allowed(state_, next)) {
        throw InvariantViolation("Task " + std::to_string(id_) + ": illegal transition " +
                                 std::string(to_string(state_)) + " -> " +
                                 std::string(to_string(next)));
    }
    state_ = next;
}

void Task::assign(const ResourceRef& resource) {
    if (resource_ || state_ != TaskState::Created) {
        throw InvariantViolation("Task " + std::to_string(id_) +
                                 ": resource assigned outside the decision step");
    }
    resource_ = resource;
    tier_ = resource.tier;
}

} // namespace offsim::core
