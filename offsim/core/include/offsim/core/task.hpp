#pragma once

#include <offsim/core/location.hpp>
#include <offsim/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace offsim::core {

/// @brief Lifecycle state of an offloaded task.
///
/// Non-terminal states follow the order
/// Created, Decided, Uploading, QueuedRemote, Executing, Downloading.
/// Completed and the three failure states are terminal.
///
/// @ingroup core_tasks
enum class TaskState : uint8_t {
    Created,
    Decided,
    Uploading,
    QueuedRemote,
    Executing,
    Downloading,
    Completed,
    RejectedCapacity,
    RejectedBandwidth,
    FailedMobility,
};

/// @brief Returns true for Completed and the failure states.
[[nodiscard]] bool is_terminal(TaskState state) noexcept;

/// @brief Short lowercase name used in traces and error messages.
[[nodiscard]] std::string_view to_string(TaskState state) noexcept;

/// @brief Execution tier a task is offloaded to.
/// @ingroup core_tasks
enum class Tier : uint8_t {
    Mobile, ///< Executed on the generating device itself.
    Edge,   ///< Executed on an edge host attached to an access point.
    Cloud,  ///< Executed in the remote cloud datacenter over the WAN.
};

/// @brief Short lowercase name of a tier.
[[nodiscard]] std::string_view to_string(Tier tier) noexcept;

/// @brief Reference to one compute resource (a VM) known to the oracle.
///
/// For edge resources `access_point` is the access point the hosting
/// datacenter is attached to. For mobile resources `host` is the device id.
///
/// @ingroup core_tasks
struct ResourceRef {
    Tier tier{Tier::Edge};
    uint32_t host{0};
    uint32_t vm{0};
    AccessPointId access_point{0};

    bool operator==(const ResourceRef&) const = default;
};

/// @brief Immutable parameters of a task drawn by the load generator.
/// @ingroup core_tasks
struct TaskProperties {
    DeviceId device{0};
    AppTypeId app_type{0};
    double length_mi{0.0};  ///< Computational length in million instructions.
    double input_kb{0.0};   ///< Upload size in KB.
    double output_kb{0.0};  ///< Download size in KB.
};

/// @brief Virtual times at which the task crossed each lifecycle boundary.
/// @ingroup core_tasks
struct TaskTimestamps {
    TimePoint created{};
    std::optional<TimePoint> upload_start;
    std::optional<TimePoint> upload_end;
    std::optional<TimePoint> exec_start;
    std::optional<TimePoint> exec_end;
    std::optional<TimePoint> download_start;
    std::optional<TimePoint> download_end;
};

/// @brief One task instance and its lifecycle state.
///
/// Tasks are owned by the TaskOffloadingManager. State changes go through
/// transition(), which rejects anything outside the lifecycle graph, in
/// particular any change out of a terminal state.
///
/// @see TaskOffloadingManager
/// @ingroup core_tasks
class Task {
public:
    /// @brief Construct a task in the Created state.
    Task(TaskId id, const TaskProperties& properties, TimePoint created);

    [[nodiscard]] TaskId id() const noexcept { return id_; }
    [[nodiscard]] DeviceId device() const noexcept { return properties_.device; }
    [[nodiscard]] AppTypeId app_type() const noexcept { return properties_.app_type; }
    [[nodiscard]] const TaskProperties& properties() const noexcept { return properties_; }
    [[nodiscard]] TaskState state() const noexcept { return state_; }
    [[nodiscard]] const TaskTimestamps& timestamps() const noexcept { return timestamps_; }
    [[nodiscard]] TaskTimestamps& timestamps() noexcept { return timestamps_; }

    /// @brief Move to @p next.
    /// @throws InvariantViolation if the transition is not part of the lifecycle.
    void transition(TaskState next);

    /// @brief Record the selected target. Only valid while Created.
    ///
    /// Also sets the tier to the tier of @p resource.
    ///
    /// @throws InvariantViolation if a resource was already assigned.
    void assign(const ResourceRef& resource);

    /// @brief Tier the policy decided on, also for a rejected task.
    [[nodiscard]] Tier tier() const noexcept { return tier_; }
    void set_tier(Tier tier) noexcept { tier_ = tier; }

    /// @brief Resource chosen by the orchestration policy, if any.
    [[nodiscard]] const std::optional<ResourceRef>& resource() const noexcept {
        return resource_;
    }

    /// @brief Location of the device when the upload started.
    [[nodiscard]] const std::optional<Location>& submitted_location() const noexcept {
        return submitted_location_;
    }

    void set_submitted_location(const Location& location) noexcept {
        submitted_location_ = location;
    }

private:
    TaskId id_;
    TaskProperties properties_;
    TaskState state_{TaskState::Created};
    TaskTimestamps timestamps_;
    std::optional<ResourceRef> resource_;
    Tier tier_{Tier::Edge};
    std::optional<Location> submitted_location_;
};

} // namespace offsim::core
