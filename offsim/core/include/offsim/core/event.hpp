#pragma once

#include <offsim/core/task.hpp>
#include <offsim/core/types.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <type_traits>
#include <variant>

namespace offsim::core {

/// @brief Deterministic ordering key for events in the priority queue.
///
/// Events are ordered by virtual time, then by the sequence number the
/// engine assigns at scheduling time. Events sharing a timestamp therefore
/// fire in the order they were scheduled.
///
/// @see Engine::schedule
/// @ingroup core_events
struct EventKey {
    TimePoint time;      ///< Primary: virtual time at which the event fires.
    uint64_t sequence;   ///< Secondary: scheduling order.

    /// @cond INTERNAL
    auto operator<=>(const EventKey&) const = default;
    /// @endcond
};

/// @brief A device generates a new task.
///
/// Produced by the load generator before the run starts; the handler
/// creates the Task and asks the orchestration policy for a target.
///
/// @ingroup core_events
struct TaskCreatedEvent {
    TaskProperties properties;
};

/// @brief The input data of a task has reached its target.
/// @ingroup core_events
struct UploadCompletedEvent {
    TaskId task;
};

/// @brief A task finished executing on its bound resource.
/// @ingroup core_events
struct ExecutionCompletedEvent {
    TaskId task;
};

/// @brief The result of a task has been delivered to the device.
/// @ingroup core_events
struct DownloadCompletedEvent {
    TaskId task;
};

/// @brief Closed set of events addressed to the task lifecycle handler.
///
/// The alternative is the event tag. Handlers visit it exhaustively so a new
/// alternative fails to compile until every handler deals with it.
///
/// @see Engine::set_task_event_handler, TaskOffloadingManager
/// @ingroup core_events
using TaskEvent = std::variant<
    TaskCreatedEvent,
    UploadCompletedEvent,
    ExecutionCompletedEvent,
    DownloadCompletedEvent
>;

/// @brief A one-shot driver callback fires.
///
/// Created by Engine::add_timer(). Used by the run driver for periodic
/// load sampling, progress reporting and the stop at the horizon.
///
/// @ingroup core_events
struct TimerEvent {
    std::function<void()> callback;  ///< Callback to invoke.
};

/// @brief Variant holding every event the engine can queue.
///
/// The outer alternative names the target entity (the task lifecycle
/// handler or the timer owner), the inner one the tag.
///
/// @ingroup core_events
using Event = std::variant<TaskEvent, TimerEvent>;

/// @cond INTERNAL
/// Helper to make `if constexpr` visitor chains exhaustive.
template<typename>
inline constexpr bool dependent_false_v = false;
/// @endcond

} // namespace offsim::core
