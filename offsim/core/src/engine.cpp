#include <offsim/core/engine.hpp>
#include <offsim/core/error.hpp>

#include <string>
#include <type_traits>
#include <utility>

namespace offsim::core {

void Engine::run() {
    stop_requested_ = false;
    while (!event_queue_.empty() && !stop_requested_) {
        process_next();
    }
}

void Engine::run(TimePoint until) {
    stop_requested_ = false;
    while (!event_queue_.empty() && !stop_requested_) {
        // Check if next event is beyond our stop time
        if (event_queue_.begin()->first.time > until) {
            break;
        }
        process_next();
    }
    // A stopped run stays at the time of its last event
    if (!stop_requested_ && current_time_ < until) {
        current_time_ = until;
    }
}

void Engine::schedule(Duration delay, TaskEvent event) {
    if (delay < Duration::zero()) {
        throw InvalidDelayError("Cannot schedule event with negative delay (" +
                                std::to_string(delay.seconds()) + " s)");
    }
    enqueue(current_time_ + delay, Event{std::move(event)});
}

void Engine::add_timer(TimePoint when, std::function<void()> callback) {
    if (when < current_time_) {
        throw InvalidDelayError("Timer must be scheduled in the future (when >= time())");
    }
    enqueue(when, TimerEvent{std::move(callback)});
}

void Engine::set_task_event_handler(TaskEventHandler handler) {
    if (task_event_handler_) {
        throw HandlerAlreadySetError("Task event handler already set");
    }
    task_event_handler_ = std::move(handler);
}

void Engine::enqueue(TimePoint when, Event event) {
    EventKey key{when, sequence_++};
    event_queue_.emplace(key, std::move(event));
}

void Engine::process_next() {
    auto it = event_queue_.begin();
    if (it->first.time < current_time_) {
        throw InvariantViolation("Clock regression: event at " +
                                 std::to_string(time_to_seconds(it->first.time)) +
                                 " s popped at " + std::to_string(time_to_seconds(current_time_)) +
                                 " s");
    }
    current_time_ = it->first.time;

    Event event = std::move(it->second);
    event_queue_.erase(it);

    ++dispatched_;
    dispatch_event(event);
}

void Engine::dispatch_event(Event& event) {
    std::visit([this](auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, TaskEvent>) {
            if (!task_event_handler_) {
                throw InvariantViolation("Task event dispatched with no task event handler set");
            }
            task_event_handler_(ev);
        } else if constexpr (std::is_same_v<T, TimerEvent>) {
            if (ev.callback) {
                ev.callback();
            }
        } else {
            static_assert(dependent_false_v<T>, "unhandled event type");
        }
    }, event);
}

} // namespace offsim::core
