#pragma once

#include <offsim/core/event.hpp>
#include <offsim/core/trace_writer.hpp>
#include <offsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace offsim::core {

/// @brief Event-driven simulation engine (the event scheduler).
///
/// The Engine owns the virtual clock and the event priority queue. Events
/// are popped in `(time, sequence)` order and dispatched to their target:
/// task lifecycle events to the handler registered with
/// set_task_event_handler(), timer events to their callback. The clock only
/// moves forward; two runs issuing the same scheduling calls in the same
/// order dispatch in the same order.
///
/// The Engine is non-copyable and non-movable. A typical usage pattern is:
///
/// @code
/// core::Engine engine;
/// engine.set_task_event_handler([&](core::TaskEvent& ev) { manager.handle(ev); });
/// engine.schedule(core::duration_from_seconds(12.5), core::TaskCreatedEvent{props});
/// engine.run(core::time_from_seconds(3600.0));
/// @endcode
///
/// @see TaskOffloadingManager, TraceWriter
/// @ingroup core_engine
class Engine {
public:
    Engine() = default;
    ~Engine() = default;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    /// @brief Returns the current virtual time.
    [[nodiscard]] TimePoint time() const noexcept { return current_time_; }

    /// @brief Run until the event queue is empty or a stop is requested.
    void run();

    /// @brief Run until the given time point.
    ///
    /// Events scheduled after @p until stay queued (see pending_events())
    /// and the clock is set to @p until on return, unless the run was
    /// stopped by request_stop().
    ///
    /// @param until Last virtual time whose events are dispatched.
    /// @throws InvariantViolation if an event would move the clock backward.
    void run(TimePoint until);

    /// @brief Request the engine to stop after the current event.
    ///
    /// Auto-resets at the start of each run() call.
    void request_stop() noexcept { stop_requested_ = true; }

    /// @brief Returns true if a stop has been requested.
    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_; }

    /// @brief Schedule a task lifecycle event after @p delay.
    /// @param delay Offset from time(); must not be negative.
    /// @param event Payload delivered to the task event handler.
    /// @throws InvalidDelayError if @p delay is negative.
    void schedule(Duration delay, TaskEvent event);

    /// @brief Schedule a one-shot callback at an absolute time.
    /// @param when Virtual time to fire (must be >= time()).
    /// @param callback Invoked when the timer fires.
    /// @throws InvalidDelayError if @p when < time().
    void add_timer(TimePoint when, std::function<void()> callback);

    /// @brief Callback type for task lifecycle events.
    using TaskEventHandler = std::function<void(TaskEvent&)>;

    /// @brief Set the handler receiving all task lifecycle events.
    /// @throws HandlerAlreadySetError if called more than once.
    void set_task_event_handler(TaskEventHandler handler);

    /// @brief Set the trace writer. The Engine does not own it; nullptr disables tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    /// @tparam F Callable with signature void(TraceWriter&).
    template<typename F>
    void trace(F&& func);

    /// @brief Number of events still queued (abandoned once the run has stopped).
    [[nodiscard]] std::size_t pending_events() const noexcept { return event_queue_.size(); }

    /// @brief Number of events dispatched since construction.
    [[nodiscard]] uint64_t dispatched_events() const noexcept { return dispatched_; }

private:
    void enqueue(TimePoint when, Event event);
    void process_next();
    void dispatch_event(Event& event);

    TimePoint current_time_{};
    uint64_t sequence_{0};
    uint64_t dispatched_{0};
    bool stop_requested_{false};

    std::map<EventKey, Event> event_queue_;
    TraceWriter* trace_writer_{nullptr};
    TaskEventHandler task_event_handler_;
};

// Template implementation
template<typename F>
void Engine::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(current_time_);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace offsim::core
