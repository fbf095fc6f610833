#pragma once

#include <stdexcept>
#include <string>

namespace offsim::core {

/// @brief Base exception for all simulation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing the run driver to mark a run as failed without confusing it
/// with other `std::runtime_error` exceptions.
///
/// Expected simulation outcomes (capacity or bandwidth rejection, mobility
/// failure) are never reported through exceptions; they are terminal task
/// states.
///
/// @see InvariantViolation, InvalidDelayError, OutOfRangeError, HandlerAlreadySetError
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an internal consistency check fails.
///
/// For example a mobility lookup with no covering keyframe, a clock
/// regression in the event loop, an event referencing an unknown task, or
/// an illegal lifecycle transition. The message carries the full context
/// (device id, task id, virtual time) needed to reproduce the failure.
///
/// @see SimulationError
/// @ingroup core
class InvariantViolation : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when an event is scheduled with a negative delay.
///
/// @see Engine::schedule, Engine::add_timer
/// @ingroup core
class InvalidDelayError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a value is outside its valid range.
///
/// For example requesting a device or resource that does not exist.
///
/// @ingroup core
class OutOfRangeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when setting a callback handler that has already been set.
///
/// @see Engine::set_task_event_handler
/// @ingroup core
class HandlerAlreadySetError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

} // namespace offsim::core
