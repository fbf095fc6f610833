#pragma once

#include <offsim/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace offsim::core {

/// @brief Abstract interface for recording simulation trace events.
/// @ingroup core
///
/// Implementations serialise simulation events to a specific format (JSON,
/// text, memory buffer). Each trace record is built incrementally:
///   1. begin() -- opens a new record at a given virtual time
///   2. type()  -- sets the event type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// The Engine holds an optional pointer to a TraceWriter. When no writer
/// is installed the overhead is a single null-pointer check.
///
/// @see Engine::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Begin a new trace record at the given virtual time.
    virtual void begin(TimePoint time) = 0;

    /// @brief Set the event type name for the current record
    ///        (e.g. `"task_created"`, `"task_failed"`, `"vm_load"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add an unsigned integer field to the current record.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record and flush if needed.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace offsim::core
