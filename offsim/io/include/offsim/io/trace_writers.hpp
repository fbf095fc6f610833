#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for simulation output.
///
/// Writers for the @ref core::TraceWriter interface: a no-op writer, a
/// streaming JSON array writer, an in-memory buffer for tests and
/// post-processing, and a one-line-per-event textual writer.
///
/// @ingroup io_writers

#include <offsim/core/trace_writer.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace offsim::io {

/// @brief Trace writer that discards all events.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Trace writer that streams JSON array elements to an output stream.
///
/// Writes one JSON object per trace event, e.g.
/// `{"time": 12.5, "type": "task_completed", "task": 7, ...}`, with the time
/// in seconds. Call @ref finalize to emit the closing bracket once the run is
/// complete.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter, TextualTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);

    /// @brief Destructor; calls @ref finalize if not already called.
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    /// @brief Add a string field; @p value is JSON-escaped.
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Write the closing bracket of the JSON array (idempotent).
    void finalize();

private:
    // JSON string literal of str, quotes included
    static std::string quote(std::string_view str);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool first_record_{true};
    bool finalized_{false};
};

/// @brief A single trace record stored in memory.
/// @ingroup io_writers
struct TraceRecord {
    double time{0.0};   ///< Simulation time of the event (seconds).
    std::string type;   ///< Event type identifier (e.g. "task_completed").
    std::unordered_map<std::string, std::variant<double, uint64_t, std::string>> fields;

    /// @brief Unsigned field @p key, or 0 when absent or of another type.
    [[nodiscard]] uint64_t uint_field(const std::string& key) const;
    /// @brief Floating-point field @p key, or 0.0 when absent or of another type.
    [[nodiscard]] double double_field(const std::string& key) const;
    /// @brief String field @p key, or an empty string when absent.
    [[nodiscard]] std::string string_field(const std::string& key) const;
};

/// @brief Trace writer that buffers all events in memory.
///
/// Used by the tests to inspect the task lifecycle programmatically.
///
/// @ingroup io_writers
/// @see TraceRecord
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Number of buffered records of type @p type.
    [[nodiscard]] std::size_t count(std::string_view type) const;

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable textual trace writer.
///
/// Formats each event as one line with aligned columns:
/// `[  timestamp] (+     delta)                 event_name: key = value, ...`
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit TextualTraceWriter(std::ostream& output);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    struct FieldEntry {
        std::string key;
        std::string value;
    };

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    double current_time_{0.0};
    double prev_time_{-1.0};
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

} // namespace offsim::io
