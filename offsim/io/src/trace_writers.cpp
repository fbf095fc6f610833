#include <offsim/io/trace_writers.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace offsim::io {

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(core::TimePoint /*time*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output) {
    output_ << "[\n";
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::begin(core::TimePoint time) {
    if (!first_record_) {
        output_ << ",\n";
    }
    first_record_ = false;
    output_ << "  {\"time\": " << std::setprecision(15) << core::time_to_seconds(time);
}

void JsonTraceWriter::type(std::string_view name) {
    output_ << ", \"type\": " << quote(name);
}

std::string JsonTraceWriter::quote(std::string_view str) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.String(str.data(), static_cast<rapidjson::SizeType>(str.size()));
    return {buffer.GetString(), buffer.GetSize()};
}

void JsonTraceWriter::field(std::string_view key, double value) {
    output_ << ", " << quote(key) << ": " << std::setprecision(15) << value;
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    output_ << ", " << quote(key) << ": " << value;
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    output_ << ", " << quote(key) << ": " << quote(value);
}

void JsonTraceWriter::end() {
    output_ << "}";
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    if (!first_record_) {
        output_ << "\n";
    }
    output_ << "]\n";
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// TraceRecord / MemoryTraceWriter
// =============================================================================

uint64_t TraceRecord::uint_field(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return 0;
    }
    const auto* value = std::get_if<uint64_t>(&it->second);
    return value ? *value : 0;
}

double TraceRecord::double_field(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return 0.0;
    }
    const auto* value = std::get_if<double>(&it->second);
    return value ? *value : 0.0;
}

std::string TraceRecord::string_field(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return {};
    }
    const auto* value = std::get_if<std::string>(&it->second);
    return value ? *value : std::string{};
}

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time = core::time_to_seconds(time);
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields[std::string(key)] = std::string(value);
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

std::size_t MemoryTraceWriter::count(std::string_view type) const {
    return static_cast<std::size_t>(std::count_if(
        records_.begin(), records_.end(),
        [type](const TraceRecord& record) { return record.type == type; }));
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output)
    : output_(output) {}

void TextualTraceWriter::begin(core::TimePoint time) {
    current_time_ = core::time_to_seconds(time);
    current_type_.clear();
    current_fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    current_fields_.push_back({std::string(key), oss.str()});
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.push_back({std::string(key), std::to_string(value)});
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.push_back({std::string(key), std::string(value)});
}

void TextualTraceWriter::end() {
    output_ << "[" << std::setw(12) << std::fixed << std::setprecision(6)
            << current_time_ << "] ";

    // Delta from previous event
    if (prev_time_ >= 0.0 && current_time_ != prev_time_) {
        output_ << "(+" << std::setw(11) << std::fixed << std::setprecision(6)
                << (current_time_ - prev_time_) << ") ";
    } else {
        output_ << "(            ) ";
    }

    output_ << std::setw(20) << std::right << current_type_ << ":";

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " " << current_fields_[i].key << " = " << current_fields_[i].value;
    }

    output_ << "\n";
    prev_time_ = current_time_;
}

} // namespace offsim::io
