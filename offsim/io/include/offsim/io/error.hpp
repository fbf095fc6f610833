#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the offsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace offsim::io {

/// @brief Exception for configuration errors (loading, parsing, validation).
///
/// Thrown by the loader when JSON input is malformed, required fields are
/// missing, or values fail semantic validation (e.g. a negative bandwidth).
/// Raised before any run starts.
///
/// @ingroup io
/// @see load_config
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a ConfigError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Additional context such as the file path or field path.
    ConfigError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace offsim::io
