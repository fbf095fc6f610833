#pragma once

/// @defgroup io I/O Library
/// @brief JSON configuration loading, trace output and statistics.
///
/// The I/O library handles all external data formats: loading the
/// simulation configuration from JSON, writing simulation traces (JSON,
/// textual, in-memory), and collecting per-task statistics into run
/// summaries. Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Configuration JSON loader.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory, and null trace writers.

/// @defgroup io_statistics Statistics
/// @ingroup io
/// @brief Statistics sinks and run summaries.

// Convenience header for Library 3 (I/O)

#include <offsim/io/config_loader.hpp>
#include <offsim/io/error.hpp>
#include <offsim/io/statistics.hpp>
#include <offsim/io/trace_writers.hpp>
