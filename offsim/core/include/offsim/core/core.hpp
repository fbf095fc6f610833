#pragma once

/// @defgroup core Core Library
/// @brief Event scheduler, mobility timelines, task lifecycle and the
///        collaborator interfaces.
///
/// The core library provides the offloading simulation core: the
/// deterministic event-driven Engine, per-device mobility timelines, the
/// task state machine driven by the TaskOffloadingManager, and the
/// interfaces of its collaborators (network model, compute oracle,
/// orchestration policy, statistics sink). It has no dependencies on
/// concrete models or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for virtual time and identifiers.

/// @defgroup core_engine Engine
/// @ingroup core
/// @brief Event-driven simulation loop and timer API.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Event keys and the closed event variants.

/// @defgroup core_mobility Mobility
/// @ingroup core
/// @brief Locations, access points and mobility timelines.

/// @defgroup core_tasks Tasks
/// @ingroup core
/// @brief Task state machine and the offloading manager.

/// @defgroup core_network Network
/// @ingroup core
/// @brief Network delay model interface and link counters.

/// @defgroup core_compute Compute
/// @ingroup core
/// @brief Compute resource oracle interface.

/// @defgroup core_orchestration Orchestration
/// @ingroup core
/// @brief Orchestration policy interface and decisions.

/// @defgroup core_statistics Statistics
/// @ingroup core
/// @brief Per-task records and the statistics sink interface.

/// @defgroup core_config Configuration
/// @ingroup core
/// @brief Immutable simulation configuration.

// Convenience header for Library 1
#include <offsim/core/types.hpp>
#include <offsim/core/error.hpp>
#include <offsim/core/event.hpp>
#include <offsim/core/trace_writer.hpp>
#include <offsim/core/config.hpp>

#include <offsim/core/location.hpp>
#include <offsim/core/mobility.hpp>
#include <offsim/core/task.hpp>
#include <offsim/core/network_model.hpp>
#include <offsim/core/network_link_state.hpp>
#include <offsim/core/compute_oracle.hpp>
#include <offsim/core/orchestration.hpp>
#include <offsim/core/statistics_sink.hpp>
#include <offsim/core/offloading_manager.hpp>

#include <offsim/core/engine.hpp>
