#pragma once

/// @defgroup sim Sim Library
/// @brief Assembly and execution of simulation runs.
///
/// The sim library wires the concrete algo components into a per-run
/// SimulationContext and executes batches of independent runs. Depends on
/// core, algo and io.

/// @defgroup sim_factories Factories
/// @ingroup sim
/// @brief Component construction from the configuration.

/// @defgroup sim_runs Runs
/// @ingroup sim
/// @brief Per-run context, seeds and reports.

/// @defgroup sim_batch Batch
/// @ingroup sim
/// @brief Batch plans and the batch runner.

// Convenience header for Library 4 (offsim_sim)

#include <offsim/sim/batch_runner.hpp>
#include <offsim/sim/factories.hpp>
#include <offsim/sim/simulation_context.hpp>
