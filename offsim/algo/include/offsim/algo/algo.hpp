#pragma once

/// @defgroup algo Algo Library
/// @brief Network delay models, generators, the VM oracle and placement.
///
/// The algo library implements the concrete collaborators of the core:
/// queueing-based network delay models, nomadic and random-waypoint
/// mobility generators, the idle/active task load generator, the VM
/// capacity oracle and the scenario-driven orchestration policy with its
/// VM selectors. Depends on core only.

/// @defgroup algo_network Network
/// @ingroup algo
/// @brief Queueing formulas and network delay models.

/// @defgroup algo_mobility Mobility
/// @ingroup algo
/// @brief Mobility timeline generators.

/// @defgroup algo_load Load
/// @ingroup algo
/// @brief Task arrival generation.

/// @defgroup algo_compute Compute
/// @ingroup algo
/// @brief VM capacity oracle.

/// @defgroup algo_selectors Selectors
/// @ingroup algo
/// @brief VM placement rules.

/// @defgroup algo_orchestration Orchestration
/// @ingroup algo
/// @brief Orchestration policies.

// Convenience header for Library 2 (offsim_algo)

#include <offsim/algo/access_point_load_network_model.hpp>
#include <offsim/algo/averaged_network_model.hpp>
#include <offsim/algo/basic_orchestration_policy.hpp>
#include <offsim/algo/contention_network_model.hpp>
#include <offsim/algo/load_generator.hpp>
#include <offsim/algo/mobility_generators.hpp>
#include <offsim/algo/queueing.hpp>
#include <offsim/algo/vm_capacity_oracle.hpp>
#include <offsim/algo/vm_selector.hpp>
