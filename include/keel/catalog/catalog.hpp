#pragma once

/// @file catalog.hpp
/// @brief Main include header for keel_catalog
///
/// Service catalog dependency engine:
/// - DependencyGraph: interned adjacency with edge metadata
/// - Cycle detection, transitive closure, Kahn ordering
/// - Impact and critical-impact analysis
/// - SemVer compatibility and dependency policy
/// - Catalog validation and service state machine
/// - Lifecycle ordering and deletion safety
/// - ServiceRegistry with snapshot-based analyses

#include "fwd.hpp"
#include "version.hpp"
#include "dependency_graph.hpp"
#include "graph_algorithms.hpp"
#include "impact.hpp"
#include "service.hpp"
#include "schema.hpp"
#include "dependency_validator.hpp"
#include "validation.hpp"
#include "lifecycle.hpp"
#include "config_store.hpp"
#include "config.hpp"
#include "registry.hpp"

namespace keel_catalog {

/// Library version
inline constexpr const char* kVersion = "0.1.0";

} // namespace keel_catalog
