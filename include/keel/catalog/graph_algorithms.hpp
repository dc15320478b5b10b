#pragma once

/// @file graph_algorithms.hpp
/// @brief Cycle detection, subgraph extraction and topological ordering
///
/// All traversals are iterative with explicit frame stacks, so graph depth
/// is bounded by heap memory rather than the call stack.

#include "fwd.hpp"
#include "dependency_graph.hpp"
#include <keel/core/error.hpp>

#include <optional>
#include <string>
#include <vector>

namespace keel_catalog {

// =============================================================================
// CycleInfo
// =============================================================================

/// A dependency cycle; path.front() == path.back()
struct CycleInfo {
    std::vector<std::string> path;
    std::string description;

    /// Format a path as "a -> b -> a"
    [[nodiscard]] static std::string format_path(const std::vector<std::string>& path);
};

// =============================================================================
// Algorithms
// =============================================================================

/// Find the first cycle, trying every node as a DFS root in insertion order
[[nodiscard]] std::optional<CycleInfo> detect_cycles(const DependencyGraph& graph);

/// Same as detect_cycles, restricted to nodes with mask[index] == true
[[nodiscard]] std::optional<CycleInfo> detect_cycles(
    const DependencyGraph& graph, const std::vector<bool>& mask);

/// Every node reachable from roots (roots included), in discovery order
[[nodiscard]] std::vector<NodeIndex> transitive_closure(
    const DependencyGraph& graph, const std::vector<NodeIndex>& roots);

/// Kahn ordering of the masked subgraph, dependencies before dependents
///
/// Fails with an InternalInvariant error if the subgraph is not acyclic.
[[nodiscard]] keel_core::Result<std::vector<std::string>> topological_sort(
    const DependencyGraph& graph, const std::vector<bool>& mask);

/// Order the transitive closure of roots so every dependency precedes its
/// dependents
///
/// Errors:
/// - ServiceNotFound if a root is not a node
/// - Cycle if the closure contains a cycle
[[nodiscard]] keel_core::Result<std::vector<std::string>> resolve_order(
    const DependencyGraph& graph, const std::vector<std::string>& roots);

} // namespace keel_catalog
