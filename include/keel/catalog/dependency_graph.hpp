#pragma once

/// @file dependency_graph.hpp
/// @brief Directed dependency graph with interned service names
///
/// Nodes are services, edges point from a dependent to its dependency.
/// Service names are interned to dense NodeIndex values when first added;
/// all traversal algorithms work on indices and only translate back to names
/// at their public boundary.
///
/// The graph is a derived value. It is rebuilt from the current set of
/// service records for every analysis and never persisted.

#include "fwd.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace keel_catalog {

/// Sentinel for "no node"
inline constexpr NodeIndex kInvalidNode = std::numeric_limits<NodeIndex>::max();

// =============================================================================
// Edges
// =============================================================================

/// Properties of a single dependency edge
struct EdgeMetadata {
    bool required = true;
    std::optional<std::string> version_constraint;
};

/// Outgoing edge (in reverse adjacency, target is the dependent)
struct Edge {
    NodeIndex target = kInvalidNode;
    EdgeMetadata metadata;
};

// =============================================================================
// DependencyGraph
// =============================================================================

class DependencyGraph {
public:
    struct Node {
        std::string name;
        std::string declared_version;
        std::vector<Edge> edges;
    };

    DependencyGraph() = default;

    // =========================================================================
    // Construction
    // =========================================================================

    /// Add a node (idempotent), returning its index
    NodeIndex add_node(const std::string& name);

    /// Add a node and record its declared version
    NodeIndex add_node(const std::string& name, const std::string& declared_version);

    /// Add an edge from -> to, creating either endpoint if absent
    void add_edge(const std::string& from, const std::string& to, EdgeMetadata metadata = {});

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& name) const;

    [[nodiscard]] std::optional<NodeIndex> index_of(const std::string& name) const;

    /// Name for an index (throws std::out_of_range for foreign indices)
    [[nodiscard]] const std::string& name_of(NodeIndex index) const;

    /// Declared version of a node, nullptr if the node is unknown
    [[nodiscard]] const std::string* declared_version(const std::string& name) const;

    /// Names of direct dependencies, in edge insertion order
    [[nodiscard]] std::vector<std::string> neighbors(const std::string& name) const;

    [[nodiscard]] const std::vector<Edge>& edges(NodeIndex index) const;

    [[nodiscard]] const std::vector<Node>& nodes() const noexcept { return m_nodes; }

    [[nodiscard]] std::vector<std::string> node_names() const;

    [[nodiscard]] std::size_t node_count() const noexcept { return m_nodes.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return m_edge_count; }
    [[nodiscard]] bool empty() const noexcept { return m_nodes.empty(); }

    /// Reverse adjacency (dependency -> dependents), edge metadata preserved
    [[nodiscard]] std::vector<std::vector<Edge>> reverse_adjacency() const;

    // =========================================================================
    // Diagnostics
    // =========================================================================

    /// GraphViz DOT rendering; optional edges are dashed
    [[nodiscard]] std::string to_dot_graph() const;

    /// Indented text tree of the dependencies below root
    [[nodiscard]] std::string format_dependency_tree(const std::string& root) const;

private:
    std::vector<Node> m_nodes;
    std::unordered_map<std::string, NodeIndex> m_index;
    std::size_t m_edge_count = 0;
};

/// Build the graph for a set of service records
///
/// Every record becomes a node. A dependency becomes an edge only if its
/// target is itself one of the records; version constraints are carried on
/// the edge but not checked here.
[[nodiscard]] DependencyGraph build_graph(const std::vector<ServiceRecord>& records);

} // namespace keel_catalog
