#pragma once

/// @file impact.hpp
/// @brief Reverse reachability ("who is affected if this service changes")
///
/// A service S is impacted by a change to T when T is reachable from S by
/// following dependency edges. Critical impact keeps only services whose
/// reachable from T through required edges alone.

#include "fwd.hpp"
#include "dependency_graph.hpp"

#include <string>
#include <vector>

namespace keel_catalog {

/// One impacted service
struct ImpactInfo {
    std::string service;
    bool is_required = true;    ///< Some chain of required edges links target and service
    bool edge_required = true;  ///< The edge adjacent to this service is required
    std::vector<std::string> path;  ///< target .. service
    std::string description;
};

/// All transitive dependents of target (target itself excluded)
///
/// Returns an empty list for an unknown target.
[[nodiscard]] std::vector<std::string> find_impact(const DependencyGraph& graph, const std::string& target);

/// Breadth-first impact with discovering paths
///
/// Direct dependents come before deeper ones. Each service appears once. A
/// service is required when any all-required chain reaches it, and its path
/// is then the shortest such chain; otherwise the path is the shortest chain.
[[nodiscard]] std::vector<ImpactInfo> detailed_impact(const DependencyGraph& graph, const std::string& target);

/// Dependents reached through required edges only
[[nodiscard]] std::vector<std::string> critical_impact(const DependencyGraph& graph, const std::string& target);

} // namespace keel_catalog
