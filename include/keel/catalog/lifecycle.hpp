#pragma once

/// @file lifecycle.hpp
/// @brief Start/stop/delete ordering and deletion safety

#include "fwd.hpp"
#include "dependency_graph.hpp"
#include <keel/core/error.hpp>

#include <string>
#include <vector>

namespace keel_catalog {

/// Dependencies first (same as resolve_order)
[[nodiscard]] keel_core::Result<std::vector<std::string>> start_order(
    const DependencyGraph& graph, const std::vector<std::string>& roots);

/// Dependents first (reverse of start_order)
[[nodiscard]] keel_core::Result<std::vector<std::string>> stop_order(
    const DependencyGraph& graph, const std::vector<std::string>& roots);

/// Dependents removed before their dependencies (same as stop_order)
[[nodiscard]] keel_core::Result<std::vector<std::string>> delete_order(
    const DependencyGraph& graph, const std::vector<std::string>& roots);

/// Decide whether a service may be deleted
///
/// Returns the full impact list on success. Without force, any critically
/// impacted dependent blocks the deletion with a DependencyPolicy error whose
/// details name the blocking services.
[[nodiscard]] keel_core::Result<std::vector<std::string>> check_deletion(
    const DependencyGraph& graph, const std::string& name, bool force);

} // namespace keel_catalog
