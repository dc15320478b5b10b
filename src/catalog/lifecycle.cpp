/// @file lifecycle.cpp
/// @brief Lifecycle ordering

#include <keel/catalog/lifecycle.hpp>
#include <keel/catalog/graph_algorithms.hpp>
#include <keel/catalog/impact.hpp>
#include <keel/core/log.hpp>
#include <algorithm>

namespace keel_catalog {

keel_core::Result<std::vector<std::string>> start_order(
    const DependencyGraph& graph, const std::vector<std::string>& roots) {
    return resolve_order(graph, roots);
}

keel_core::Result<std::vector<std::string>> stop_order(
    const DependencyGraph& graph, const std::vector<std::string>& roots) {
    auto order = resolve_order(graph, roots);
    if (!order) {
        return order;
    }
    std::reverse(order->begin(), order->end());
    return order;
}

keel_core::Result<std::vector<std::string>> delete_order(
    const DependencyGraph& graph, const std::vector<std::string>& roots) {
    return stop_order(graph, roots);
}

keel_core::Result<std::vector<std::string>> check_deletion(
    const DependencyGraph& graph, const std::string& name, bool force) {

    if (!graph.contains(name)) {
        return keel_core::Err<std::vector<std::string>>(keel_core::CatalogError::service_not_found(name));
    }

    auto blocking = critical_impact(graph, name);
    if (!blocking.empty()) {
        if (!force) {
            std::string reason = "Cannot delete service '" + name + "': required by ";
            for (std::size_t i = 0; i < blocking.size(); ++i) {
                if (i > 0) reason += ", ";
                reason += blocking[i];
            }
            return keel_core::Err<std::vector<std::string>>(
                keel_core::CatalogError::dependency_policy(name, reason, std::move(blocking)));
        }
        keel_core::catalog_logger()->warn("[Lifecycle] Forcing deletion of '{}' with {} critical dependent(s)",
            name, blocking.size());
    }

    return keel_core::Ok(find_impact(graph, name));
}

} // namespace keel_catalog
