/// @file impact.cpp
/// @brief Impact analysis over reverse dependency edges

#include <keel/catalog/impact.hpp>
#include <keel/core/log.hpp>
#include <algorithm>

namespace keel_catalog {

namespace {

struct Discovery {
    NodeIndex parent = kInvalidNode;
    bool edge_required = true;
};

std::string describe_chain(bool required, const std::string& from, const std::string& to) {
    return std::string(required ? "Required" : "Optional") +
           " dependency chain from '" + from + "' to '" + to + "'";
}

/// Breadth-first walk over reverse edges from target, recording parents
///
/// Returns dependents in discovery order (target excluded). With
/// required_only set, optional edges are not followed.
std::vector<NodeIndex> reverse_bfs(const std::vector<std::vector<Edge>>& reverse, NodeIndex target,
                                   bool required_only, std::vector<Discovery>& info,
                                   std::vector<bool>& reached) {
    std::vector<NodeIndex> order;
    std::vector<NodeIndex> frontier{target};
    reached[target] = true;

    while (!frontier.empty()) {
        std::vector<NodeIndex> level;
        for (NodeIndex current : frontier) {
            for (const auto& edge : reverse[current]) {
                if (required_only && !edge.metadata.required) continue;
                if (reached[edge.target]) continue;
                reached[edge.target] = true;
                info[edge.target] = Discovery{current, edge.metadata.required};
                level.push_back(edge.target);
            }
        }
        order.insert(order.end(), level.begin(), level.end());
        frontier = std::move(level);
    }

    return order;
}

} // anonymous namespace

std::vector<std::string> find_impact(const DependencyGraph& graph, const std::string& target) {
    std::vector<std::string> impacted;
    auto target_index = graph.index_of(target);
    if (!target_index) {
        return impacted;
    }

    auto reverse = graph.reverse_adjacency();
    std::vector<bool> visited(graph.node_count(), false);
    std::vector<NodeIndex> stack{*target_index};
    visited[*target_index] = true;

    while (!stack.empty()) {
        NodeIndex current = stack.back();
        stack.pop_back();

        for (const auto& edge : reverse[current]) {
            if (visited[edge.target]) continue;
            visited[edge.target] = true;
            impacted.push_back(graph.name_of(edge.target));
            stack.push_back(edge.target);
        }
    }

    return impacted;
}

std::vector<ImpactInfo> detailed_impact(const DependencyGraph& graph, const std::string& target) {
    std::vector<ImpactInfo> result;
    auto target_index = graph.index_of(target);
    if (!target_index) {
        return result;
    }

    auto reverse = graph.reverse_adjacency();
    const std::size_t n = graph.node_count();

    // Critical dependents: reachable through required edges alone, at any depth
    std::vector<Discovery> required_info(n);
    std::vector<bool> critical(n, false);
    reverse_bfs(reverse, *target_index, true, required_info, critical);

    std::vector<Discovery> any_info(n);
    std::vector<bool> reached(n, false);
    auto order = reverse_bfs(reverse, *target_index, false, any_info, reached);

    for (NodeIndex node : order) {
        const auto& info = critical[node] ? required_info : any_info;

        ImpactInfo impact;
        impact.service = graph.name_of(node);
        impact.is_required = critical[node];
        impact.edge_required = info[node].edge_required;
        for (NodeIndex step = node; step != kInvalidNode; step = info[step].parent) {
            impact.path.push_back(graph.name_of(step));
        }
        std::reverse(impact.path.begin(), impact.path.end());
        impact.description = describe_chain(impact.is_required, target, impact.service);
        result.push_back(std::move(impact));
    }

    keel_core::catalog_logger()->debug("[ImpactAnalyzer] '{}' impacts {} service(s)", target, result.size());
    return result;
}

std::vector<std::string> critical_impact(const DependencyGraph& graph, const std::string& target) {
    std::vector<std::string> critical;
    for (const auto& impact : detailed_impact(graph, target)) {
        if (impact.is_required) {
            critical.push_back(impact.service);
        }
    }
    return critical;
}

} // namespace keel_catalog
