/// @file graph_algorithms.cpp
/// @brief Graph traversal algorithms

#include <keel/catalog/graph_algorithms.hpp>
#include <keel/core/log.hpp>
#include <algorithm>
#include <deque>

namespace keel_catalog {

namespace {

enum class Color : std::uint8_t {
    White,  // Unvisited
    Gray,   // On the current DFS path
    Black,  // Fully explored
};

struct Frame {
    NodeIndex node;
    std::size_t next_edge;
};

std::size_t count_masked(const std::vector<bool>& mask) {
    return static_cast<std::size_t>(std::count(mask.begin(), mask.end(), true));
}

} // anonymous namespace

// =============================================================================
// CycleInfo
// =============================================================================

std::string CycleInfo::format_path(const std::vector<std::string>& path) {
    std::string result;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) result += " -> ";
        result += path[i];
    }
    return result;
}

// =============================================================================
// Cycle Detection
// =============================================================================

std::optional<CycleInfo> detect_cycles(const DependencyGraph& graph) {
    return detect_cycles(graph, std::vector<bool>(graph.node_count(), true));
}

std::optional<CycleInfo> detect_cycles(const DependencyGraph& graph, const std::vector<bool>& mask) {
    const std::size_t n = graph.node_count();
    std::vector<Color> color(n, Color::White);
    std::vector<Frame> stack;

    for (NodeIndex root = 0; root < n; ++root) {
        if (!mask[root] || color[root] != Color::White) {
            continue;
        }

        color[root] = Color::Gray;
        stack.push_back(Frame{root, 0});

        while (!stack.empty()) {
            NodeIndex current = stack.back().node;
            const auto& edges = graph.edges(current);

            if (stack.back().next_edge >= edges.size()) {
                color[current] = Color::Black;
                stack.pop_back();
                continue;
            }

            NodeIndex next = edges[stack.back().next_edge++].target;
            if (!mask[next]) {
                continue;
            }

            if (color[next] == Color::Gray) {
                auto start = std::find_if(stack.begin(), stack.end(),
                    [next](const Frame& frame) { return frame.node == next; });

                CycleInfo cycle;
                for (auto it = start; it != stack.end(); ++it) {
                    cycle.path.push_back(graph.name_of(it->node));
                }
                cycle.path.push_back(graph.name_of(next));
                cycle.description = "Circular dependency detected: " + CycleInfo::format_path(cycle.path);

                keel_core::catalog_logger()->debug("[GraphAlgorithms] {}", cycle.description);
                return cycle;
            }

            if (color[next] == Color::White) {
                color[next] = Color::Gray;
                stack.push_back(Frame{next, 0});
            }
        }
    }

    return std::nullopt;
}

// =============================================================================
// Subgraph Extraction
// =============================================================================

std::vector<NodeIndex> transitive_closure(const DependencyGraph& graph, const std::vector<NodeIndex>& roots) {
    std::vector<bool> visited(graph.node_count(), false);
    std::vector<NodeIndex> closure;
    std::vector<NodeIndex> stack;

    for (NodeIndex root : roots) {
        if (visited[root]) {
            continue;
        }
        visited[root] = true;
        stack.push_back(root);

        while (!stack.empty()) {
            NodeIndex current = stack.back();
            stack.pop_back();
            closure.push_back(current);

            for (const auto& edge : graph.edges(current)) {
                if (!visited[edge.target]) {
                    visited[edge.target] = true;
                    stack.push_back(edge.target);
                }
            }
        }
    }

    return closure;
}

// =============================================================================
// Topological Ordering
// =============================================================================

keel_core::Result<std::vector<std::string>> topological_sort(
    const DependencyGraph& graph, const std::vector<bool>& mask) {

    const std::size_t n = graph.node_count();
    std::vector<std::size_t> in_degree(n, 0);

    for (NodeIndex node = 0; node < n; ++node) {
        if (!mask[node]) continue;
        for (const auto& edge : graph.edges(node)) {
            if (mask[edge.target]) {
                ++in_degree[edge.target];
            }
        }
    }

    std::deque<NodeIndex> ready;
    for (NodeIndex node = 0; node < n; ++node) {
        if (mask[node] && in_degree[node] == 0) {
            ready.push_back(node);
        }
    }

    // Kahn emits dependents first (nothing depends on them)
    std::vector<std::string> order;
    order.reserve(count_masked(mask));

    while (!ready.empty()) {
        NodeIndex node = ready.front();
        ready.pop_front();
        order.push_back(graph.name_of(node));

        for (const auto& edge : graph.edges(node)) {
            if (!mask[edge.target]) continue;
            if (--in_degree[edge.target] == 0) {
                ready.push_back(edge.target);
            }
        }
    }

    const std::size_t expected = count_masked(mask);
    if (order.size() != expected) {
        return keel_core::Err<std::vector<std::string>>(keel_core::CatalogError::internal_invariant(
            "topological sort produced " + std::to_string(order.size()) +
            " of " + std::to_string(expected) + " services"));
    }

    std::reverse(order.begin(), order.end());
    return keel_core::Ok(std::move(order));
}

keel_core::Result<std::vector<std::string>> resolve_order(
    const DependencyGraph& graph, const std::vector<std::string>& roots) {

    std::vector<NodeIndex> root_indices;
    root_indices.reserve(roots.size());
    for (const auto& name : roots) {
        auto index = graph.index_of(name);
        if (!index) {
            return keel_core::Err<std::vector<std::string>>(
                keel_core::CatalogError::service_not_found(name));
        }
        root_indices.push_back(*index);
    }

    if (root_indices.empty()) {
        return keel_core::Ok(std::vector<std::string>{});
    }

    std::vector<bool> mask(graph.node_count(), false);
    for (NodeIndex node : transitive_closure(graph, root_indices)) {
        mask[node] = true;
    }

    if (auto cycle = detect_cycles(graph, mask)) {
        keel_core::catalog_logger()->warn("[GraphAlgorithms] Cannot order services: {}", cycle->description);
        return keel_core::Err<std::vector<std::string>>(keel_core::CatalogError::cycle(std::move(cycle->path)));
    }

    return topological_sort(graph, mask);
}

} // namespace keel_catalog
