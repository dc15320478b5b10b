/// @file dependency_graph.cpp
/// @brief DependencyGraph implementation

#include <keel/catalog/dependency_graph.hpp>
#include <keel/catalog/service.hpp>
#include <sstream>
#include <stdexcept>

namespace keel_catalog {

// =============================================================================
// Construction
// =============================================================================

NodeIndex DependencyGraph::add_node(const std::string& name) {
    auto it = m_index.find(name);
    if (it != m_index.end()) {
        return it->second;
    }

    auto index = static_cast<NodeIndex>(m_nodes.size());
    m_nodes.push_back(Node{name, {}, {}});
    m_index.emplace(name, index);
    return index;
}

NodeIndex DependencyGraph::add_node(const std::string& name, const std::string& declared_version) {
    NodeIndex index = add_node(name);
    m_nodes[index].declared_version = declared_version;
    return index;
}

void DependencyGraph::add_edge(const std::string& from, const std::string& to, EdgeMetadata metadata) {
    NodeIndex from_index = add_node(from);
    NodeIndex to_index = add_node(to);
    m_nodes[from_index].edges.push_back(Edge{to_index, std::move(metadata)});
    ++m_edge_count;
}

// =============================================================================
// Queries
// =============================================================================

bool DependencyGraph::contains(const std::string& name) const {
    return m_index.find(name) != m_index.end();
}

std::optional<NodeIndex> DependencyGraph::index_of(const std::string& name) const {
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string& DependencyGraph::name_of(NodeIndex index) const {
    return m_nodes.at(index).name;
}

const std::string* DependencyGraph::declared_version(const std::string& name) const {
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        return nullptr;
    }
    return &m_nodes[it->second].declared_version;
}

std::vector<std::string> DependencyGraph::neighbors(const std::string& name) const {
    std::vector<std::string> result;
    auto index = index_of(name);
    if (!index) {
        return result;
    }
    const auto& node_edges = m_nodes[*index].edges;
    result.reserve(node_edges.size());
    for (const auto& edge : node_edges) {
        result.push_back(m_nodes[edge.target].name);
    }
    return result;
}

const std::vector<Edge>& DependencyGraph::edges(NodeIndex index) const {
    return m_nodes.at(index).edges;
}

std::vector<std::string> DependencyGraph::node_names() const {
    std::vector<std::string> names;
    names.reserve(m_nodes.size());
    for (const auto& node : m_nodes) {
        names.push_back(node.name);
    }
    return names;
}

std::vector<std::vector<Edge>> DependencyGraph::reverse_adjacency() const {
    std::vector<std::vector<Edge>> reverse(m_nodes.size());
    for (NodeIndex from = 0; from < m_nodes.size(); ++from) {
        for (const auto& edge : m_nodes[from].edges) {
            reverse[edge.target].push_back(Edge{from, edge.metadata});
        }
    }
    return reverse;
}

// =============================================================================
// Diagnostics
// =============================================================================

std::string DependencyGraph::to_dot_graph() const {
    std::ostringstream oss;
    oss << "digraph services {\n";
    oss << "  rankdir=TB;\n";
    oss << "  node [shape=box];\n\n";

    for (const auto& node : m_nodes) {
        oss << "  \"" << node.name << "\"";
        if (!node.declared_version.empty()) {
            oss << " [label=\"" << node.name << "\\n" << node.declared_version << "\"]";
        }
        oss << ";\n";
    }
    oss << "\n";

    for (const auto& node : m_nodes) {
        for (const auto& edge : node.edges) {
            oss << "  \"" << node.name << "\" -> \"" << m_nodes[edge.target].name << "\"";
            if (!edge.metadata.required) {
                oss << " [style=dashed]";
            }
            oss << ";\n";
        }
    }

    oss << "}\n";
    return oss.str();
}

std::string DependencyGraph::format_dependency_tree(const std::string& root) const {
    auto root_index = index_of(root);
    if (!root_index) {
        return root + " (NOT FOUND)\n";
    }

    struct Line {
        NodeIndex node;
        std::string branch;      // Text before the node name on its own line
        std::string child_prefix; // Prefix inherited by its children
        bool optional;
    };

    std::string output;
    std::vector<bool> printed(m_nodes.size(), false);
    std::vector<Line> stack;
    stack.push_back(Line{*root_index, "", "", false});

    while (!stack.empty()) {
        Line line = std::move(stack.back());
        stack.pop_back();

        const auto& node = m_nodes[line.node];
        output += line.branch;
        if (line.optional) {
            output += "(optional) ";
        }
        output += node.name;
        if (!node.declared_version.empty()) {
            output += " v" + node.declared_version;
        }

        if (printed[line.node]) {
            output += " (see above)\n";
            continue;
        }
        printed[line.node] = true;
        output += "\n";

        // Push in reverse so children print in edge order
        for (std::size_t i = node.edges.size(); i-- > 0;) {
            bool is_last = (i == node.edges.size() - 1);
            const auto& edge = node.edges[i];
            stack.push_back(Line{
                edge.target,
                line.child_prefix + (is_last ? "`-" : "|-"),
                line.child_prefix + (is_last ? "  " : "| "),
                !edge.metadata.required});
        }
    }

    return output;
}

// =============================================================================
// Graph Construction
// =============================================================================

DependencyGraph build_graph(const std::vector<ServiceRecord>& records) {
    DependencyGraph graph;

    for (const auto& record : records) {
        graph.add_node(record.name, record.declared_version);
    }

    for (const auto& record : records) {
        for (const auto& dep : record.dependencies) {
            if (!graph.contains(dep.target)) {
                continue;
            }
            graph.add_edge(record.name, dep.target,
                           EdgeMetadata{dep.required, dep.version_constraint});
        }
    }

    return graph;
}

} // namespace keel_catalog
