// keel_catalog impact analysis and deletion policy tests

#include <catch2/catch_test_macros.hpp>
#include <keel/catalog/dependency_graph.hpp>
#include <keel/catalog/impact.hpp>
#include <keel/catalog/lifecycle.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace keel_catalog;

namespace {

EdgeMetadata required_edge() { return EdgeMetadata{true, std::nullopt}; }
EdgeMetadata optional_edge() { return EdgeMetadata{false, std::nullopt}; }

/// A -> B (required), A -> C (optional), B -> D (required)
DependencyGraph sample_graph() {
    DependencyGraph graph;
    graph.add_edge("A", "B", required_edge());
    graph.add_edge("A", "C", optional_edge());
    graph.add_edge("B", "D", required_edge());
    return graph;
}

std::set<std::string> as_set(const std::vector<std::string>& names) {
    return {names.begin(), names.end()};
}

const ImpactInfo* find_entry(const std::vector<ImpactInfo>& impacts, const std::string& service) {
    auto it = std::find_if(impacts.begin(), impacts.end(),
        [&service](const ImpactInfo& impact) { return impact.service == service; });
    return it == impacts.end() ? nullptr : &*it;
}

} // anonymous namespace

// =============================================================================
// find_impact
// =============================================================================

TEST_CASE("find_impact returns all transitive dependents", "[catalog][impact]") {
    auto graph = sample_graph();

    REQUIRE(as_set(find_impact(graph, "D")) == std::set<std::string>{"A", "B"});
    REQUIRE(as_set(find_impact(graph, "C")) == std::set<std::string>{"A"});
    REQUIRE(find_impact(graph, "A").empty());

    SECTION("unknown target") {
        REQUIRE(find_impact(graph, "ghost").empty());
    }

    SECTION("target never appears in its own impact") {
        graph.add_edge("D", "A", required_edge());
        auto impacted = find_impact(graph, "D");
        REQUIRE(as_set(impacted) == std::set<std::string>{"A", "B"});
        REQUIRE(impacted.size() == 2);
    }
}

// =============================================================================
// detailed_impact
// =============================================================================

TEST_CASE("detailed_impact paths and criticality", "[catalog][impact]") {
    auto graph = sample_graph();

    SECTION("required chain") {
        auto impacts = detailed_impact(graph, "D");
        REQUIRE(impacts.size() == 2);
        REQUIRE(impacts[0].service == "B");
        REQUIRE(impacts[1].service == "A");

        const auto* a = find_entry(impacts, "A");
        REQUIRE(a->is_required);
        REQUIRE(a->path == std::vector<std::string>{"D", "B", "A"});
        REQUIRE(a->description == "Required dependency chain from 'D' to 'A'");
    }

    SECTION("optional edge") {
        auto impacts = detailed_impact(graph, "C");
        REQUIRE(impacts.size() == 1);
        REQUIRE_FALSE(impacts[0].is_required);
        REQUIRE_FALSE(impacts[0].edge_required);
        REQUIRE(impacts[0].description == "Optional dependency chain from 'C' to 'A'");
    }

    SECTION("required path preferred over optional one of equal length") {
        DependencyGraph g;
        g.add_edge("top", "opt_mid", required_edge());
        g.add_edge("opt_mid", "base", optional_edge());
        g.add_edge("top", "req_mid", required_edge());
        g.add_edge("req_mid", "base", required_edge());

        auto impacts = detailed_impact(g, "base");
        const auto* top = find_entry(impacts, "top");
        REQUIRE(top != nullptr);
        REQUIRE(top->is_required);
        REQUIRE(top->path == std::vector<std::string>{"base", "req_mid", "top"});
    }

    SECTION("optional hop anywhere makes the chain optional") {
        DependencyGraph g;
        g.add_edge("web", "api", required_edge());
        g.add_edge("api", "cache", optional_edge());

        auto impacts = detailed_impact(g, "cache");
        const auto* web = find_entry(impacts, "web");
        REQUIRE(web != nullptr);
        REQUIRE_FALSE(web->is_required);
        REQUIRE(web->edge_required);
    }

    SECTION("longer required chain beats a shorter optional edge") {
        DependencyGraph g;
        g.add_edge("A", "D", optional_edge());
        g.add_edge("A", "B", required_edge());
        g.add_edge("B", "D", required_edge());

        auto impacts = detailed_impact(g, "D");
        REQUIRE(impacts.size() == 2);

        const auto* a = find_entry(impacts, "A");
        REQUIRE(a != nullptr);
        REQUIRE(a->is_required);
        REQUIRE(a->edge_required);
        REQUIRE(a->path == std::vector<std::string>{"D", "B", "A"});
        REQUIRE(a->description == "Required dependency chain from 'D' to 'A'");

        REQUIRE(as_set(critical_impact(g, "D")) == std::set<std::string>{"A", "B"});
        REQUIRE_FALSE(check_deletion(g, "D", false));
    }

    SECTION("optional chain keeps its shortest path") {
        DependencyGraph g;
        g.add_edge("app", "mid", optional_edge());
        g.add_edge("mid", "base", required_edge());
        g.add_edge("app", "far", required_edge());
        g.add_edge("far", "farther", optional_edge());
        g.add_edge("farther", "base", required_edge());

        auto impacts = detailed_impact(g, "base");
        const auto* app = find_entry(impacts, "app");
        REQUIRE(app != nullptr);
        REQUIRE_FALSE(app->is_required);
        REQUIRE(app->path == std::vector<std::string>{"base", "mid", "app"});
        REQUIRE(as_set(critical_impact(g, "base")) == std::set<std::string>{"mid", "farther"});
    }

    SECTION("unknown target") {
        REQUIRE(detailed_impact(graph, "ghost").empty());
    }
}

TEST_CASE("critical_impact keeps required chains only", "[catalog][impact]") {
    auto graph = sample_graph();

    REQUIRE(as_set(critical_impact(graph, "D")) == std::set<std::string>{"A", "B"});
    REQUIRE(critical_impact(graph, "C").empty());
    REQUIRE(critical_impact(graph, "ghost").empty());
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("Start and stop orders", "[catalog][lifecycle]") {
    auto graph = sample_graph();

    auto start = start_order(graph, {"A"});
    auto stop = stop_order(graph, {"A"});
    auto remove = delete_order(graph, {"A"});
    REQUIRE(start);
    REQUIRE(stop);
    REQUIRE(remove);

    std::vector<std::string> reversed(start->rbegin(), start->rend());
    REQUIRE(*stop == reversed);
    REQUIRE(*remove == *stop);
    REQUIRE(stop->front() == "A");

    SECTION("errors propagate") {
        auto missing = stop_order(graph, {"ghost"});
        REQUIRE_FALSE(missing);
        REQUIRE(missing.error().code() == keel_core::ErrorCode::NotFound);
    }
}

TEST_CASE("Deletion policy", "[catalog][lifecycle]") {
    auto graph = sample_graph();

    SECTION("leaf with no dependents") {
        auto result = check_deletion(graph, "A", false);
        REQUIRE(result);
        REQUIRE(result->empty());
    }

    SECTION("only optional dependents") {
        auto result = check_deletion(graph, "C", false);
        REQUIRE(result);
        REQUIRE(*result == std::vector<std::string>{"A"});
    }

    SECTION("critical dependents block") {
        auto result = check_deletion(graph, "D", false);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == keel_core::ErrorCode::PolicyViolation);

        const auto* err = result.error().as<keel_core::CatalogError>();
        REQUIRE(err != nullptr);
        REQUIRE(as_set(err->details) == std::set<std::string>{"A", "B"});
        REQUIRE(result.error().message().find("Cannot delete service 'D'") != std::string::npos);
    }

    SECTION("force overrides") {
        auto result = check_deletion(graph, "D", true);
        REQUIRE(result);
        REQUIRE(as_set(*result) == std::set<std::string>{"A", "B"});
    }

    SECTION("unknown service") {
        auto result = check_deletion(graph, "ghost", true);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == keel_core::ErrorCode::NotFound);
    }
}
