// keel_catalog ServiceRegistry tests

#include <catch2/catch_test_macros.hpp>
#include <keel/catalog/registry.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace keel_catalog;
using nlohmann::json;

namespace {

std::string manifest(const std::string& name, const std::string& version,
                     json dependencies = json::array()) {
    json j = {
        {"name", name},
        {"version", version},
        {"description", name + " service"},
        {"service_type", {{"type", "rest"}}},
        {"endpoints", json::array({{{"name", "health"}, {"path", "/health"}, {"method", "GET"}}})},
        {"dependencies", std::move(dependencies)},
    };
    return j.dump();
}

json requires_dep(const std::string& service) {
    return json{{"service", service}, {"version_constraint", "1.0.0"}, {"required", true}};
}

json optional_dep(const std::string& service) {
    return json{{"service", service}, {"version_constraint", "1.0.0"}, {"required", false}};
}

struct RegistryFixture {
    std::shared_ptr<MemoryConfigStore> store = std::make_shared<MemoryConfigStore>();
    ServiceRegistry registry{store, std::make_shared<ServiceSchemaValidator>()};

    /// A -> B (required), A -> C (optional), B -> D (required)
    void register_sample() {
        REQUIRE(registry.register_service("D", manifest("D", "1.0.0")));
        REQUIRE(registry.register_service("C", manifest("C", "1.0.0")));
        REQUIRE(registry.register_service("B", manifest("B", "1.0.0", json::array({requires_dep("D")}))));
        REQUIRE(registry.register_service("A", manifest("A", "1.0.0",
            json::array({requires_dep("B"), optional_dep("C")}))));
    }
};

std::set<std::string> as_set(const std::vector<std::string>& names) {
    return {names.begin(), names.end()};
}

} // anonymous namespace

// =============================================================================
// Registration
// =============================================================================

TEST_CASE_METHOD(RegistryFixture, "Register services", "[catalog][registry]") {
    SECTION("new service is stored and inactive") {
        REQUIRE(registry.register_service("api", manifest("api", "1.0.0")));
        REQUIRE(registry.size() == 1);

        auto record = registry.get_service("api");
        REQUIRE(record);
        REQUIRE(record->status.state == ServiceState::Inactive);
        REQUIRE(record->namespace_name == "default");
        REQUIRE(record->generation > 0);
        REQUIRE(store->load("api"));
    }

    SECTION("duplicate name") {
        REQUIRE(registry.register_service("api", manifest("api", "1.0.0")));
        auto again = registry.register_service("api", manifest("api", "2.0.0"));
        REQUIRE_FALSE(again);
        REQUIRE(again.error().code() == keel_core::ErrorCode::AlreadyExists);
        REQUIRE(*again.error().get_context("operation") == "register");
        REQUIRE(registry.get_service("api")->declared_version == "1.0.0");
    }

    SECTION("unparsable text is rejected and not stored") {
        auto result = registry.register_service("bad", "{ nope");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == keel_core::ErrorCode::ParseError);
        REQUIRE(registry.size() == 0);
        REQUIRE_FALSE(store->load("bad"));
    }

    SECTION("names that are not safe file names are rejected") {
        for (const std::string name : {"", "team/api", "../api", "a\\b", "api..v2"}) {
            auto result = registry.register_service(name, manifest("api", "1.0.0"));
            REQUIRE_FALSE(result);
            REQUIRE(result.error().code() == keel_core::ErrorCode::InvalidArgument);
            REQUIRE(*result.error().get_context("operation") == "register");
        }
        REQUIRE(registry.size() == 0);
        REQUIRE(store->list()->empty());

        REQUIRE(is_valid_service_name("api-gateway_v2.1"));
    }

    SECTION("listing is sorted") {
        register_sample();
        REQUIRE(registry.list_services() == std::vector<std::string>{"A", "B", "C", "D"});
    }

    SECTION("unknown service") {
        auto record = registry.get_service("ghost");
        REQUIRE_FALSE(record);
        REQUIRE(record.error().code() == keel_core::ErrorCode::NotFound);
    }
}

TEST_CASE_METHOD(RegistryFixture, "Update services", "[catalog][registry]") {
    REQUIRE(registry.register_service("api", manifest("api", "1.0.0")));
    (void)registry.validate_all_services();
    REQUIRE(registry.get_service("api")->status.state == ServiceState::Active);
    auto before = registry.get_service("api")->generation;

    SECTION("update returns the service to validating") {
        REQUIRE(registry.update_service("api", manifest("api", "1.1.0")));
        auto record = registry.get_service("api");
        REQUIRE(record->declared_version == "1.1.0");
        REQUIRE(record->status.state == ServiceState::Validating);
        REQUIRE(record->generation > before);
        REQUIRE(*store->load("api") == manifest("api", "1.1.0"));
    }

    SECTION("unknown service") {
        auto result = registry.update_service("ghost", manifest("ghost", "1.0.0"));
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == keel_core::ErrorCode::NotFound);
        REQUIRE_FALSE(store->load("ghost"));
    }
}

TEST_CASE("Load services from a store", "[catalog][registry]") {
    auto store = std::make_shared<MemoryConfigStore>();
    REQUIRE(store->save("api", manifest("api", "1.0.0", json::array({requires_dep("db")}))));
    REQUIRE(store->save("db", manifest("db", "1.0.0")));
    REQUIRE(store->save("broken", "{ truncated"));

    ServiceRegistry registry(store, std::make_shared<ServiceSchemaValidator>(), "platform");
    auto loaded = registry.load_services();
    REQUIRE(loaded);
    REQUIRE(*loaded == 2);
    REQUIRE(registry.list_services() == std::vector<std::string>{"api", "db"});
    REQUIRE(registry.get_service("db")->namespace_name == "platform");

    SECTION("reloading replaces records") {
        REQUIRE(store->save("db", manifest("db", "1.0.1")));
        REQUIRE(*registry.load_services() == 2);
        REQUIRE(registry.size() == 2);
        REQUIRE(registry.get_service("db")->declared_version == "1.0.1");
    }

    SECTION("registry without a store") {
        ServiceRegistry detached(nullptr, nullptr);
        auto result = detached.load_services();
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == keel_core::ErrorCode::InvalidState);
    }
}

// =============================================================================
// Deletion
// =============================================================================

TEST_CASE_METHOD(RegistryFixture, "Delete services", "[catalog][registry][lifecycle]") {
    register_sample();

    SECTION("blocked by critical dependents") {
        auto result = registry.delete_service("D", false);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == keel_core::ErrorCode::PolicyViolation);
        REQUIRE(as_set(result.error().as<keel_core::CatalogError>()->details) == std::set<std::string>{"A", "B"});
        REQUIRE(*result.error().get_context("operation") == "delete");
        REQUIRE(registry.size() == 4);
        REQUIRE(store->load("D"));
    }

    SECTION("forced deletion") {
        auto result = registry.delete_service("D", true);
        REQUIRE(result);
        REQUIRE(as_set(*result) == std::set<std::string>{"A", "B"});
        REQUIRE(registry.size() == 3);
        REQUIRE_FALSE(store->load("D"));

        // B now depends on a missing service
        auto summary = registry.validate_all_services();
        REQUIRE(summary.failure_reason("B") != nullptr);
        REQUIRE(registry.get_service("B")->status.state == ServiceState::Error);
    }

    SECTION("optional dependents do not block") {
        auto result = registry.delete_service("C", false);
        REQUIRE(result);
        REQUIRE(*result == std::vector<std::string>{"A"});
    }

    SECTION("unknown service") {
        auto result = registry.delete_service("ghost", true);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == keel_core::ErrorCode::NotFound);
    }
}

// =============================================================================
// Analyses
// =============================================================================

TEST_CASE_METHOD(RegistryFixture, "Registry analyses", "[catalog][registry]") {
    register_sample();

    SECTION("validation writes statuses back") {
        auto summary = registry.validate_all_services();
        REQUIRE(summary.is_successful());
        REQUIRE(summary.successful_count() == 4);
        for (const auto& name : registry.list_services()) {
            REQUIRE(registry.get_service(name)->status.state == ServiceState::Active);
        }
    }

    SECTION("ordering") {
        auto start = registry.start_order({"A"});
        REQUIRE(start);
        REQUIRE(start->size() == 4);
        REQUIRE(start->back() == "A");

        auto stop = registry.stop_order({"A"});
        REQUIRE(stop);
        REQUIRE(stop->front() == "A");
        REQUIRE(*registry.delete_order({"A"}) == *stop);
        REQUIRE(*registry.resolve_dependencies({"A"}) == *start);
    }

    SECTION("impact") {
        REQUIRE(as_set(*registry.analyze_impact("D")) == std::set<std::string>{"A", "B"});
        REQUIRE(as_set(*registry.analyze_critical_impact("D")) == std::set<std::string>{"A", "B"});
        REQUIRE(registry.analyze_critical_impact("C")->empty());
        REQUIRE(registry.analyze_impact_detailed("D")->size() == 2);

        REQUIRE_FALSE(registry.analyze_impact("ghost"));
        REQUIRE_FALSE(registry.analyze_impact_detailed("ghost"));
        REQUIRE_FALSE(registry.analyze_critical_impact("ghost"));
    }

    SECTION("cycles") {
        REQUIRE_FALSE(registry.check_circular_dependencies().has_value());

        REQUIRE(registry.update_service("D", manifest("D", "1.0.0", json::array({requires_dep("A")}))));
        auto cycle = registry.check_circular_dependencies();
        REQUIRE(cycle.has_value());
        REQUIRE(cycle->path.front() == cycle->path.back());

        auto order = registry.start_order({"A"});
        REQUIRE_FALSE(order);
        REQUIRE(order.error().code() == keel_core::ErrorCode::DependencyCycle);

        auto summary = registry.validate_all_services();
        REQUIRE(summary.warnings.count(kSystemWarningKey) == 1);
    }

    SECTION("diagnostics") {
        REQUIRE(registry.to_dot_graph().find("\"A\" -> \"C\" [style=dashed];") != std::string::npos);

        auto tree = registry.format_dependency_tree("A");
        REQUIRE(tree);
        REQUIRE(tree->find("(optional) C") != std::string::npos);
        REQUIRE_FALSE(registry.format_dependency_tree("ghost"));
    }

    SECTION("snapshot is a copy") {
        auto snap = registry.snapshot();
        REQUIRE(snap.records.size() == 4);
        REQUIRE(snap.contains("A"));
        REQUIRE(snap.graph().edge_count() == 3);

        REQUIRE(registry.delete_service("A", false));
        REQUIRE(snap.contains("A"));
        REQUIRE_FALSE(registry.snapshot().contains("A"));
    }
}

TEST_CASE_METHOD(RegistryFixture, "Concurrent readers and writers", "[catalog][registry][concurrency]") {
    register_sample();

    std::atomic<bool> failed{false};
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, &failed] {
            for (int i = 0; i < 50; ++i) {
                auto order = registry.start_order({"A"});
                if (!order || order->size() != 4) {
                    failed = true;
                }
                (void)registry.validate_all_services();
            }
        });
    }

    threads.emplace_back([this, &failed] {
        for (int i = 0; i < 50; ++i) {
            std::string version = "1.0." + std::to_string(i);
            if (!registry.update_service("C", manifest("C", version))) {
                failed = true;
            }
        }
    });

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE_FALSE(failed.load());
    REQUIRE(registry.size() == 4);
    REQUIRE(registry.get_service("C")->declared_version == "1.0.49");
}

TEST_CASE_METHOD(RegistryFixture, "Concurrent writers keep store and registry in step",
                 "[catalog][registry][concurrency]") {
    SECTION("racing registrations of one name") {
        std::atomic<int> accepted{0};
        std::vector<std::thread> threads;

        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([this, &accepted, t] {
                std::string version = std::to_string(t + 1) + ".0.0";
                if (registry.register_service("api", manifest("api", version))) {
                    ++accepted;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(accepted.load() == 1);
        auto stored = store->load("api");
        REQUIRE(stored);
        auto record = ServiceRecord::from_json_string(*stored, "api");
        REQUIRE(record);
        REQUIRE(record->declared_version == registry.get_service("api")->declared_version);
    }

    SECTION("updates racing a delete") {
        register_sample();

        std::thread updater([this] {
            for (int i = 0; i < 100; ++i) {
                static_cast<void>(registry.update_service("C", manifest("C", "1.0." + std::to_string(i))));
            }
        });
        std::thread deleter([this] {
            for (int i = 0; i < 10; ++i) {
                static_cast<void>(registry.delete_service("C", true));
                std::this_thread::yield();
            }
        });
        updater.join();
        deleter.join();

        REQUIRE_FALSE(registry.get_service("C"));
        REQUIRE_FALSE(store->load("C"));

        // Nothing can bring C back except a fresh registration
        REQUIRE_FALSE(registry.update_service("C", manifest("C", "2.0.0")));
        REQUIRE_FALSE(store->load("C"));
        REQUIRE(registry.register_service("C", manifest("C", "2.0.0")));
        REQUIRE(*store->load("C") == manifest("C", "2.0.0"));
    }
}
