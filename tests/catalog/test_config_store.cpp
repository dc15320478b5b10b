// keel_catalog configuration store and catalog configuration tests

#include <catch2/catch_test_macros.hpp>
#include <keel/catalog/config.hpp>
#include <keel/catalog/config_store.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace keel_catalog;
namespace fs = std::filesystem;

namespace {

/// Unique scratch directory removed on scope exit
class TempDir {
public:
    TempDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = fs::temp_directory_path() / ("keel_test_" + std::to_string(stamp));
        fs::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

void write_file(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    file << text;
}

} // anonymous namespace

// =============================================================================
// DirectoryConfigStore
// =============================================================================

TEST_CASE("DirectoryConfigStore", "[catalog][store]") {
    TempDir dir;
    auto opened = DirectoryConfigStore::open(dir.path() / "services");
    REQUIRE(opened);
    auto store = *opened;

    REQUIRE(fs::is_directory(store->root()));
    REQUIRE(store->path_for("api") == store->root() / "api.json");

    SECTION("save then load") {
        REQUIRE(store->save("api", R"({"name":"api"})"));
        auto text = store->load("api");
        REQUIRE(text);
        REQUIRE(*text == R"({"name":"api"})");
        REQUIRE(fs::exists(store->path_for("api")));
    }

    SECTION("save replaces previous text") {
        REQUIRE(store->save("api", "first"));
        REQUIRE(store->save("api", "second"));
        REQUIRE(*store->load("api") == "second");
    }

    SECTION("missing entry") {
        auto text = store->load("ghost");
        REQUIRE_FALSE(text);
        REQUIRE(text.error().code() == keel_core::ErrorCode::NotFound);
        REQUIRE(text.error().is<keel_core::StoreError>());
    }

    SECTION("list is sorted and ignores other files") {
        REQUIRE(store->save("web", "{}"));
        REQUIRE(store->save("api", "{}"));
        write_file(store->root() / "notes.txt", "ignored");
        fs::create_directories(store->root() / "nested.json");

        auto names = store->list();
        REQUIRE(names);
        REQUIRE(*names == std::vector<std::string>{"api", "web"});
    }

    SECTION("names that would escape the root are refused") {
        for (const std::string name : {"", "../outside", "nested/api", "a\\b"}) {
            auto saved = store->save(name, "{}");
            REQUIRE_FALSE(saved);
            REQUIRE(saved.error().code() == keel_core::ErrorCode::InvalidArgument);
            REQUIRE(store->load(name).error().code() == keel_core::ErrorCode::InvalidArgument);
            REQUIRE_FALSE(store->remove(name));
        }
        REQUIRE_FALSE(fs::exists(dir.path() / "outside.json"));
        REQUIRE(store->list()->empty());
    }

    SECTION("remove") {
        REQUIRE(store->save("api", "{}"));
        REQUIRE(store->remove("api"));
        REQUIRE_FALSE(fs::exists(store->path_for("api")));
        REQUIRE(store->remove("api"));
    }
}

TEST_CASE("DirectoryConfigStore rejects a file root", "[catalog][store]") {
    TempDir dir;
    write_file(dir.path() / "plain", "x");

    auto opened = DirectoryConfigStore::open(dir.path() / "plain");
    REQUIRE_FALSE(opened);
    REQUIRE(opened.error().is<keel_core::StoreError>());
}

// =============================================================================
// MemoryConfigStore
// =============================================================================

TEST_CASE("MemoryConfigStore", "[catalog][store]") {
    MemoryConfigStore store;

    REQUIRE(store.save("b", "2"));
    REQUIRE(store.save("a", "1"));
    REQUIRE(*store.load("a") == "1");
    REQUIRE(*store.list() == std::vector<std::string>{"a", "b"});

    REQUIRE(store.remove("a"));
    REQUIRE(store.remove("missing"));
    REQUIRE_FALSE(store.load("a"));
    REQUIRE(store.load("a").error().code() == keel_core::ErrorCode::NotFound);
}

// =============================================================================
// CatalogConfig
// =============================================================================

TEST_CASE("CatalogConfig parsing", "[catalog][config]") {
    SECTION("defaults") {
        auto config = CatalogConfig::from_json_string("{}");
        REQUIRE(config);
        REQUIRE(config->config_dir == "services");
        REQUIRE(config->default_namespace == "default");
        REQUIRE(config->schema_version == "1.0.0");
        REQUIRE(config->log_level == "info");
        REQUIRE(config->log_console);
        REQUIRE_FALSE(config->log_file);
    }

    SECTION("all sections") {
        auto config = CatalogConfig::from_json_string(R"({
            "catalog": { "config_dir": "/srv/manifests", "default_namespace": "platform" },
            "logging": { "level": "debug", "console": false, "file": true, "directory": "var/log" }
        })");
        REQUIRE(config);
        REQUIRE(config->config_dir == "/srv/manifests");
        REQUIRE(config->default_namespace == "platform");
        REQUIRE(config->log_level == "debug");
        REQUIRE_FALSE(config->log_console);
        REQUIRE(config->log_file);
        REQUIRE(config->log_directory == "var/log");
    }

    SECTION("wrong types are rejected") {
        auto config = CatalogConfig::from_json_string(R"({ "logging": { "console": "yes" } })");
        REQUIRE_FALSE(config);
        REQUIRE(config.error().code() == keel_core::ErrorCode::InvalidArgument);
        REQUIRE(config.error().message() == "'logging.console' must be a boolean");

        REQUIRE_FALSE(CatalogConfig::from_json_string(R"({ "catalog": [] })"));
        REQUIRE_FALSE(CatalogConfig::from_json_string("[]"));
    }

    SECTION("unknown log level") {
        auto config = CatalogConfig::from_json_string(R"({ "logging": { "level": "loud" } })");
        REQUIRE_FALSE(config);
        REQUIRE(config.error().message() == "Unknown log level 'loud'");
    }

    SECTION("malformed text") {
        auto config = CatalogConfig::from_json_string("{ catalog");
        REQUIRE_FALSE(config);
        REQUIRE(config.error().code() == keel_core::ErrorCode::ParseError);
    }
}

TEST_CASE("CatalogConfig files and paths", "[catalog][config]") {
    TempDir dir;

    SECTION("missing file") {
        auto config = CatalogConfig::load(dir.path() / "keel.json");
        REQUIRE_FALSE(config);
        REQUIRE(config.error().code() == keel_core::ErrorCode::NotFound);
    }

    SECTION("parse errors name the file") {
        auto path = dir.path() / "keel.json";
        write_file(path, R"({ "logging": { "file": 1 } })");
        auto config = CatalogConfig::load(path);
        REQUIRE_FALSE(config);
        const auto* file = config.error().get_context("file");
        REQUIRE(file != nullptr);
        REQUIRE(*file == path.string());
    }

    SECTION("relative paths resolve against the work dir") {
        CatalogConfig config;
        REQUIRE(config.services_path(dir.path()) == dir.path() / "services");

        config.config_dir = "/abs/services";
        REQUIRE(config.services_path(dir.path()) == fs::path("/abs/services"));

        auto log = config.log_config(dir.path());
        REQUIRE(log);
        REQUIRE(log->level == spdlog::level::info);
        REQUIRE(log->log_directory == (dir.path() / "logs").string());
    }

    SECTION("environment overrides") {
        CatalogConfig config;
        ::setenv("KEEL_CONFIG_DIR", "/env/services", 1);
        ::setenv("KEEL_LOG_LEVEL", "warn", 1);
        config.apply_environment();
        ::unsetenv("KEEL_CONFIG_DIR");
        ::unsetenv("KEEL_LOG_LEVEL");

        REQUIRE(config.config_dir == "/env/services");
        REQUIRE(config.log_level == "warn");
        REQUIRE(config.log_config(dir.path())->level == spdlog::level::warn);
    }

    SECTION("invalid level from the environment") {
        CatalogConfig config;
        config.log_level = "loud";
        REQUIRE_FALSE(config.log_config(dir.path()));
    }
}
