// keel_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <keel/core/log.hpp>

using namespace keel_core;

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("info") == spdlog::level::info);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::warn)) == "warn");
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns same logger") {
        auto a = get_logger("keel_test");
        auto b = get_logger("keel_test");
        REQUIRE(a == b);
        REQUIRE(a->name() == "keel_test");
    }

    SECTION("subsystem loggers") {
        REQUIRE(catalog_logger()->name() == "keel_catalog");
        REQUIRE(registry_logger()->name() == "keel_registry");
    }

    SECTION("global level applies to existing loggers") {
        auto logger = get_logger("keel_level_test");
        set_global_log_level(spdlog::level::err);
        REQUIRE(get_global_log_level() == spdlog::level::err);
        REQUIRE(logger->level() == spdlog::level::err);
        set_global_log_level(spdlog::level::info);
    }
}

TEST_CASE("Log scope", "[core][log]") {
    KEEL_LOG_SCOPE("first");
    KEEL_LOG_SCOPE("second");
    log_structured(spdlog::level::debug, "keel_catalog", "structured", {{"service", "api"}});
    SUCCEED();
}
