// keel_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <keel/core/error.hpp>
#include <string>
#include <vector>

using namespace keel_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("operation", "register");
        auto* ctx = err.get_context("operation");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "register");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("CatalogError factories", "[core][error]") {
    SECTION("cycle") {
        Error err = CatalogError::cycle({"x", "y", "z", "x"});
        REQUIRE(err.code() == ErrorCode::DependencyCycle);
        REQUIRE(err.message() == "Dependency cycle detected: x -> y -> z -> x");

        const auto* catalog = err.as<CatalogError>();
        REQUIRE(catalog != nullptr);
        REQUIRE(catalog->kind == CatalogError::Kind::Cycle);
        REQUIRE(catalog->details.size() == 4);
    }

    SECTION("service_not_found") {
        Error err = CatalogError::service_not_found("billing");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.message() == "Service 'billing' not found");
        REQUIRE(err.as<CatalogError>()->service == "billing");
    }

    SECTION("already_registered") {
        Error err = CatalogError::already_registered("billing");
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
    }

    SECTION("dependency_policy keeps blocking services") {
        Error err = CatalogError::dependency_policy("db", "blocked", {"api", "web"});
        REQUIRE(err.code() == ErrorCode::PolicyViolation);
        REQUIRE(err.as<CatalogError>()->details == std::vector<std::string>{"api", "web"});
    }

    SECTION("schema_structural joins messages") {
        Error err = CatalogError::schema_structural("svc", {"Missing required field 'name'", "bad type"});
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.message() == "Schema validation failed: Missing required field 'name', bad type");
    }

    SECTION("internal_invariant") {
        Error err = CatalogError::internal_invariant("sort mismatch");
        REQUIRE(err.code() == ErrorCode::InternalInvariant);
        REQUIRE(err.message().find("sort mismatch") != std::string::npos);
    }
}

TEST_CASE("StoreError factories", "[core][error]") {
    SECTION("not_found") {
        Error err = StoreError::not_found("/tmp/a.json");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is<StoreError>());
        REQUIRE_FALSE(err.is<CatalogError>());
    }

    SECTION("read and write failures are IO errors") {
        REQUIRE(Error(StoreError::read_failed("a", "denied")).code() == ErrorCode::IOError);
        REQUIRE(Error(StoreError::write_failed("a", "full")).code() == ErrorCode::IOError);
    }

    SECTION("parse_failed") {
        REQUIRE(Error(StoreError::parse_failed("a", "eof")).code() == ErrorCode::ParseError);
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = CatalogError::dependency_policy("db", "Cannot delete service 'db'", {"api"});
    err.with_context("operation", "delete");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[PolicyViolation]") != std::string::npos);
    REQUIRE(chain.find("Cannot delete service 'db'") != std::string::npos);
    REQUIRE(chain.find("blocking: api") != std::string::npos);
    REQUIRE(chain.find("operation: delete") != std::string::npos);
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();
    debug::record_error(CatalogError::service_not_found("a"));
    debug::record_error(StoreError::not_found("b"));
    debug::record_error(Error("generic"));

    REQUIRE(debug::total_error_count() == 3);
    REQUIRE(debug::error_stats_summary().find("Catalog: 1") != std::string::npos);
    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with Error object") {
        Error err(ErrorCode::NotFound, "Not found");
        Result<int> r = Err<int>(err);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }

    SECTION("Err void from catalog error") {
        Result<void> r = Err(CatalogError::service_not_found("x"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(7) == 7);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS(static_cast<void>(r.unwrap()));
    }

    SECTION("move value out") {
        Result<std::vector<std::string>> r = Ok(std::vector<std::string>{"a", "b"});
        auto names = std::move(r).value();
        REQUIRE(names.size() == 2);
    }

    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err keeps error") {
        Result<int> r = Err<int>(Error(ErrorCode::ParseError, "bad"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::ParseError);
    }
}
