#pragma once

/// @file service.hpp
/// @brief Service records, types and status state machine
///
/// A ServiceRecord is created from a JSON service manifest:
/// @code
/// {
///   "name": "auth-service",
///   "version": "1.0.0",
///   "namespace": "platform",
///   "description": "Authentication service",
///   "schema_version": "1.0.0",
///   "service_type": { "type": "rest" },
///   "endpoints": [ { "name": "login", "path": "/login", "method": "POST" } ],
///   "dependencies": [
///     { "service": "user-service", "version_constraint": ">=1.0.0", "required": true }
///   ],
///   "metadata": { "team": "platform" }
/// }
/// @endcode

#include "fwd.hpp"
#include <keel/core/error.hpp>

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace keel_catalog {

// =============================================================================
// ServiceState
// =============================================================================

/// Lifecycle state of a service record
///
/// Inactive -> Validating -> {Active | Error}; any configuration update or
/// validation pass moves a record back to Validating.
enum class ServiceState : std::uint8_t {
    Inactive,
    Validating,
    Active,
    Error,
};

[[nodiscard]] const char* service_state_to_string(ServiceState state) noexcept;

/// Check whether a state transition is allowed
[[nodiscard]] constexpr bool can_transition(ServiceState from, ServiceState to) noexcept {
    switch (to) {
        case ServiceState::Validating:
            return true;
        case ServiceState::Active:
        case ServiceState::Error:
            return from == ServiceState::Validating;
        case ServiceState::Inactive:
            return false;
    }
    return false;
}

// =============================================================================
// ServiceType
// =============================================================================

enum class ServiceTypeKind : std::uint8_t {
    Rest,
    Grpc,
    GraphQL,
    EventDriven,
    Other,
};

[[nodiscard]] const char* service_type_kind_to_string(ServiceTypeKind kind) noexcept;

/// Parse manifest type tag ("rest", "grpc", "graphql", "eventdriven", "other")
[[nodiscard]] std::optional<ServiceTypeKind> service_type_kind_from_string(const std::string& str) noexcept;

struct ServiceType {
    ServiceTypeKind kind = ServiceTypeKind::Other;
    std::string custom_type;  ///< Only meaningful for Other

    [[nodiscard]] std::string to_string() const;
};

// =============================================================================
// Manifest Parts
// =============================================================================

struct Endpoint {
    std::string name;
    std::string path;
    std::optional<std::string> method;
    std::optional<std::string> description;
};

/// Declared dependency of one service on another
struct DependencySpec {
    std::string target;
    std::optional<std::string> version_constraint;
    bool required = true;
};

// =============================================================================
// ServiceStatus
// =============================================================================

struct ServiceStatus {
    ServiceState state = ServiceState::Inactive;
    std::optional<std::string> error_message;
    std::vector<std::string> warnings;
    std::chrono::system_clock::time_point last_checked = std::chrono::system_clock::now();

    /// Move to another state, stamping last_checked
    ///
    /// Returns false (status unchanged) if the transition is not allowed.
    [[nodiscard]] bool transition_to(ServiceState next);
};

// =============================================================================
// ServiceRecord
// =============================================================================

/// Service names double as store keys and file names. A valid name is
/// non-empty and contains no path separator ('/' or '\') and no "..".
[[nodiscard]] bool is_valid_service_name(const std::string& name) noexcept;

/// Default schema version for manifests that omit one
inline constexpr const char* kDefaultSchemaVersion = "1.0.0";

struct ServiceRecord {
    std::string name;
    std::string declared_version;
    std::string namespace_name;
    std::string description;
    std::string owner;
    std::string documentation_url;
    std::string schema_version = kDefaultSchemaVersion;
    ServiceType service_type;
    std::vector<Endpoint> endpoints;
    std::vector<DependencySpec> dependencies;
    nlohmann::json config_payload = nlohmann::json::object();  ///< Full manifest document
    ServiceStatus status;
    std::chrono::system_clock::time_point last_updated = std::chrono::system_clock::now();
    std::uint64_t generation = 0;  ///< Bumped by the registry on every update

    /// Build a record from a parsed manifest
    ///
    /// Parsing is lenient: fields with the wrong shape are left at their
    /// defaults so the structural validator can report them later. Only a
    /// non-object document is rejected. The registry key is always
    /// `registry_name`, whatever the manifest's own "name" field says.
    [[nodiscard]] static keel_core::Result<ServiceRecord> from_json(
        const nlohmann::json& j, const std::string& registry_name);

    /// Parse manifest text and build a record
    [[nodiscard]] static keel_core::Result<ServiceRecord> from_json_string(
        const std::string& text, const std::string& registry_name);

    /// Find a declared dependency by target name
    [[nodiscard]] const DependencySpec* find_dependency(const std::string& target) const;
};

} // namespace keel_catalog
