/// @file service.cpp
/// @brief Service record parsing and status transitions

#include <keel/catalog/service.hpp>

namespace keel_catalog {

// =============================================================================
// Enum Conversions
// =============================================================================

const char* service_state_to_string(ServiceState state) noexcept {
    switch (state) {
        case ServiceState::Inactive: return "Inactive";
        case ServiceState::Validating: return "Validating";
        case ServiceState::Active: return "Active";
        case ServiceState::Error: return "Error";
    }
    return "Unknown";
}

const char* service_type_kind_to_string(ServiceTypeKind kind) noexcept {
    switch (kind) {
        case ServiceTypeKind::Rest: return "rest";
        case ServiceTypeKind::Grpc: return "grpc";
        case ServiceTypeKind::GraphQL: return "graphql";
        case ServiceTypeKind::EventDriven: return "eventdriven";
        case ServiceTypeKind::Other: return "other";
    }
    return "other";
}

std::optional<ServiceTypeKind> service_type_kind_from_string(const std::string& str) noexcept {
    if (str == "rest") return ServiceTypeKind::Rest;
    if (str == "grpc") return ServiceTypeKind::Grpc;
    if (str == "graphql") return ServiceTypeKind::GraphQL;
    if (str == "eventdriven") return ServiceTypeKind::EventDriven;
    if (str == "other") return ServiceTypeKind::Other;
    return std::nullopt;
}

std::string ServiceType::to_string() const {
    if (kind == ServiceTypeKind::Other && !custom_type.empty()) {
        return "other(" + custom_type + ")";
    }
    return service_type_kind_to_string(kind);
}

// =============================================================================
// ServiceStatus
// =============================================================================

bool ServiceStatus::transition_to(ServiceState next) {
    if (!can_transition(state, next)) {
        return false;
    }
    state = next;
    if (next != ServiceState::Error) {
        error_message.reset();
    }
    last_checked = std::chrono::system_clock::now();
    return true;
}

// =============================================================================
// Manifest Parsing
// =============================================================================

namespace {

std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

std::optional<std::string> optional_string_field(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

ServiceType parse_service_type(const nlohmann::json& j) {
    ServiceType type;
    if (!j.is_object()) {
        return type;
    }

    std::string tag = string_field(j, "type");
    if (auto kind = service_type_kind_from_string(tag)) {
        type.kind = *kind;
    } else if (!tag.empty()) {
        // Unrecognized tags are kept as custom types
        type.kind = ServiceTypeKind::Other;
        type.custom_type = tag;
    }

    if (type.kind == ServiceTypeKind::Other) {
        if (auto custom = optional_string_field(j, "custom_type")) {
            type.custom_type = *custom;
        }
    }
    return type;
}

std::vector<Endpoint> parse_endpoints(const nlohmann::json& arr) {
    std::vector<Endpoint> endpoints;
    if (!arr.is_array()) {
        return endpoints;
    }

    for (const auto& item : arr) {
        if (!item.is_object()) continue;
        Endpoint endpoint;
        endpoint.name = string_field(item, "name");
        endpoint.path = string_field(item, "path");
        endpoint.method = optional_string_field(item, "method");
        endpoint.description = optional_string_field(item, "description");
        endpoints.push_back(std::move(endpoint));
    }
    return endpoints;
}

std::vector<DependencySpec> parse_dependencies(const nlohmann::json& arr) {
    std::vector<DependencySpec> deps;
    if (!arr.is_array()) {
        return deps;
    }

    for (const auto& item : arr) {
        // Entries without a target are left to the structural validator
        if (!item.is_object() || !item.contains("service") || !item["service"].is_string()) {
            continue;
        }

        DependencySpec dep;
        dep.target = item["service"].get<std::string>();
        dep.version_constraint = optional_string_field(item, "version_constraint");
        if (item.contains("required") && item["required"].is_boolean()) {
            dep.required = item["required"].get<bool>();
        }
        deps.push_back(std::move(dep));
    }
    return deps;
}

} // anonymous namespace

keel_core::Result<ServiceRecord> ServiceRecord::from_json(
    const nlohmann::json& j, const std::string& registry_name) {

    if (!j.is_object()) {
        return keel_core::Err<ServiceRecord>(keel_core::Error(keel_core::ErrorCode::ParseError,
            "Invalid service config for '" + registry_name + "': expected a JSON object"));
    }

    ServiceRecord record;
    record.name = registry_name;
    record.declared_version = string_field(j, "version");
    record.namespace_name = string_field(j, "namespace");
    record.description = string_field(j, "description");
    record.owner = string_field(j, "owner");
    record.documentation_url = string_field(j, "documentation_url");
    if (auto schema_version = optional_string_field(j, "schema_version")) {
        record.schema_version = *schema_version;
    }
    if (j.contains("service_type")) {
        record.service_type = parse_service_type(j["service_type"]);
    }
    if (j.contains("endpoints")) {
        record.endpoints = parse_endpoints(j["endpoints"]);
    }
    if (j.contains("dependencies")) {
        record.dependencies = parse_dependencies(j["dependencies"]);
    }
    record.config_payload = j;

    return keel_core::Ok(std::move(record));
}

keel_core::Result<ServiceRecord> ServiceRecord::from_json_string(
    const std::string& text, const std::string& registry_name) {

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return keel_core::Err<ServiceRecord>(keel_core::Error(keel_core::ErrorCode::ParseError,
            "Invalid service config for '" + registry_name + "': " + e.what()));
    }

    return from_json(j, registry_name);
}

bool is_valid_service_name(const std::string& name) noexcept {
    if (name.empty()) {
        return false;
    }
    if (name.find_first_of("/\\") != std::string::npos) {
        return false;
    }
    return name.find("..") == std::string::npos;
}

const DependencySpec* ServiceRecord::find_dependency(const std::string& target) const {
    for (const auto& dep : dependencies) {
        if (dep.target == target) {
            return &dep;
        }
    }
    return nullptr;
}

} // namespace keel_catalog
