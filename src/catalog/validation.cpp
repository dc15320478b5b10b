/// @file validation.cpp
/// @brief Catalog validation pass

#include <keel/catalog/validation.hpp>
#include <keel/catalog/dependency_graph.hpp>
#include <keel/catalog/dependency_validator.hpp>
#include <keel/catalog/graph_algorithms.hpp>
#include <keel/catalog/schema.hpp>
#include <keel/catalog/version.hpp>
#include <keel/core/log.hpp>

#include <string>

namespace keel_catalog {

// =============================================================================
// ValidationSummary
// =============================================================================

std::size_t ValidationSummary::warning_count() const noexcept {
    std::size_t count = 0;
    for (const auto& [service, messages] : warnings) {
        count += messages.size();
    }
    return count;
}

void ValidationSummary::add_warning(const std::string& service, const std::string& warning) {
    warnings[service].push_back(warning);
}

const std::string* ValidationSummary::failure_reason(const std::string& service) const {
    for (const auto& [name, reason] : failed) {
        if (name == service) {
            return &reason;
        }
    }
    return nullptr;
}

// =============================================================================
// Helpers
// =============================================================================

namespace {

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

bool has_value(const nlohmann::json& j, const char* key) {
    return j.is_object() && j.contains(key) && !j[key].is_null();
}

/// Reference declared either under metadata or at the top level
bool declares(const nlohmann::json& payload, const char* metadata_key, const char* top_level_key) {
    if (has_value(payload, "metadata") && has_value(payload["metadata"], metadata_key)) {
        return true;
    }
    return has_value(payload, top_level_key);
}

void set_state(ServiceRecord& record, ServiceState next) {
    if (!record.status.transition_to(next)) {
        keel_core::catalog_logger()->error("[ValidationOrchestrator] Illegal transition {} -> {} for '{}'",
            service_state_to_string(record.status.state), service_state_to_string(next), record.name);
    }
}

} // anonymous namespace

// =============================================================================
// ValidationOrchestrator
// =============================================================================

ValidationOrchestrator::ValidationOrchestrator(std::shared_ptr<const ISchemaValidator> schema_validator)
    : m_schema_validator(std::move(schema_validator)) {}

std::vector<std::string> ValidationOrchestrator::type_heuristics(const ServiceRecord& record) {
    std::vector<std::string> warnings;
    const auto& payload = record.config_payload;

    switch (record.service_type.kind) {
        case ServiceTypeKind::Rest:
            for (const auto& endpoint : record.endpoints) {
                if (!endpoint.method || endpoint.method->empty()) {
                    warnings.push_back("REST endpoint '" + endpoint.name + "' does not declare a method");
                }
            }
            break;
        case ServiceTypeKind::GraphQL:
            if (!declares(payload, "schema", "schema_path")) {
                warnings.push_back("GraphQL service does not declare a schema reference (metadata.schema or schema_path)");
            }
            break;
        case ServiceTypeKind::Grpc:
            if (!declares(payload, "proto", "proto_files")) {
                warnings.push_back("gRPC service does not declare proto sources (metadata.proto or proto_files)");
            }
            break;
        case ServiceTypeKind::EventDriven:
            if (!declares(payload, "topics", "topics")) {
                warnings.push_back("Event-driven service does not declare topics (metadata.topics or topics)");
            }
            break;
        case ServiceTypeKind::Other:
            if (record.description.empty()) {
                warnings.push_back("Service of type '" + record.service_type.to_string() +
                                   "' should carry a description");
            }
            break;
    }

    return warnings;
}

void ValidationOrchestrator::check_schema_version(const ServiceRecord& record,
                                                  std::vector<std::string>& errors,
                                                  std::vector<std::string>& warnings) {
    switch (classify(record.schema_version, kCurrentSchemaVersion)) {
        case VersionCompatibility::Compatible:
            break;
        case VersionCompatibility::MinorIncompatible:
            warnings.push_back("Minor schema version incompatibility: config version " +
                               record.schema_version + " vs current " + kCurrentSchemaVersion);
            break;
        case VersionCompatibility::MajorIncompatible:
            errors.push_back("Schema version " + record.schema_version +
                             " is incompatible with current version " + kCurrentSchemaVersion);
            break;
    }
}

ValidationSummary ValidationOrchestrator::run(std::vector<ServiceRecord>& records) const {
    KEEL_LOG_SCOPE("ValidationOrchestrator::run");
    auto logger = keel_core::catalog_logger();

    ValidationSummary summary;

    for (auto& record : records) {
        set_state(record, ServiceState::Validating);
    }

    DependencyGraph graph = build_graph(records);
    logger->debug("[ValidationOrchestrator] Graph: {} services, {} dependencies",
        graph.node_count(), graph.edge_count());

    // Cycles are advisory here; ordering requests over them still fail
    std::map<std::string, std::vector<std::string>> cycle_warnings;
    if (auto cycle = detect_cycles(graph)) {
        logger->warn("[ValidationOrchestrator] {}", cycle->description);
        summary.add_warning(kSystemWarningKey, cycle->description);

        std::string path = CycleInfo::format_path(cycle->path);
        for (std::size_t i = 0; i + 1 < cycle->path.size(); ++i) {
            cycle_warnings[cycle->path[i]].push_back("Service is part of a dependency cycle: " + path);
        }
    }

    for (auto& record : records) {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        if (auto it = cycle_warnings.find(record.name); it != cycle_warnings.end()) {
            warnings = it->second;
        }

        DependencyReport report = validate_dependencies(record, graph);
        errors = std::move(report.errors);
        warnings.insert(warnings.end(), report.warnings.begin(), report.warnings.end());

        if (errors.empty() && m_schema_validator) {
            auto structural = m_schema_validator->validate(record.config_payload);
            if (!structural) {
                errors.push_back(structural.error().message());
            }
        }

        if (errors.empty()) {
            check_schema_version(record, errors, warnings);
        }

        if (errors.empty()) {
            auto hints = type_heuristics(record);
            warnings.insert(warnings.end(), hints.begin(), hints.end());
        }

        for (const auto& warning : warnings) {
            summary.add_warning(record.name, warning);
        }
        record.status.warnings = warnings;

        if (errors.empty()) {
            set_state(record, ServiceState::Active);
            summary.successful.insert(record.name);
            logger->debug("[ValidationOrchestrator] '{}' is active ({} warning(s))",
                record.name, warnings.size());
        } else {
            std::string reason = join(errors, "; ");
            set_state(record, ServiceState::Error);
            record.status.error_message = reason;
            summary.failed.emplace_back(record.name, reason);
            logger->warn("[ValidationOrchestrator] '{}' failed validation: {}", record.name, reason);
        }
    }

    summary.timestamp = std::chrono::system_clock::now();
    keel_core::log_structured(spdlog::level::info, logger->name(), "[ValidationOrchestrator] Validation pass complete", {
        {"total", std::to_string(summary.total_count())},
        {"successful", std::to_string(summary.successful_count())},
        {"failed", std::to_string(summary.failed_count())},
        {"warnings", std::to_string(summary.warning_count())},
    });

    return summary;
}

ValidationSummary run_catalog_validation(std::vector<ServiceRecord>& records,
                                         std::shared_ptr<const ISchemaValidator> schema_validator) {
    ValidationOrchestrator orchestrator(std::move(schema_validator));
    return orchestrator.run(records);
}

} // namespace keel_catalog
