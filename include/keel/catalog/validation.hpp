#pragma once

/// @file validation.hpp
/// @brief Catalog-wide validation pass
///
/// One pass rebuilds the dependency graph from the given records, reports
/// cycles as warnings, applies the dependency policy to every service,
/// hands surviving services to the structural validator, checks schema
/// versions and type-specific conventions, and finally moves every record to
/// Active or Error. A failure in one service never stops the others.

#include "fwd.hpp"
#include "service.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace keel_catalog {

/// Warning key for catalog-scope findings such as cycles
inline constexpr const char* kSystemWarningKey = "system";

/// Manifest schema version this build understands
inline constexpr const char* kCurrentSchemaVersion = "1.0.0";

// =============================================================================
// ValidationSummary
// =============================================================================

struct ValidationSummary {
    std::set<std::string> successful;
    std::vector<std::pair<std::string, std::string>> failed;  ///< (service, reason)
    std::map<std::string, std::vector<std::string>> warnings;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    [[nodiscard]] std::size_t successful_count() const noexcept { return successful.size(); }
    [[nodiscard]] std::size_t failed_count() const noexcept { return failed.size(); }
    [[nodiscard]] std::size_t total_count() const noexcept { return successful_count() + failed_count(); }

    /// Number of individual warning messages
    [[nodiscard]] std::size_t warning_count() const noexcept;

    [[nodiscard]] bool has_warnings() const noexcept { return !warnings.empty(); }
    [[nodiscard]] bool is_successful() const noexcept { return failed.empty(); }

    void add_warning(const std::string& service, const std::string& warning);

    /// Failure reason for a service, nullptr if it did not fail
    [[nodiscard]] const std::string* failure_reason(const std::string& service) const;
};

// =============================================================================
// ValidationOrchestrator
// =============================================================================

class ValidationOrchestrator {
public:
    /// @param schema_validator Structural validator, may be null to skip the check
    explicit ValidationOrchestrator(std::shared_ptr<const ISchemaValidator> schema_validator);

    /// Validate all records in place, updating each record's status
    [[nodiscard]] ValidationSummary run(std::vector<ServiceRecord>& records) const;

    /// Convention checks by service type (warnings only)
    [[nodiscard]] static std::vector<std::string> type_heuristics(const ServiceRecord& record);

    /// Compare a manifest schema version with kCurrentSchemaVersion
    ///
    /// Appends a hard error for major drift and a warning for minor drift.
    static void check_schema_version(const ServiceRecord& record,
                                     std::vector<std::string>& errors,
                                     std::vector<std::string>& warnings);

private:
    std::shared_ptr<const ISchemaValidator> m_schema_validator;
};

/// Run one validation pass over records with the given structural validator
[[nodiscard]] ValidationSummary run_catalog_validation(
    std::vector<ServiceRecord>& records,
    std::shared_ptr<const ISchemaValidator> schema_validator = nullptr);

} // namespace keel_catalog
