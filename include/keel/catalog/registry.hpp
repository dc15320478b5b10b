#pragma once

/// @file registry.hpp
/// @brief Thread-safe registry of service records
///
/// The registry owns every ServiceRecord behind one reader/writer lock.
/// Analyses never run under the lock: they copy a CatalogSnapshot, release
/// the lock and build a fresh DependencyGraph from the copy. Mutations are
/// serialized by a writer mutex held from their existence check through the
/// map update, so the store and the map never disagree. The exclusive map
/// lock is taken only for the map update itself.

#include "fwd.hpp"
#include "config_store.hpp"
#include "dependency_graph.hpp"
#include "graph_algorithms.hpp"
#include "impact.hpp"
#include "schema.hpp"
#include "service.hpp"
#include "validation.hpp"
#include <keel/core/error.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace keel_catalog {

/// Point-in-time copy of the registry contents
struct CatalogSnapshot {
    std::vector<ServiceRecord> records;

    [[nodiscard]] DependencyGraph graph() const { return build_graph(records); }

    [[nodiscard]] bool contains(const std::string& name) const;
};

class ServiceRegistry {
public:
    /// @param store Persistence for manifest text
    /// @param schema_validator Structural validator used by validation passes (may be null)
    /// @param default_namespace Namespace for manifests that do not declare one
    ServiceRegistry(std::shared_ptr<IConfigStore> store,
                    std::shared_ptr<const ISchemaValidator> schema_validator,
                    std::string default_namespace = "default");

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;
    ServiceRegistry(ServiceRegistry&&) = delete;
    ServiceRegistry& operator=(ServiceRegistry&&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register a new service from manifest text and persist it
    ///
    /// Unparsable text is rejected, as is a name failing
    /// `is_valid_service_name` (InvalidArgument). Structurally invalid
    /// manifests are stored and reported by the next validation pass.
    [[nodiscard]] keel_core::Result<void> register_service(const std::string& name, const std::string& config_text);

    /// Replace the manifest of an existing service; its state returns to Validating
    [[nodiscard]] keel_core::Result<void> update_service(const std::string& name, const std::string& config_text);

    /// Load every manifest from the store, replacing records of the same name
    ///
    /// Unparsable manifests are skipped and logged. Returns the number loaded.
    [[nodiscard]] keel_core::Result<std::size_t> load_services();

    /// Remove a service, gated by critical impact unless forced
    ///
    /// Returns every transitive dependent of the removed service.
    [[nodiscard]] keel_core::Result<std::vector<std::string>> delete_service(const std::string& name, bool force);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] keel_core::Result<ServiceRecord> get_service(const std::string& name) const;

    /// Registered names, sorted
    [[nodiscard]] std::vector<std::string> list_services() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] CatalogSnapshot snapshot() const;

    // =========================================================================
    // Analyses
    // =========================================================================

    /// Run one validation pass and write statuses back
    ///
    /// Records updated or removed while the pass ran keep their newer state.
    [[nodiscard]] ValidationSummary validate_all_services();

    [[nodiscard]] keel_core::Result<std::vector<std::string>> resolve_dependencies(
        const std::vector<std::string>& roots) const;

    [[nodiscard]] std::optional<CycleInfo> check_circular_dependencies() const;

    [[nodiscard]] keel_core::Result<std::vector<std::string>> analyze_impact(const std::string& name) const;

    [[nodiscard]] keel_core::Result<std::vector<ImpactInfo>> analyze_impact_detailed(const std::string& name) const;

    [[nodiscard]] keel_core::Result<std::vector<std::string>> analyze_critical_impact(const std::string& name) const;

    [[nodiscard]] keel_core::Result<std::vector<std::string>> start_order(const std::vector<std::string>& roots) const;

    [[nodiscard]] keel_core::Result<std::vector<std::string>> stop_order(const std::vector<std::string>& roots) const;

    [[nodiscard]] keel_core::Result<std::vector<std::string>> delete_order(const std::vector<std::string>& roots) const;

    // =========================================================================
    // Diagnostics
    // =========================================================================

    [[nodiscard]] std::string to_dot_graph() const;

    [[nodiscard]] keel_core::Result<std::string> format_dependency_tree(const std::string& root) const;

private:
    [[nodiscard]] keel_core::Result<ServiceRecord> parse_record(
        const std::string& name, const std::string& config_text) const;

    mutable std::shared_mutex m_mutex;  // Guards m_services
    std::mutex m_write_mutex;           // Serializes register/update/delete/load
    std::map<std::string, ServiceRecord> m_services;
    std::uint64_t m_next_generation = 1;

    std::shared_ptr<IConfigStore> m_store;
    std::shared_ptr<const ISchemaValidator> m_schema_validator;
    std::string m_default_namespace;
};

} // namespace keel_catalog
