/// @file registry.cpp
/// @brief ServiceRegistry implementation

#include <keel/catalog/registry.hpp>
#include <keel/catalog/lifecycle.hpp>
#include <keel/core/log.hpp>
#include <algorithm>

namespace keel_catalog {

namespace {

keel_core::Error with_operation(keel_core::Error error, const char* operation, const std::string& name) {
    error.with_context("operation", operation);
    error.with_context("service", name);
    keel_core::debug::record_error(error);
    return error;
}

template<typename T>
keel_core::Result<T> not_found(const std::string& name) {
    return keel_core::Err<T>(keel_core::CatalogError::service_not_found(name));
}

} // anonymous namespace

// =============================================================================
// CatalogSnapshot
// =============================================================================

bool CatalogSnapshot::contains(const std::string& name) const {
    return std::any_of(records.begin(), records.end(),
        [&name](const ServiceRecord& record) { return record.name == name; });
}

// =============================================================================
// Construction
// =============================================================================

ServiceRegistry::ServiceRegistry(std::shared_ptr<IConfigStore> store,
                                 std::shared_ptr<const ISchemaValidator> schema_validator,
                                 std::string default_namespace)
    : m_store(std::move(store))
    , m_schema_validator(std::move(schema_validator))
    , m_default_namespace(std::move(default_namespace)) {}

keel_core::Result<ServiceRecord> ServiceRegistry::parse_record(
    const std::string& name, const std::string& config_text) const {

    auto record = ServiceRecord::from_json_string(config_text, name);
    if (!record) {
        return record;
    }
    if (record->namespace_name.empty()) {
        record->namespace_name = m_default_namespace;
    }
    return record;
}

// =============================================================================
// Registration
// =============================================================================

keel_core::Result<void> ServiceRegistry::register_service(const std::string& name, const std::string& config_text) {
    if (!is_valid_service_name(name)) {
        return keel_core::Err(with_operation(keel_core::Error(keel_core::ErrorCode::InvalidArgument,
            "Invalid service name '" + name + "'"), "register", name));
    }

    auto record = parse_record(name, config_text);
    if (!record) {
        return keel_core::Err(with_operation(record.error(), "register", name));
    }

    std::lock_guard<std::mutex> write_lock(m_write_mutex);

    {
        std::shared_lock lock(m_mutex);
        if (m_services.count(name)) {
            return keel_core::Err(with_operation(
                keel_core::CatalogError::already_registered(name), "register", name));
        }
    }

    if (m_store) {
        if (auto saved = m_store->save(name, config_text); !saved) {
            return keel_core::Err(with_operation(saved.error(), "register", name));
        }
    }

    {
        std::unique_lock lock(m_mutex);
        record->generation = m_next_generation++;
        record->last_updated = std::chrono::system_clock::now();
        m_services.emplace(name, std::move(*record));
    }

    keel_core::registry_logger()->info("[ServiceRegistry] Registered '{}'", name);
    return keel_core::Ok();
}

keel_core::Result<void> ServiceRegistry::update_service(const std::string& name, const std::string& config_text) {
    auto record = parse_record(name, config_text);
    if (!record) {
        return keel_core::Err(with_operation(record.error(), "update", name));
    }

    std::lock_guard<std::mutex> write_lock(m_write_mutex);

    ServiceStatus status;
    {
        std::shared_lock lock(m_mutex);
        auto it = m_services.find(name);
        if (it == m_services.end()) {
            return keel_core::Err(with_operation(
                keel_core::CatalogError::service_not_found(name), "update", name));
        }
        status = it->second.status;
    }

    status.warnings.clear();
    if (!status.transition_to(ServiceState::Validating)) {
        return keel_core::Err(with_operation(keel_core::Error(keel_core::ErrorCode::InvalidState,
            "Service cannot return to validation"), "update", name));
    }

    if (m_store) {
        if (auto saved = m_store->save(name, config_text); !saved) {
            return keel_core::Err(with_operation(saved.error(), "update", name));
        }
    }

    {
        std::unique_lock lock(m_mutex);
        record->status = std::move(status);
        record->generation = m_next_generation++;
        record->last_updated = std::chrono::system_clock::now();
        m_services.insert_or_assign(name, std::move(*record));
    }

    keel_core::registry_logger()->info("[ServiceRegistry] Updated '{}'", name);
    return keel_core::Ok();
}

keel_core::Result<std::size_t> ServiceRegistry::load_services() {
    if (!m_store) {
        return keel_core::Err<std::size_t>(keel_core::Error(keel_core::ErrorCode::InvalidState,
            "No configuration store attached"));
    }

    std::lock_guard<std::mutex> write_lock(m_write_mutex);

    auto names = m_store->list();
    if (!names) {
        auto error = names.error();
        error.with_context("operation", "load");
        return keel_core::Err<std::size_t>(std::move(error));
    }

    std::vector<ServiceRecord> loaded;
    for (const auto& name : *names) {
        auto text = m_store->load(name);
        if (!text) {
            keel_core::registry_logger()->warn("[ServiceRegistry] Skipping '{}': {}", name, text.error().message());
            keel_core::debug::record_error(text.error());
            continue;
        }
        auto record = parse_record(name, *text);
        if (!record) {
            keel_core::registry_logger()->warn("[ServiceRegistry] Skipping '{}': {}", name, record.error().message());
            keel_core::debug::record_error(record.error());
            continue;
        }
        loaded.push_back(std::move(*record));
    }

    std::size_t count = loaded.size();
    {
        std::unique_lock lock(m_mutex);
        for (auto& record : loaded) {
            record.generation = m_next_generation++;
            record.last_updated = std::chrono::system_clock::now();
            std::string key = record.name;
            m_services.insert_or_assign(std::move(key), std::move(record));
        }
    }

    keel_core::registry_logger()->info("[ServiceRegistry] Loaded {} of {} service(s) from store",
        count, names->size());
    return keel_core::Ok(count);
}

keel_core::Result<std::vector<std::string>> ServiceRegistry::delete_service(const std::string& name, bool force) {
    std::lock_guard<std::mutex> write_lock(m_write_mutex);

    // No writer can change the catalog between this check and the erase
    auto graph = snapshot().graph();

    auto impacted = check_deletion(graph, name, force);
    if (!impacted) {
        return keel_core::Err<std::vector<std::string>>(with_operation(impacted.error(), "delete", name));
    }

    if (m_store) {
        if (auto removed = m_store->remove(name); !removed) {
            return keel_core::Err<std::vector<std::string>>(with_operation(removed.error(), "delete", name));
        }
    }

    {
        std::unique_lock lock(m_mutex);
        m_services.erase(name);
    }

    keel_core::registry_logger()->info("[ServiceRegistry] Deleted '{}' ({} dependent(s) impacted)",
        name, impacted->size());
    return impacted;
}

// =============================================================================
// Queries
// =============================================================================

keel_core::Result<ServiceRecord> ServiceRegistry::get_service(const std::string& name) const {
    std::shared_lock lock(m_mutex);
    auto it = m_services.find(name);
    if (it == m_services.end()) {
        return not_found<ServiceRecord>(name);
    }
    return keel_core::Ok(it->second);
}

std::vector<std::string> ServiceRegistry::list_services() const {
    std::shared_lock lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_services.size());
    for (const auto& [name, record] : m_services) {
        names.push_back(name);
    }
    return names;
}

std::size_t ServiceRegistry::size() const {
    std::shared_lock lock(m_mutex);
    return m_services.size();
}

CatalogSnapshot ServiceRegistry::snapshot() const {
    std::shared_lock lock(m_mutex);
    CatalogSnapshot snap;
    snap.records.reserve(m_services.size());
    for (const auto& [name, record] : m_services) {
        snap.records.push_back(record);
    }
    return snap;
}

// =============================================================================
// Analyses
// =============================================================================

ValidationSummary ServiceRegistry::validate_all_services() {
    auto snap = snapshot();

    ValidationOrchestrator orchestrator(m_schema_validator);
    ValidationSummary summary = orchestrator.run(snap.records);

    std::size_t skipped = 0;
    {
        std::unique_lock lock(m_mutex);
        for (auto& record : snap.records) {
            auto it = m_services.find(record.name);
            if (it == m_services.end() || it->second.generation != record.generation) {
                ++skipped;
                continue;
            }
            it->second.status = std::move(record.status);
        }
    }

    if (skipped > 0) {
        keel_core::registry_logger()->debug(
            "[ServiceRegistry] {} service(s) changed during validation, kept newer state", skipped);
    }
    return summary;
}

keel_core::Result<std::vector<std::string>> ServiceRegistry::resolve_dependencies(
    const std::vector<std::string>& roots) const {
    return resolve_order(snapshot().graph(), roots);
}

std::optional<CycleInfo> ServiceRegistry::check_circular_dependencies() const {
    return detect_cycles(snapshot().graph());
}

keel_core::Result<std::vector<std::string>> ServiceRegistry::analyze_impact(const std::string& name) const {
    auto graph = snapshot().graph();
    if (!graph.contains(name)) {
        return not_found<std::vector<std::string>>(name);
    }
    return keel_core::Ok(find_impact(graph, name));
}

keel_core::Result<std::vector<ImpactInfo>> ServiceRegistry::analyze_impact_detailed(const std::string& name) const {
    auto graph = snapshot().graph();
    if (!graph.contains(name)) {
        return not_found<std::vector<ImpactInfo>>(name);
    }
    return keel_core::Ok(detailed_impact(graph, name));
}

keel_core::Result<std::vector<std::string>> ServiceRegistry::analyze_critical_impact(const std::string& name) const {
    auto graph = snapshot().graph();
    if (!graph.contains(name)) {
        return not_found<std::vector<std::string>>(name);
    }
    return keel_core::Ok(critical_impact(graph, name));
}

keel_core::Result<std::vector<std::string>> ServiceRegistry::start_order(const std::vector<std::string>& roots) const {
    return keel_catalog::start_order(snapshot().graph(), roots);
}

keel_core::Result<std::vector<std::string>> ServiceRegistry::stop_order(const std::vector<std::string>& roots) const {
    return keel_catalog::stop_order(snapshot().graph(), roots);
}

keel_core::Result<std::vector<std::string>> ServiceRegistry::delete_order(const std::vector<std::string>& roots) const {
    return keel_catalog::delete_order(snapshot().graph(), roots);
}

// =============================================================================
// Diagnostics
// =============================================================================

std::string ServiceRegistry::to_dot_graph() const {
    return snapshot().graph().to_dot_graph();
}

keel_core::Result<std::string> ServiceRegistry::format_dependency_tree(const std::string& root) const {
    auto graph = snapshot().graph();
    if (!graph.contains(root)) {
        return not_found<std::string>(root);
    }
    return keel_core::Ok(graph.format_dependency_tree(root));
}

} // namespace keel_catalog
