/// @file error.cpp
/// @brief Error handling implementation for keel_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics

#include <keel/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace keel_core {

// =============================================================================
// Error Message Formatting (Out-of-line for complex cases)
// =============================================================================

namespace detail {

const char* catalog_kind_name(CatalogError::Kind kind) {
    switch (kind) {
        case CatalogError::Kind::Cycle: return "Cycle";
        case CatalogError::Kind::ServiceNotFound: return "ServiceNotFound";
        case CatalogError::Kind::AlreadyRegistered: return "AlreadyRegistered";
        case CatalogError::Kind::DependencyPolicy: return "DependencyPolicy";
        case CatalogError::Kind::SchemaStructural: return "SchemaStructural";
        case CatalogError::Kind::InternalInvariant: return "InternalInvariant";
        default: return "Unknown";
    }
}

/// Format catalog error with full context
std::string format_catalog_error(const CatalogError& err) {
    std::ostringstream oss;
    oss << "[CatalogError:" << catalog_kind_name(err.kind) << "] " << err.message;

    if (!err.service.empty()) {
        oss << " (service: " << err.service << ")";
    }
    if (err.kind == CatalogError::Kind::DependencyPolicy && !err.details.empty()) {
        oss << " (blocking:";
        for (const auto& name : err.details) {
            oss << ' ' << name;
        }
        oss << ")";
    }

    return oss.str();
}

/// Format store error with full context
std::string format_store_error(const StoreError& err) {
    std::ostringstream oss;
    oss << "[StoreError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, CatalogError>) {
            oss << detail::format_catalog_error(err);
        } else if constexpr (std::is_same_v<T, StoreError>) {
            oss << detail::format_store_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::size_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> catalog_errors{0};
    std::atomic<std::uint64_t> store_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<CatalogError>()) {
        s_error_stats.catalog_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<StoreError>()) {
        s_error_stats.store_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.catalog_errors.store(0, std::memory_order_relaxed);
    s_error_stats.store_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Catalog: " << s_error_stats.catalog_errors.load() << "\n"
        << "  Store: " << s_error_stats.store_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace keel_core
