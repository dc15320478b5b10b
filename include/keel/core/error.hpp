#pragma once

/// @file error.hpp
/// @brief Error handling types for keel_core
///
/// Errors are split in two layers:
/// - CatalogError: domain failures of the dependency engine (cycles, missing
///   services, policy violations, structural schema failures)
/// - StoreError: infrastructure failures (file system, parsing of stored text)
///
/// The layers meet only at the registry/CLI boundary, where a store failure is
/// wrapped with context describing the catalog operation that triggered it.

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace keel_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    IncompatibleVersion,
    DependencyMissing,
    DependencyCycle,
    PolicyViolation,
    InternalInvariant,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        case ErrorCode::DependencyMissing: return "DependencyMissing";
        case ErrorCode::DependencyCycle: return "DependencyCycle";
        case ErrorCode::PolicyViolation: return "PolicyViolation";
        case ErrorCode::InternalInvariant: return "InternalInvariant";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Dependency engine errors
struct CatalogError {
    enum class Kind : std::uint8_t {
        Cycle,              // Ordering requested over a cyclic subgraph
        ServiceNotFound,    // Requested root or target is not registered
        AlreadyRegistered,  // Service name already taken
        DependencyPolicy,   // Hard branch of the dependency policy
        SchemaStructural,   // Payload rejected by the structural validator
        InternalInvariant,  // Algorithm postcondition violated (bug)
    };

    Kind kind;
    std::string message;
    std::string service;               // Offending or requested service
    std::vector<std::string> details;  // Cycle path, blocking dependents or schema messages

    [[nodiscard]] static CatalogError cycle(std::vector<std::string> path) {
        std::string text = "Dependency cycle detected: ";
        for (std::size_t i = 0; i < path.size(); ++i) {
            if (i > 0) text += " -> ";
            text += path[i];
        }
        std::string first = path.empty() ? std::string{} : path.front();
        return CatalogError{Kind::Cycle, std::move(text), std::move(first), std::move(path)};
    }

    [[nodiscard]] static CatalogError service_not_found(const std::string& name) {
        return CatalogError{Kind::ServiceNotFound, "Service '" + name + "' not found", name, {}};
    }

    [[nodiscard]] static CatalogError already_registered(const std::string& name) {
        return CatalogError{Kind::AlreadyRegistered, "Service '" + name + "' already registered", name, {}};
    }

    [[nodiscard]] static CatalogError dependency_policy(const std::string& name,
                                                        const std::string& reason,
                                                        std::vector<std::string> blocking = {}) {
        return CatalogError{Kind::DependencyPolicy, reason, name, std::move(blocking)};
    }

    [[nodiscard]] static CatalogError schema_structural(const std::string& name,
                                                       std::vector<std::string> messages) {
        std::string text = "Schema validation failed: ";
        for (std::size_t i = 0; i < messages.size(); ++i) {
            if (i > 0) text += ", ";
            text += messages[i];
        }
        return CatalogError{Kind::SchemaStructural, std::move(text), name, std::move(messages)};
    }

    [[nodiscard]] static CatalogError internal_invariant(const std::string& reason) {
        return CatalogError{Kind::InternalInvariant, "Internal invariant violated: " + reason, {}, {}};
    }
};

/// Configuration store errors
struct StoreError {
    enum class Kind : std::uint8_t {
        NotFound,     // No stored configuration under that name
        ReadFailed,   // Could not read stored text
        WriteFailed,  // Could not write stored text
        ParseFailed,  // Stored text is not well-formed
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static StoreError not_found(const std::string& p) {
        return StoreError{Kind::NotFound, "Configuration file not found: " + p, p};
    }

    [[nodiscard]] static StoreError read_failed(const std::string& p, const std::string& reason) {
        return StoreError{Kind::ReadFailed, "Failed to read configuration file " + p + ": " + reason, p};
    }

    [[nodiscard]] static StoreError write_failed(const std::string& p, const std::string& reason) {
        return StoreError{Kind::WriteFailed, "Failed to write configuration file " + p + ": " + reason, p};
    }

    [[nodiscard]] static StoreError parse_failed(const std::string& p, const std::string& reason) {
        return StoreError{Kind::ParseFailed, "Failed to parse configuration " + p + ": " + reason, p};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        CatalogError,
        StoreError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(CatalogError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(StoreError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(CatalogError::Kind kind) {
        switch (kind) {
            case CatalogError::Kind::Cycle: return ErrorCode::DependencyCycle;
            case CatalogError::Kind::ServiceNotFound: return ErrorCode::NotFound;
            case CatalogError::Kind::AlreadyRegistered: return ErrorCode::AlreadyExists;
            case CatalogError::Kind::DependencyPolicy: return ErrorCode::PolicyViolation;
            case CatalogError::Kind::SchemaStructural: return ErrorCode::ValidationError;
            case CatalogError::Kind::InternalInvariant: return ErrorCode::InternalInvariant;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(StoreError::Kind kind) {
        switch (kind) {
            case StoreError::Kind::NotFound: return ErrorCode::NotFound;
            case StoreError::Kind::ReadFailed: return ErrorCode::IOError;
            case StoreError::Kind::WriteFailed: return ErrorCode::IOError;
            case StoreError::Kind::ParseFailed: return ErrorCode::ParseError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type holding either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind details and context
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace keel_core
