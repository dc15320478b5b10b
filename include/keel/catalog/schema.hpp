#pragma once

/// @file schema.hpp
/// @brief Structural validation of service manifests
///
/// The catalog core consumes an ISchemaValidator and never inspects payload
/// structure itself. ServiceSchemaValidator is the default implementation: a
/// declarative field schema for the service manifest format that reports
/// every violation it finds, not just the first.

#include "fwd.hpp"
#include <keel/core/error.hpp>

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace keel_catalog {

// =============================================================================
// FieldType
// =============================================================================

enum class FieldType : std::uint8_t {
    String,
    Integer,
    Number,
    Boolean,
    Array,
    Object,
    Any,
};

[[nodiscard]] const char* field_type_to_string(FieldType type) noexcept;

// =============================================================================
// FieldSchema / ObjectSchema
// =============================================================================

/// Schema for a single field
struct FieldSchema {
    std::string name;
    FieldType type = FieldType::Any;
    bool required = false;
    std::vector<std::string> allowed_values;         ///< For String, empty = any
    std::shared_ptr<const ObjectSchema> object;      ///< For Object
    std::shared_ptr<const ObjectSchema> element;     ///< For Array of objects

    /// Validate a present value, appending messages prefixed with path
    void validate(const nlohmann::json& value, const std::string& path,
                  std::vector<std::string>& errors) const;
};

/// Schema for a JSON object
struct ObjectSchema {
    std::vector<FieldSchema> fields;

    /// Validate an object, appending messages prefixed with path
    void validate(const nlohmann::json& value, const std::string& path,
                  std::vector<std::string>& errors) const;

    [[nodiscard]] const FieldSchema* get_field(const std::string& field_name) const;
};

// =============================================================================
// ISchemaValidator
// =============================================================================

/// Structural validator for service configuration payloads
class ISchemaValidator {
public:
    virtual ~ISchemaValidator() = default;

    /// Validate a payload; on failure the error is a SchemaStructural
    /// CatalogError whose details list every message
    [[nodiscard]] virtual keel_core::Result<void> validate(const nlohmann::json& payload) const = 0;
};

// =============================================================================
// ServiceSchemaValidator
// =============================================================================

/// Validator for the service manifest format
class ServiceSchemaValidator : public ISchemaValidator {
public:
    ServiceSchemaValidator();

    [[nodiscard]] keel_core::Result<void> validate(const nlohmann::json& payload) const override;

    [[nodiscard]] const ObjectSchema& schema() const noexcept { return m_schema; }

    /// The manifest schema used by default-constructed validators
    [[nodiscard]] static ObjectSchema service_schema();

private:
    ObjectSchema m_schema;
};

} // namespace keel_catalog
