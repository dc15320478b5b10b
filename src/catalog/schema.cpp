/// @file schema.cpp
/// @brief Structural manifest validation

#include <keel/catalog/schema.hpp>
#include <algorithm>

namespace keel_catalog {

const char* field_type_to_string(FieldType type) noexcept {
    switch (type) {
        case FieldType::String: return "string";
        case FieldType::Integer: return "integer";
        case FieldType::Number: return "number";
        case FieldType::Boolean: return "boolean";
        case FieldType::Array: return "array";
        case FieldType::Object: return "object";
        case FieldType::Any: return "any";
    }
    return "any";
}

// =============================================================================
// FieldSchema
// =============================================================================

namespace {

bool matches_type(FieldType type, const nlohmann::json& value) {
    switch (type) {
        case FieldType::String: return value.is_string();
        case FieldType::Integer: return value.is_number_integer();
        case FieldType::Number: return value.is_number();
        case FieldType::Boolean: return value.is_boolean();
        case FieldType::Array: return value.is_array();
        case FieldType::Object: return value.is_object();
        case FieldType::Any: return true;
    }
    return false;
}

std::string join_path(const std::string& path, const std::string& name) {
    return path.empty() ? name : path + "." + name;
}

FieldSchema string_field(const std::string& name, bool required) {
    FieldSchema field;
    field.name = name;
    field.type = FieldType::String;
    field.required = required;
    return field;
}

} // anonymous namespace

void FieldSchema::validate(const nlohmann::json& value, const std::string& path,
                           std::vector<std::string>& errors) const {
    if (!matches_type(type, value)) {
        errors.push_back("Field '" + path + "': expected " + field_type_to_string(type));
        return;
    }

    if (type == FieldType::String && !allowed_values.empty()) {
        const auto& str = value.get_ref<const std::string&>();
        if (std::find(allowed_values.begin(), allowed_values.end(), str) == allowed_values.end()) {
            std::string allowed;
            for (std::size_t i = 0; i < allowed_values.size(); ++i) {
                if (i > 0) allowed += ", ";
                allowed += allowed_values[i];
            }
            errors.push_back("Field '" + path + "': value '" + str + "' is not one of [" + allowed + "]");
        }
    }

    if (type == FieldType::Object && object) {
        object->validate(value, path, errors);
    }

    if (type == FieldType::Array && element) {
        for (std::size_t i = 0; i < value.size(); ++i) {
            std::string item_path = path + "[" + std::to_string(i) + "]";
            if (!value[i].is_object()) {
                errors.push_back("Field '" + item_path + "': expected object");
                continue;
            }
            element->validate(value[i], item_path, errors);
        }
    }
}

// =============================================================================
// ObjectSchema
// =============================================================================

void ObjectSchema::validate(const nlohmann::json& value, const std::string& path,
                            std::vector<std::string>& errors) const {
    if (!value.is_object()) {
        errors.push_back("Field '" + (path.empty() ? std::string("<root>") : path) + "': expected object");
        return;
    }

    for (const auto& field : fields) {
        std::string field_path = join_path(path, field.name);
        auto it = value.find(field.name);
        if (it == value.end() || it->is_null()) {
            if (field.required) {
                errors.push_back("Missing required field '" + field_path + "'");
            }
            continue;
        }
        field.validate(*it, field_path, errors);
    }
}

const FieldSchema* ObjectSchema::get_field(const std::string& field_name) const {
    for (const auto& field : fields) {
        if (field.name == field_name) {
            return &field;
        }
    }
    return nullptr;
}

// =============================================================================
// ServiceSchemaValidator
// =============================================================================

ServiceSchemaValidator::ServiceSchemaValidator()
    : m_schema(service_schema()) {}

ObjectSchema ServiceSchemaValidator::service_schema() {
    auto service_type = std::make_shared<ObjectSchema>();
    {
        FieldSchema type = string_field("type", true);
        type.allowed_values = {"rest", "grpc", "graphql", "eventdriven", "other"};
        service_type->fields.push_back(std::move(type));
        service_type->fields.push_back(string_field("custom_type", false));
    }

    auto endpoint = std::make_shared<ObjectSchema>();
    endpoint->fields.push_back(string_field("name", true));
    endpoint->fields.push_back(string_field("path", true));
    endpoint->fields.push_back(string_field("method", false));
    endpoint->fields.push_back(string_field("description", false));

    auto dependency = std::make_shared<ObjectSchema>();
    dependency->fields.push_back(string_field("service", true));
    dependency->fields.push_back(string_field("version_constraint", false));
    dependency->fields.push_back(FieldSchema{"required", FieldType::Boolean, false, {}, nullptr, nullptr});

    ObjectSchema schema;
    schema.fields.push_back(string_field("name", true));
    schema.fields.push_back(string_field("version", true));
    schema.fields.push_back(string_field("namespace", false));
    schema.fields.push_back(string_field("description", false));
    schema.fields.push_back(string_field("owner", false));
    schema.fields.push_back(string_field("documentation_url", false));
    schema.fields.push_back(string_field("schema_version", false));
    schema.fields.push_back(FieldSchema{"service_type", FieldType::Object, true, {}, service_type, nullptr});
    schema.fields.push_back(FieldSchema{"endpoints", FieldType::Array, true, {}, nullptr, endpoint});
    schema.fields.push_back(FieldSchema{"dependencies", FieldType::Array, false, {}, nullptr, dependency});
    schema.fields.push_back(FieldSchema{"metadata", FieldType::Object, false, {}, nullptr, nullptr});
    return schema;
}

keel_core::Result<void> ServiceSchemaValidator::validate(const nlohmann::json& payload) const {
    std::vector<std::string> errors;
    m_schema.validate(payload, "", errors);

    // "other" carries its custom tag as content
    if (payload.is_object() && payload.contains("service_type")) {
        const auto& type = payload["service_type"];
        if (type.is_object() && type.contains("type") && type["type"] == "other" &&
            (!type.contains("custom_type") || !type["custom_type"].is_string())) {
            errors.push_back("Missing required field 'service_type.custom_type' for type 'other'");
        }
    }

    if (errors.empty()) {
        return keel_core::Ok();
    }

    std::string name;
    if (payload.is_object() && payload.contains("name") && payload["name"].is_string()) {
        name = payload["name"].get<std::string>();
    }
    return keel_core::Err(keel_core::CatalogError::schema_structural(name, std::move(errors)));
}

} // namespace keel_catalog
