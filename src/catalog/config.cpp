/// @file config.cpp
/// @brief Catalog configuration loading

#include <keel/catalog/config.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace keel_catalog {

namespace {

keel_core::Error config_error(const std::string& message) {
    return keel_core::Error(keel_core::ErrorCode::InvalidArgument, message);
}

/// Read an optional string member, failing on a wrong type
keel_core::Result<void> read_string(const nlohmann::json& section, const char* key,
                                    const char* section_name, std::string& out) {
    if (!section.contains(key)) {
        return keel_core::Ok();
    }
    if (!section[key].is_string()) {
        return keel_core::Err(config_error(
            std::string("'") + section_name + "." + key + "' must be a string"));
    }
    out = section[key].get<std::string>();
    return keel_core::Ok();
}

keel_core::Result<void> read_bool(const nlohmann::json& section, const char* key,
                                  const char* section_name, bool& out) {
    if (!section.contains(key)) {
        return keel_core::Ok();
    }
    if (!section[key].is_boolean()) {
        return keel_core::Err(config_error(
            std::string("'") + section_name + "." + key + "' must be a boolean"));
    }
    out = section[key].get<bool>();
    return keel_core::Ok();
}

} // anonymous namespace

keel_core::Result<CatalogConfig> CatalogConfig::from_json_string(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return keel_core::Err<CatalogConfig>(
            keel_core::Error(keel_core::ErrorCode::ParseError, std::string("Invalid configuration: ") + e.what()));
    }

    if (!j.is_object()) {
        return keel_core::Err<CatalogConfig>(config_error("Configuration root must be an object"));
    }

    CatalogConfig config;

    if (j.contains("catalog")) {
        const auto& catalog = j["catalog"];
        if (!catalog.is_object()) {
            return keel_core::Err<CatalogConfig>(config_error("'catalog' must be an object"));
        }
        if (auto r = read_string(catalog, "config_dir", "catalog", config.config_dir); !r) {
            return keel_core::Err<CatalogConfig>(r.error());
        }
        if (auto r = read_string(catalog, "default_namespace", "catalog", config.default_namespace); !r) {
            return keel_core::Err<CatalogConfig>(r.error());
        }
        if (auto r = read_string(catalog, "schema_version", "catalog", config.schema_version); !r) {
            return keel_core::Err<CatalogConfig>(r.error());
        }
    }

    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        if (!logging.is_object()) {
            return keel_core::Err<CatalogConfig>(config_error("'logging' must be an object"));
        }
        if (auto r = read_string(logging, "level", "logging", config.log_level); !r) {
            return keel_core::Err<CatalogConfig>(r.error());
        }
        if (auto r = read_bool(logging, "console", "logging", config.log_console); !r) {
            return keel_core::Err<CatalogConfig>(r.error());
        }
        if (auto r = read_bool(logging, "file", "logging", config.log_file); !r) {
            return keel_core::Err<CatalogConfig>(r.error());
        }
        if (auto r = read_string(logging, "directory", "logging", config.log_directory); !r) {
            return keel_core::Err<CatalogConfig>(r.error());
        }
    }

    if (!keel_core::parse_log_level(config.log_level)) {
        return keel_core::Err<CatalogConfig>(config_error("Unknown log level '" + config.log_level + "'"));
    }

    return keel_core::Ok(std::move(config));
}

keel_core::Result<CatalogConfig> CatalogConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return keel_core::Err<CatalogConfig>(keel_core::StoreError::not_found(path.string()));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str());
    if (!result) {
        auto error = result.error();
        error.with_context("file", path.string());
        return keel_core::Err<CatalogConfig>(std::move(error));
    }
    return result;
}

void CatalogConfig::apply_environment() {
    if (const char* dir = std::getenv("KEEL_CONFIG_DIR"); dir && *dir) {
        config_dir = dir;
    }
    if (const char* level = std::getenv("KEEL_LOG_LEVEL"); level && *level) {
        log_level = level;
    }
}

std::filesystem::path CatalogConfig::services_path(const std::filesystem::path& work_dir) const {
    std::filesystem::path dir(config_dir);
    return dir.is_absolute() ? dir : work_dir / dir;
}

keel_core::Result<keel_core::LogConfig> CatalogConfig::log_config(const std::filesystem::path& work_dir) const {
    auto level = keel_core::parse_log_level(log_level);
    if (!level) {
        return keel_core::Err<keel_core::LogConfig>(config_error("Unknown log level '" + log_level + "'"));
    }

    keel_core::LogConfig log;
    log.level = *level;
    log.console_enabled = log_console;
    log.file_enabled = log_file;

    std::filesystem::path dir(log_directory);
    log.log_directory = (dir.is_absolute() ? dir : work_dir / dir).string();
    return keel_core::Ok(log);
}

} // namespace keel_catalog
