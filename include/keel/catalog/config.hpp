#pragma once

/// @file config.hpp
/// @brief Catalog configuration
///
/// Loaded from a JSON file, then overridden from the environment:
/// @code
/// {
///   "catalog": {
///     "config_dir": "services",
///     "default_namespace": "default",
///     "schema_version": "1.0.0"
///   },
///   "logging": {
///     "level": "info",
///     "console": true,
///     "file": false,
///     "directory": "logs"
///   }
/// }
/// @endcode
///
/// Environment overrides:
/// - KEEL_CONFIG_DIR -> catalog.config_dir
/// - KEEL_LOG_LEVEL  -> logging.level

#include "fwd.hpp"
#include <keel/core/error.hpp>
#include <keel/core/log.hpp>

#include <filesystem>
#include <string>

namespace keel_catalog {

struct CatalogConfig {
    /// Directory holding service manifests (relative paths resolve against the work dir)
    std::string config_dir = "services";
    std::string default_namespace = "default";
    std::string schema_version = "1.0.0";

    std::string log_level = "info";
    bool log_console = true;
    bool log_file = false;
    std::string log_directory = "logs";

    /// Parse from JSON text; absent keys keep their defaults
    [[nodiscard]] static keel_core::Result<CatalogConfig> from_json_string(const std::string& text);

    /// Load from a file
    [[nodiscard]] static keel_core::Result<CatalogConfig> load(const std::filesystem::path& path);

    /// Apply KEEL_* environment overrides
    void apply_environment();

    /// Resolve config_dir against a working directory
    [[nodiscard]] std::filesystem::path services_path(const std::filesystem::path& work_dir) const;

    /// Logging settings for keel_core::configure_logging
    [[nodiscard]] keel_core::Result<keel_core::LogConfig> log_config(const std::filesystem::path& work_dir) const;
};

} // namespace keel_catalog
