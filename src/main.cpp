/// @file main.cpp
/// @brief keel command line entry point
///
/// Loads the service catalog from the configured manifest directory and runs
/// one command against it:
/// - validate: full validation pass with summary
/// - register: add a manifest to the catalog
/// - order: start (or stop) order for a set of services
/// - impact: services affected by a change to one service
/// - delete: remove a service, gated by critical impact
/// - graph: GraphViz output or a dependency tree

#include <keel/catalog/catalog.hpp>
#include <keel/core/error.hpp>
#include <keel/core/log.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultConfigFile = "keel.json";

// =============================================================================
// Command Line
// =============================================================================

struct Options {
    fs::path work_dir = ".";
    fs::path config_file;
    std::string log_level;
    std::string command;
    std::vector<std::string> args;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] COMMAND [ARGS]\n"
              << "\n"
              << "Commands:\n"
              << "  validate                          Validate every registered service\n"
              << "  list                              List registered services and their state\n"
              << "  register --name N --config FILE   Register a service manifest\n"
              << "  order [--stop] [ROOT...]          Print start (or stop) order\n"
              << "  impact [--critical] NAME          Print services impacted by NAME\n"
              << "  delete [--force] NAME             Delete a service\n"
              << "  graph [ROOT]                      Print DOT graph, or the tree below ROOT\n"
              << "\n"
              << "Options:\n"
              << "  --work-dir DIR      Catalog working directory (default: .)\n"
              << "  --config FILE       Catalog configuration (default: WORK_DIR/keel.json)\n"
              << "  --log-level LEVEL   trace, debug, info, warn, error, critical, off\n"
              << "  --help, -h          Show this help message\n"
              << "  --version, -v       Show version information\n"
              << "\n"
              << "Environment:\n"
              << "  KEEL_CONFIG_DIR     Overrides catalog.config_dir\n"
              << "  KEEL_LOG_LEVEL      Overrides logging.level\n";
}

void print_version() {
    std::cout << "keel " << keel_catalog::kVersion << "\n";
}

void print_error(const keel_core::Error& error) {
    std::cerr << "Error: " << keel_core::build_error_chain(error) << "\n";
}

/// Parse global options up to the command; the rest belongs to the command
keel_core::Result<Options> parse_options(int argc, char** argv) {
    Options options;

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (!arg.empty() && arg[0] != '-') {
            break;
        }

        auto next_value = [&](const std::string& flag) -> keel_core::Result<std::string> {
            if (i + 1 >= argc) {
                return keel_core::Err<std::string>(
                    keel_core::Error(keel_core::ErrorCode::InvalidArgument, "Missing value for " + flag));
            }
            return keel_core::Ok(std::string(argv[++i]));
        };

        if (arg == "--work-dir" || arg == "--config" || arg == "--log-level") {
            auto value = next_value(arg);
            if (!value) {
                return keel_core::Err<Options>(value.error());
            }
            if (arg == "--work-dir") {
                options.work_dir = *value;
            } else if (arg == "--config") {
                options.config_file = *value;
            } else {
                options.log_level = *value;
            }
        } else {
            return keel_core::Err<Options>(
                keel_core::Error(keel_core::ErrorCode::InvalidArgument, "Unknown option: " + arg));
        }
    }

    if (i < argc) {
        options.command = argv[i++];
    }
    for (; i < argc; ++i) {
        options.args.emplace_back(argv[i]);
    }
    return keel_core::Ok(std::move(options));
}

/// Split command arguments into flags and positionals
struct CommandArgs {
    std::vector<std::string> flags;
    std::vector<std::string> positional;

    [[nodiscard]] bool has(const std::string& flag) const {
        for (const auto& f : flags) {
            if (f == flag) return true;
        }
        return false;
    }
};

CommandArgs split_args(const std::vector<std::string>& args) {
    CommandArgs result;
    for (const auto& arg : args) {
        if (arg.rfind("--", 0) == 0) {
            result.flags.push_back(arg);
        } else {
            result.positional.push_back(arg);
        }
    }
    return result;
}

void print_list(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        std::cout << name << "\n";
    }
}

// =============================================================================
// Commands
// =============================================================================

int cmd_validate(keel_catalog::ServiceRegistry& registry) {
    auto summary = registry.validate_all_services();

    std::cout << "Validation summary:\n"
              << "  Total:      " << summary.total_count() << "\n"
              << "  Successful: " << summary.successful_count() << "\n"
              << "  Failed:     " << summary.failed_count() << "\n"
              << "  Warnings:   " << summary.warning_count() << "\n";

    if (!summary.failed.empty()) {
        std::cout << "\nFailed services:\n";
        for (const auto& [name, reason] : summary.failed) {
            std::cout << "  " << name << ": " << reason << "\n";
        }
    }

    if (summary.has_warnings()) {
        std::cout << "\nWarnings:\n";
        for (const auto& [name, messages] : summary.warnings) {
            for (const auto& message : messages) {
                std::cout << "  [" << name << "] " << message << "\n";
            }
        }
    }

    return summary.is_successful() ? 0 : 1;
}

int cmd_list(const keel_catalog::ServiceRegistry& registry) {
    for (const auto& record : registry.snapshot().records) {
        std::cout << record.name << " v" << record.declared_version
                  << " [" << record.service_type.to_string() << "] "
                  << keel_catalog::service_state_to_string(record.status.state) << "\n";
    }
    return 0;
}

int cmd_register(keel_catalog::ServiceRegistry& registry, const std::vector<std::string>& args) {
    std::string name;
    fs::path manifest;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--name" && i + 1 < args.size()) {
            name = args[++i];
        } else if (args[i] == "--config" && i + 1 < args.size()) {
            manifest = args[++i];
        } else {
            std::cerr << "Unexpected argument for register: " << args[i] << "\n";
            return 1;
        }
    }

    if (name.empty() || manifest.empty()) {
        std::cerr << "register requires --name and --config\n";
        return 1;
    }

    std::ifstream file(manifest);
    if (!file) {
        print_error(keel_core::StoreError::not_found(manifest.string()));
        return 1;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto result = registry.register_service(name, buffer.str());
    if (!result) {
        print_error(result.error());
        return 1;
    }

    std::cout << "Registered " << name << "\n";
    return 0;
}

int cmd_order(const keel_catalog::ServiceRegistry& registry, const CommandArgs& args) {
    std::vector<std::string> roots = args.positional;
    if (roots.empty()) {
        roots = registry.list_services();
    }

    auto order = args.has("--stop") ? registry.stop_order(roots) : registry.start_order(roots);
    if (!order) {
        print_error(order.error());
        return 1;
    }

    print_list(*order);
    return 0;
}

int cmd_impact(const keel_catalog::ServiceRegistry& registry, const CommandArgs& args) {
    if (args.positional.size() != 1) {
        std::cerr << "impact requires exactly one service name\n";
        return 1;
    }
    const std::string& name = args.positional.front();

    if (args.has("--critical")) {
        auto critical = registry.analyze_critical_impact(name);
        if (!critical) {
            print_error(critical.error());
            return 1;
        }
        print_list(*critical);
        return 0;
    }

    auto detailed = registry.analyze_impact_detailed(name);
    if (!detailed) {
        print_error(detailed.error());
        return 1;
    }
    for (const auto& impact : *detailed) {
        std::cout << impact.service << (impact.is_required ? " (required)" : " (optional)")
                  << ": " << keel_catalog::CycleInfo::format_path(impact.path) << "\n";
    }
    return 0;
}

int cmd_delete(keel_catalog::ServiceRegistry& registry, const CommandArgs& args) {
    if (args.positional.size() != 1) {
        std::cerr << "delete requires exactly one service name\n";
        return 1;
    }
    const std::string& name = args.positional.front();

    auto impacted = registry.delete_service(name, args.has("--force"));
    if (!impacted) {
        print_error(impacted.error());
        return 1;
    }

    std::cout << "Deleted " << name << "\n";
    if (!impacted->empty()) {
        std::cout << "Impacted services:\n";
        for (const auto& service : *impacted) {
            std::cout << "  " << service << "\n";
        }
    }
    return 0;
}

int cmd_graph(const keel_catalog::ServiceRegistry& registry, const CommandArgs& args) {
    if (args.positional.empty()) {
        std::cout << registry.to_dot_graph();
        return 0;
    }

    auto tree = registry.format_dependency_tree(args.positional.front());
    if (!tree) {
        print_error(tree.error());
        return 1;
    }
    std::cout << *tree;
    return 0;
}

// =============================================================================
// Setup
// =============================================================================

keel_core::Result<keel_catalog::CatalogConfig> load_config(const Options& options) {
    keel_catalog::CatalogConfig config;

    fs::path config_file = options.config_file;
    if (config_file.empty() && fs::exists(options.work_dir / kDefaultConfigFile)) {
        config_file = options.work_dir / kDefaultConfigFile;
    }

    if (!config_file.empty()) {
        auto loaded = keel_catalog::CatalogConfig::load(config_file);
        if (!loaded) {
            return loaded;
        }
        config = std::move(*loaded);
    }

    config.apply_environment();
    if (!options.log_level.empty()) {
        config.log_level = options.log_level;
    }
    return keel_core::Ok(std::move(config));
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version" || arg == "-v") {
            print_version();
            return 0;
        }
    }

    auto options = parse_options(argc, argv);
    if (!options) {
        print_error(options.error());
        print_usage(argv[0]);
        return 1;
    }

    if (options->command.empty()) {
        std::cerr << "Error: No command specified.\n\n";
        print_usage(argv[0]);
        return 1;
    }

    auto config = load_config(*options);
    if (!config) {
        print_error(config.error());
        return 1;
    }

    auto log_config = config->log_config(options->work_dir);
    if (!log_config) {
        print_error(log_config.error());
        return 1;
    }
    keel_core::configure_logging(*log_config);

    auto schema_compat = keel_catalog::classify(config->schema_version, keel_catalog::kCurrentSchemaVersion);
    if (schema_compat == keel_catalog::VersionCompatibility::MajorIncompatible) {
        KEEL_LOG_ERROR("Configured schema version {} is not supported (current {})",
            config->schema_version, keel_catalog::kCurrentSchemaVersion);
        return 1;
    }
    if (schema_compat == keel_catalog::VersionCompatibility::MinorIncompatible) {
        KEEL_LOG_WARN("Configured schema version {} differs from current {}",
            config->schema_version, keel_catalog::kCurrentSchemaVersion);
    }

    auto store = keel_catalog::DirectoryConfigStore::open(config->services_path(options->work_dir));
    if (!store) {
        print_error(store.error());
        return 1;
    }

    keel_catalog::ServiceRegistry registry(
        *store,
        std::make_shared<keel_catalog::ServiceSchemaValidator>(),
        config->default_namespace);

    auto loaded = registry.load_services();
    if (!loaded) {
        print_error(loaded.error());
        return 1;
    }
    KEEL_LOG_DEBUG("Catalog ready: {} service(s) from {}", *loaded,
        config->services_path(options->work_dir).string());

    const std::string& command = options->command;
    CommandArgs args = split_args(options->args);
    int exit_code = 1;

    if (command == "validate") {
        exit_code = cmd_validate(registry);
    } else if (command == "list") {
        exit_code = cmd_list(registry);
    } else if (command == "register") {
        exit_code = cmd_register(registry, options->args);
    } else if (command == "order") {
        exit_code = cmd_order(registry, args);
    } else if (command == "impact") {
        exit_code = cmd_impact(registry, args);
    } else if (command == "delete") {
        exit_code = cmd_delete(registry, args);
    } else if (command == "graph") {
        exit_code = cmd_graph(registry, args);
    } else {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
    }

    keel_core::shutdown_logging();
    return exit_code;
}
