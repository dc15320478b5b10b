#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for keel_catalog module

#include <cstdint>

namespace keel_catalog {

// Versions
struct SemanticVersion;
enum class VersionCompatibility : std::uint8_t;

// Graph
using NodeIndex = std::uint32_t;
struct EdgeMetadata;
struct Edge;
class DependencyGraph;
struct CycleInfo;
struct ImpactInfo;

// Services
enum class ServiceState : std::uint8_t;
enum class ServiceTypeKind : std::uint8_t;
struct ServiceType;
struct Endpoint;
struct DependencySpec;
struct ServiceStatus;
struct ServiceRecord;

// Validation
enum class FieldType : std::uint8_t;
struct FieldSchema;
struct ObjectSchema;
class ISchemaValidator;
class ServiceSchemaValidator;
struct DependencyReport;
struct ValidationSummary;
class ValidationOrchestrator;

// Storage and registry
class IConfigStore;
class DirectoryConfigStore;
class MemoryConfigStore;
struct CatalogConfig;
struct CatalogSnapshot;
class ServiceRegistry;

} // namespace keel_catalog
