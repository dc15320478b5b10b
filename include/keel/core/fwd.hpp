#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for keel_core module

#include <cstdint>

namespace keel_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct CatalogError;
struct StoreError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace keel_core
