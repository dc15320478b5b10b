#pragma once

/// @file config_store.hpp
/// @brief Persistence of service manifest text
///
/// Stores are keyed by service name and hold raw manifest text. The catalog
/// never interprets a store's layout.

#include "fwd.hpp"
#include <keel/core/error.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace keel_catalog {

// =============================================================================
// IConfigStore
// =============================================================================

class IConfigStore {
public:
    virtual ~IConfigStore() = default;

    /// Load manifest text for a service
    [[nodiscard]] virtual keel_core::Result<std::string> load(const std::string& name) const = 0;

    /// Save manifest text for a service, replacing any previous text
    [[nodiscard]] virtual keel_core::Result<void> save(const std::string& name, const std::string& text) = 0;

    /// Names of all stored services, sorted
    [[nodiscard]] virtual keel_core::Result<std::vector<std::string>> list() const = 0;

    /// Remove stored text; removing an absent name is not an error
    [[nodiscard]] virtual keel_core::Result<void> remove(const std::string& name) = 0;
};

// =============================================================================
// DirectoryConfigStore
// =============================================================================

/// One `<name>.json` file per service under a root directory
///
/// Names that fail `is_valid_service_name` are refused with InvalidArgument
/// so no entry can resolve outside the root.
class DirectoryConfigStore : public IConfigStore {
public:
    /// Wrap an existing directory; prefer open(), which also creates it
    explicit DirectoryConfigStore(std::filesystem::path root);

    /// Open a store, creating the root directory if needed
    [[nodiscard]] static keel_core::Result<std::shared_ptr<DirectoryConfigStore>> open(
        const std::filesystem::path& root);

    [[nodiscard]] keel_core::Result<std::string> load(const std::string& name) const override;
    [[nodiscard]] keel_core::Result<void> save(const std::string& name, const std::string& text) override;
    [[nodiscard]] keel_core::Result<std::vector<std::string>> list() const override;
    [[nodiscard]] keel_core::Result<void> remove(const std::string& name) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

    [[nodiscard]] std::filesystem::path path_for(const std::string& name) const;

private:
    std::filesystem::path m_root;
};

// =============================================================================
// MemoryConfigStore
// =============================================================================

/// In-memory store for tests and embedding
class MemoryConfigStore : public IConfigStore {
public:
    MemoryConfigStore() = default;

    [[nodiscard]] keel_core::Result<std::string> load(const std::string& name) const override;
    [[nodiscard]] keel_core::Result<void> save(const std::string& name, const std::string& text) override;
    [[nodiscard]] keel_core::Result<std::vector<std::string>> list() const override;
    [[nodiscard]] keel_core::Result<void> remove(const std::string& name) override;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_entries;
};

} // namespace keel_catalog
