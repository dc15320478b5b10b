/// @file config_store.cpp
/// @brief Configuration store implementations

#include <keel/catalog/config_store.hpp>
#include <keel/catalog/service.hpp>
#include <keel/core/log.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace keel_catalog {

namespace {

constexpr const char* kManifestExtension = ".json";

keel_core::Error invalid_name(const std::string& name) {
    return keel_core::Error(keel_core::ErrorCode::InvalidArgument, "Invalid service name '" + name + "'");
}

} // anonymous namespace

// =============================================================================
// DirectoryConfigStore
// =============================================================================

DirectoryConfigStore::DirectoryConfigStore(std::filesystem::path root)
    : m_root(std::move(root)) {}

keel_core::Result<std::shared_ptr<DirectoryConfigStore>> DirectoryConfigStore::open(
    const std::filesystem::path& root) {

    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return keel_core::Err<std::shared_ptr<DirectoryConfigStore>>(
            keel_core::StoreError::write_failed(root.string(), ec.message()));
    }
    if (!std::filesystem::is_directory(root, ec)) {
        return keel_core::Err<std::shared_ptr<DirectoryConfigStore>>(
            keel_core::StoreError::read_failed(root.string(), "not a directory"));
    }

    keel_core::registry_logger()->debug("[ConfigStore] Opened {}", root.string());
    return keel_core::Ok(std::make_shared<DirectoryConfigStore>(root));
}

std::filesystem::path DirectoryConfigStore::path_for(const std::string& name) const {
    return m_root / (name + kManifestExtension);
}

keel_core::Result<std::string> DirectoryConfigStore::load(const std::string& name) const {
    if (!is_valid_service_name(name)) {
        return keel_core::Err<std::string>(invalid_name(name));
    }
    auto path = path_for(name);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return keel_core::Err<std::string>(keel_core::StoreError::not_found(path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return keel_core::Err<std::string>(
            keel_core::StoreError::read_failed(path.string(), "cannot open file"));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return keel_core::Err<std::string>(
            keel_core::StoreError::read_failed(path.string(), "read error"));
    }
    return keel_core::Ok(buffer.str());
}

keel_core::Result<void> DirectoryConfigStore::save(const std::string& name, const std::string& text) {
    if (!is_valid_service_name(name)) {
        return keel_core::Err(invalid_name(name));
    }
    auto path = path_for(name);

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return keel_core::Err(keel_core::StoreError::write_failed(path.string(), ec.message()));
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return keel_core::Err(keel_core::StoreError::write_failed(path.string(), "cannot open file"));
    }
    file << text;
    file.flush();
    if (!file) {
        return keel_core::Err(keel_core::StoreError::write_failed(path.string(), "write error"));
    }

    keel_core::registry_logger()->debug("[ConfigStore] Saved {}", path.string());
    return keel_core::Ok();
}

keel_core::Result<std::vector<std::string>> DirectoryConfigStore::list() const {
    std::vector<std::string> names;

    std::error_code ec;
    std::filesystem::directory_iterator it(m_root, ec);
    if (ec) {
        return keel_core::Err<std::vector<std::string>>(
            keel_core::StoreError::read_failed(m_root.string(), ec.message()));
    }

    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        if (entry.path().extension() != kManifestExtension) continue;
        names.push_back(entry.path().stem().string());
    }

    std::sort(names.begin(), names.end());
    return keel_core::Ok(std::move(names));
}

keel_core::Result<void> DirectoryConfigStore::remove(const std::string& name) {
    if (!is_valid_service_name(name)) {
        return keel_core::Err(invalid_name(name));
    }
    auto path = path_for(name);

    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return keel_core::Err(keel_core::StoreError::write_failed(path.string(), ec.message()));
    }
    return keel_core::Ok();
}

// =============================================================================
// MemoryConfigStore
// =============================================================================

keel_core::Result<std::string> MemoryConfigStore::load(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(name);
    if (it == m_entries.end()) {
        return keel_core::Err<std::string>(keel_core::StoreError::not_found(name));
    }
    return keel_core::Ok(it->second);
}

keel_core::Result<void> MemoryConfigStore::save(const std::string& name, const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[name] = text;
    return keel_core::Ok();
}

keel_core::Result<std::vector<std::string>> MemoryConfigStore::list() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_entries.size());
    for (const auto& [name, text] : m_entries) {
        names.push_back(name);
    }
    return keel_core::Ok(std::move(names));
}

keel_core::Result<void> MemoryConfigStore::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.erase(name);
    return keel_core::Ok();
}

} // namespace keel_catalog
