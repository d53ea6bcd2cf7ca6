#include "persistence/JsonFileStore.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace Tether {

JsonFileStore::JsonFileStore(std::filesystem::path path)
    : m_path(std::move(path)) {}

std::expected<void, StoreError> JsonFileStore::Open() {
    std::lock_guard lock(m_mutex);

    m_values.clear();
    m_open = true;

    if (!std::filesystem::exists(m_path)) {
        TETHER_LOG_DEBUG("Store file {} does not exist yet, starting empty", m_path.string());
        return {};
    }

    std::ifstream file(m_path);
    if (!file.is_open()) {
        m_open = false;
        TETHER_LOG_ERROR("Failed to open store file: {}", m_path.string());
        return std::unexpected(StoreError::AccessDenied);
    }

    try {
        nlohmann::json document;
        file >> document;

        if (!document.is_object() || !document.contains("entries") || !document["entries"].is_object()) {
            m_open = false;
            TETHER_LOG_ERROR("Store file {} has unexpected layout", m_path.string());
            return std::unexpected(StoreError::Corrupted);
        }

        for (const auto& [key, value] : document["entries"].items()) {
            m_values[key] = value.get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        m_open = false;
        TETHER_LOG_ERROR("Failed to parse store file {}: {}", m_path.string(), e.what());
        return std::unexpected(StoreError::Corrupted);
    }

    TETHER_LOG_INFO("Opened store {} ({} keys)", m_path.string(), m_values.size());
    return {};
}

std::optional<std::string> JsonFileStore::Get(const std::string& key) {
    std::lock_guard lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JsonFileStore::Set(const std::string& key, const std::string& value) {
    std::lock_guard lock(m_mutex);
    if (!m_open) {
        TETHER_LOG_ERROR("JsonFileStore not opened");
        return false;
    }

    auto previous = m_values.find(key);
    std::optional<std::string> oldValue;
    if (previous != m_values.end()) {
        oldValue = previous->second;
    }

    m_values[key] = value;
    if (!Flush()) {
        if (oldValue) {
            m_values[key] = *oldValue;
        } else {
            m_values.erase(key);
        }
        return false;
    }
    return true;
}

bool JsonFileStore::Remove(const std::string& key) {
    std::lock_guard lock(m_mutex);
    if (!m_open) {
        TETHER_LOG_ERROR("JsonFileStore not opened");
        return false;
    }

    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return true;
    }

    std::string oldValue = it->second;
    m_values.erase(it);
    if (!Flush()) {
        m_values[key] = std::move(oldValue);
        return false;
    }
    return true;
}

std::vector<std::string> JsonFileStore::Keys(const std::string& prefix) {
    std::lock_guard lock(m_mutex);
    std::vector<std::string> keys;
    for (const auto& [key, value] : m_values) {
        if (key.starts_with(prefix)) {
            keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool JsonFileStore::Flush() {
    nlohmann::json document;
    document["format"] = 1;
    document["entries"] = nlohmann::json::object();
    for (const auto& [key, value] : m_values) {
        document["entries"][key] = value;
    }

    std::error_code ec;
    if (m_path.has_parent_path()) {
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec) {
            TETHER_LOG_ERROR("Failed to create store directory: {}", ec.message());
            return false;
        }
    }

    std::filesystem::path tmpPath = m_path;
    tmpPath += ".tmp";

    {
        std::ofstream file(tmpPath, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            TETHER_LOG_ERROR("Failed to open {} for writing", tmpPath.string());
            return false;
        }
        file << document.dump();
        file.flush();
        if (!file) {
            TETHER_LOG_ERROR("Failed to write store file {}", tmpPath.string());
            return false;
        }
    }

    std::filesystem::rename(tmpPath, m_path, ec);
    if (ec) {
        TETHER_LOG_ERROR("Failed to replace store file {}: {}", m_path.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace Tether
