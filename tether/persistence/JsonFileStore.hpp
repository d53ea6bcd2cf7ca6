#pragma once

#include "IDurableStore.hpp"
#include <expected>
#include <filesystem>
#include <mutex>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace Tether {

/**
 * @brief Durable store keeping every key in a single JSON document
 *
 * Each mutation rewrites the document to "<path>.tmp" and renames it over
 * the existing file, so a crash leaves either the old or the new file intact.
 */
class JsonFileStore : public IDurableStore {
public:
    explicit JsonFileStore(std::filesystem::path path);

    /**
     * @brief Load existing contents; a missing file starts an empty store
     */
    std::expected<void, StoreError> Open();

    std::optional<std::string> Get(const std::string& key) override;
    bool Set(const std::string& key, const std::string& value) override;
    bool Remove(const std::string& key) override;
    std::vector<std::string> Keys(const std::string& prefix = "") override;

    [[nodiscard]] const std::filesystem::path& GetPath() const { return m_path; }

private:
    bool Flush();

    std::filesystem::path m_path;
    std::unordered_map<std::string, std::string> m_values;
    bool m_open = false;
    mutable std::mutex m_mutex;
};

} // namespace Tether
