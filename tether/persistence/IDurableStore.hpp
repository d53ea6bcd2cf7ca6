#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Tether {

/**
 * @brief Errors reported when opening a durable store
 */
enum class StoreError {
    NotFound,
    AccessDenied,
    Corrupted,
    IoError
};

/**
 * @brief Key/value storage that survives process restart
 *
 * Used for recovery snapshots and offline queues. Keys are namespaced by the
 * caller (see AutoSaveConfig::storageKeyPrefix) so several sessions can share
 * one store. Implementations must be safe to call from multiple threads.
 */
class IDurableStore {
public:
    virtual ~IDurableStore() = default;

    /**
     * @brief Read a value
     * @return The stored value, or nullopt if absent or unreadable
     */
    virtual std::optional<std::string> Get(const std::string& key) = 0;

    /**
     * @brief Insert or overwrite a value
     * @return True once the value is durable
     */
    virtual bool Set(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Remove a value; removing a missing key succeeds
     */
    virtual bool Remove(const std::string& key) = 0;

    /**
     * @brief List keys starting with prefix (all keys for an empty prefix)
     */
    virtual std::vector<std::string> Keys(const std::string& prefix = "") = 0;
};

} // namespace Tether
