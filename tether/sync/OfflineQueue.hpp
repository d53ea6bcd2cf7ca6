#pragma once

#include "persistence/IDurableStore.hpp"
#include "sync/SaveTypes.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace Tether {

/**
 * @brief A save that could not reach the remote store
 */
struct QueueItem {
    std::string id;
    std::string key;
    nlohmann::json payload;
    uint64_t enqueuedAt = 0;        // Wall clock, ms since epoch
    int attemptCount = 0;           // Failed replay attempts
    uint64_t lastAttemptAt = 0;
    std::string lastError;

    [[nodiscard]] nlohmann::json ToJson() const;
    [[nodiscard]] static std::optional<QueueItem> FromJson(const nlohmann::json& json);
};

enum class QueueError {
    Full,
    StorageFailure
};

[[nodiscard]] std::string_view ToString(QueueError error) noexcept;

/**
 * @brief Replays one item; anything but success stalls the queue
 */
using QueueProcessor = std::function<SaveResult(const QueueItem&)>;

/**
 * @brief Durable FIFO of deferred saves
 *
 * The whole queue is stored as one JSON array under a single store key and
 * rewritten after every mutation. Replay is strictly in enqueue order and
 * stops at the first failure; items are removed only when acknowledged or
 * through RemoveItem()/Clear().
 *
 * Enqueue() may be called while ProcessQueue() runs on another thread. Items
 * added during a pass are left for the next pass.
 */
class OfflineQueue {
public:
    /**
     * @param store Durable store, must outlive the queue
     * @param storeKey Key holding the serialized queue
     * @param maxSize Enqueue beyond this size is refused
     */
    OfflineQueue(IDurableStore& store, std::string storeKey, size_t maxSize = 100);

    OfflineQueue(const OfflineQueue&) = delete;
    OfflineQueue& operator=(const OfflineQueue&) = delete;

    /**
     * @brief Restore items persisted by a previous process
     * @return False if the stored queue could not be parsed
     */
    bool Load();

    /**
     * @brief Append an item durably
     * @return Id of the new item
     */
    std::expected<std::string, QueueError> Enqueue(const std::string& key, const nlohmann::json& payload);

    /**
     * @brief Register the processor for keys matching a glob pattern ('*' and '?')
     *
     * Patterns are tried in registration order; re-registering a pattern
     * replaces its processor.
     */
    void RegisterProcessor(const std::string& pattern, QueueProcessor processor);
    void UnregisterProcessor(const std::string& pattern);

    /**
     * @brief Replay the items present when the pass starts
     */
    ReplayReport ProcessQueue();

    bool RemoveItem(const std::string& id);

    /**
     * @brief Drop every item (explicit discard by the user)
     */
    bool Clear();

    [[nodiscard]] bool HasQueuedItems() const;
    [[nodiscard]] size_t Size() const;
    [[nodiscard]] std::vector<QueueItem> GetItems() const;
    [[nodiscard]] bool IsProcessing() const { return m_processing; }
    [[nodiscard]] const std::string& GetStoreKey() const { return m_storeKey; }

    static bool MatchesPattern(std::string_view pattern, std::string_view key);

private:
    bool PersistLocked();
    QueueProcessor FindProcessor(const std::string& key) const;
    static uint64_t GetCurrentTimestamp();

    IDurableStore& m_store;
    std::string m_storeKey;
    size_t m_maxSize;

    std::deque<QueueItem> m_items;
    uint64_t m_nextSequence = 1;
    mutable std::mutex m_mutex;

    std::vector<std::pair<std::string, QueueProcessor>> m_processors;
    mutable std::mutex m_processorMutex;

    std::atomic<bool> m_processing{false};
};

} // namespace Tether
