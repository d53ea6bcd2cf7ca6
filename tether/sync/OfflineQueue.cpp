#include "sync/OfflineQueue.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>

namespace Tether {

nlohmann::json QueueItem::ToJson() const {
    return {
        {"id", id},
        {"key", key},
        {"payload", payload},
        {"enqueuedAt", enqueuedAt},
        {"attemptCount", attemptCount},
        {"lastAttemptAt", lastAttemptAt},
        {"lastError", lastError}
    };
}

std::optional<QueueItem> QueueItem::FromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("id") || !json.contains("key") || !json.contains("payload")) {
        return std::nullopt;
    }

    try {
        QueueItem item;
        item.id = json["id"].get<std::string>();
        item.key = json["key"].get<std::string>();
        item.payload = json["payload"];
        item.enqueuedAt = json.value("enqueuedAt", uint64_t{0});
        item.attemptCount = json.value("attemptCount", 0);
        item.lastAttemptAt = json.value("lastAttemptAt", uint64_t{0});
        item.lastError = json.value("lastError", std::string());
        return item;
    } catch (const nlohmann::json::exception& e) {
        TETHER_LOG_WARN("Invalid queue item: {}", e.what());
        return std::nullopt;
    }
}

std::string_view ToString(QueueError error) noexcept {
    switch (error) {
        case QueueError::Full:           return "queue is full";
        case QueueError::StorageFailure: return "storage failure";
    }
    return "unknown";
}

OfflineQueue::OfflineQueue(IDurableStore& store, std::string storeKey, size_t maxSize)
    : m_store(store)
    , m_storeKey(std::move(storeKey))
    , m_maxSize(maxSize) {}

bool OfflineQueue::Load() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_items.clear();

    auto stored = m_store.Get(m_storeKey);
    if (!stored) {
        return true;
    }

    nlohmann::json document = nlohmann::json::parse(*stored, nullptr, false);
    if (document.is_discarded() || !document.is_array()) {
        TETHER_LOG_ERROR("Offline queue '{}' is corrupted, starting empty", m_storeKey);
        return false;
    }

    for (const auto& entry : document) {
        auto item = QueueItem::FromJson(entry);
        if (!item) {
            TETHER_LOG_ERROR("Skipping unreadable item in offline queue '{}'", m_storeKey);
            continue;
        }

        // Ids are "q<sequence>"; continue numbering after the largest one
        if (item->id.size() > 1 && item->id[0] == 'q') {
            try {
                m_nextSequence = std::max<uint64_t>(m_nextSequence, std::stoull(item->id.substr(1)) + 1);
            } catch (const std::exception&) {
                // Foreign id format, sequence unaffected
            }
        }
        m_items.push_back(std::move(*item));
    }

    if (!m_items.empty()) {
        TETHER_LOG_INFO("Restored {} queued save(s) from '{}'", m_items.size(), m_storeKey);
    }
    return true;
}

std::expected<std::string, QueueError> OfflineQueue::Enqueue(const std::string& key, const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_items.size() >= m_maxSize) {
        TETHER_LOG_ERROR("Offline queue '{}' is full ({} items), refusing save for '{}'",
                         m_storeKey, m_items.size(), key);
        return std::unexpected(QueueError::Full);
    }

    QueueItem item;
    item.id = "q" + std::to_string(m_nextSequence);
    item.key = key;
    item.payload = payload;
    item.enqueuedAt = GetCurrentTimestamp();

    m_items.push_back(item);
    if (!PersistLocked()) {
        m_items.pop_back();
        return std::unexpected(QueueError::StorageFailure);
    }

    ++m_nextSequence;
    TETHER_LOG_DEBUG("Queued save {} for '{}' ({} pending)", item.id, key, m_items.size());
    return item.id;
}

void OfflineQueue::RegisterProcessor(const std::string& pattern, QueueProcessor processor) {
    std::lock_guard<std::mutex> lock(m_processorMutex);

    auto it = std::find_if(m_processors.begin(), m_processors.end(),
                           [&](const auto& entry) { return entry.first == pattern; });
    if (it != m_processors.end()) {
        it->second = std::move(processor);
    } else {
        m_processors.emplace_back(pattern, std::move(processor));
    }
}

void OfflineQueue::UnregisterProcessor(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(m_processorMutex);
    std::erase_if(m_processors, [&](const auto& entry) { return entry.first == pattern; });
}

ReplayReport OfflineQueue::ProcessQueue() {
    ReplayReport report;

    bool expected = false;
    if (!m_processing.compare_exchange_strong(expected, true)) {
        report.alreadyRunning = true;
        report.remaining = Size();
        return report;
    }

    std::vector<std::string> passIds;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        passIds.reserve(m_items.size());
        for (const auto& item : m_items) {
            passIds.push_back(item.id);
        }
    }

    for (const std::string& id : passIds) {
        QueueItem item;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = std::find_if(m_items.begin(), m_items.end(),
                                   [&](const QueueItem& queued) { return queued.id == id; });
            if (it == m_items.end()) {
                continue;   // Removed manually since the pass started
            }
            item = *it;
        }

        SaveResult result;
        QueueProcessor processor = FindProcessor(item.key);
        if (!processor) {
            TETHER_LOG_WARN("No queue processor registered for key '{}'", item.key);
            result = SaveResult::TransientFailure("no processor registered for key " + item.key);
        } else {
            try {
                result = processor(item);
            } catch (const std::exception& e) {
                result = SaveResult::TransientFailure(e.what());
            }
        }
        ++report.attempted;

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_items.begin(), m_items.end(),
                               [&](const QueueItem& queued) { return queued.id == id; });

        if (result.Ok()) {
            ++report.succeeded;
            if (it != m_items.end()) {
                m_items.erase(it);
                if (!PersistLocked()) {
                    TETHER_LOG_WARN("Replayed item {} could not be removed durably, it may replay again", id);
                }
            }
            continue;
        }

        if (it != m_items.end()) {
            it->attemptCount++;
            it->lastAttemptAt = GetCurrentTimestamp();
            it->lastError = result.message;
            if (!PersistLocked()) {
                TETHER_LOG_WARN("Attempt count of queued item {} not persisted", id);
            }
        }

        report.stalled = true;
        report.error = result.message;
        report.stalledItemId = id;
        TETHER_LOG_ERROR("Sync stalled on queued item {} ({}): {}", id, ToString(result.kind), result.message);
        break;
    }

    report.remaining = Size();
    m_processing = false;

    if (report.attempted > 0) {
        TETHER_LOG_INFO("Queue replay for '{}': {}/{} applied, {} remaining",
                        m_storeKey, report.succeeded, report.attempted, report.remaining);
    }
    return report;
}

bool OfflineQueue::RemoveItem(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = std::find_if(m_items.begin(), m_items.end(),
                           [&](const QueueItem& item) { return item.id == id; });
    if (it == m_items.end()) {
        return false;
    }

    QueueItem removed = *it;
    auto position = m_items.erase(it);
    if (!PersistLocked()) {
        m_items.insert(position, std::move(removed));
        return false;
    }
    return true;
}

bool OfflineQueue::Clear() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_store.Remove(m_storeKey)) {
        TETHER_LOG_ERROR("Failed to clear offline queue '{}'", m_storeKey);
        return false;
    }

    if (!m_items.empty()) {
        TETHER_LOG_WARN("Discarded {} queued save(s) from '{}'", m_items.size(), m_storeKey);
    }
    m_items.clear();
    return true;
}

bool OfflineQueue::HasQueuedItems() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_items.empty();
}

size_t OfflineQueue::Size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items.size();
}

std::vector<QueueItem> OfflineQueue::GetItems() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_items.begin(), m_items.end()};
}

bool OfflineQueue::MatchesPattern(std::string_view pattern, std::string_view key) {
    size_t p = 0, k = 0;
    size_t starPos = std::string_view::npos, matchPos = 0;

    while (k < key.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == key[k])) {
            ++p;
            ++k;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starPos = p++;
            matchPos = k;
        } else if (starPos != std::string_view::npos) {
            p = starPos + 1;
            k = ++matchPos;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

bool OfflineQueue::PersistLocked() {
    if (m_items.empty()) {
        if (!m_store.Remove(m_storeKey)) {
            TETHER_LOG_ERROR("Failed to persist offline queue '{}'", m_storeKey);
            return false;
        }
        return true;
    }

    nlohmann::json document = nlohmann::json::array();
    for (const auto& item : m_items) {
        document.push_back(item.ToJson());
    }

    if (!m_store.Set(m_storeKey, document.dump())) {
        TETHER_LOG_ERROR("Failed to persist offline queue '{}'", m_storeKey);
        return false;
    }
    return true;
}

QueueProcessor OfflineQueue::FindProcessor(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_processorMutex);
    for (const auto& [pattern, processor] : m_processors) {
        if (MatchesPattern(pattern, key)) {
            return processor;
        }
    }
    return nullptr;
}

uint64_t OfflineQueue::GetCurrentTimestamp() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace Tether
