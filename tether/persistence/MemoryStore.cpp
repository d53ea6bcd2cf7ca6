#include "persistence/MemoryStore.hpp"

namespace Tether {

std::optional<std::string> MemoryStore::Get(const std::string& key) {
    std::lock_guard lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryStore::Set(const std::string& key, const std::string& value) {
    std::lock_guard lock(m_mutex);
    if (m_failWrites) {
        return false;
    }
    m_values[key] = value;
    ++m_writeCount;
    return true;
}

bool MemoryStore::Remove(const std::string& key) {
    std::lock_guard lock(m_mutex);
    if (m_failWrites) {
        return false;
    }
    m_values.erase(key);
    return true;
}

std::vector<std::string> MemoryStore::Keys(const std::string& prefix) {
    std::lock_guard lock(m_mutex);
    std::vector<std::string> keys;
    for (auto it = m_values.lower_bound(prefix); it != m_values.end(); ++it) {
        if (!it->first.starts_with(prefix)) {
            break;
        }
        keys.push_back(it->first);
    }
    return keys;
}

void MemoryStore::SetFailWrites(bool fail) {
    std::lock_guard lock(m_mutex);
    m_failWrites = fail;
}

size_t MemoryStore::Size() const {
    std::lock_guard lock(m_mutex);
    return m_values.size();
}

size_t MemoryStore::GetWriteCount() const {
    std::lock_guard lock(m_mutex);
    return m_writeCount;
}

} // namespace Tether
