#pragma once

#include "IDurableStore.hpp"
#include <map>
#include <mutex>

namespace Tether {

/**
 * @brief In-process store, durable only for the lifetime of the object
 *
 * Useful for tests and for hosts that persist through some other channel.
 * SetFailWrites() makes Set/Remove report failure, to exercise storage errors.
 */
class MemoryStore : public IDurableStore {
public:
    std::optional<std::string> Get(const std::string& key) override;
    bool Set(const std::string& key, const std::string& value) override;
    bool Remove(const std::string& key) override;
    std::vector<std::string> Keys(const std::string& prefix = "") override;

    void SetFailWrites(bool fail);
    [[nodiscard]] size_t Size() const;
    [[nodiscard]] size_t GetWriteCount() const;

private:
    std::map<std::string, std::string> m_values;
    bool m_failWrites = false;
    size_t m_writeCount = 0;
    mutable std::mutex m_mutex;
};

} // namespace Tether
