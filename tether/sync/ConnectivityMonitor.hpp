#pragma once

#include <atomic>
#include <mutex>
#include <vector>

namespace Tether {

/**
 * @brief Receives host connectivity and visibility changes
 */
class IConnectivityListener {
public:
    virtual ~IConnectivityListener() = default;

    virtual void OnConnectivityChanged(bool online) = 0;
    virtual void OnVisibilityChanged(bool visible) {}
};

/**
 * @brief Bridge between host environment signals and save sessions
 *
 * The host forwards its network and visibility events through SetOnline()
 * and SetVisible(). Listeners are only notified when a value actually
 * changes, on the thread that reported it. A listener removed during a
 * notification pass is not called again, and RemoveListener() from another
 * thread waits for the running pass to finish.
 */
class ConnectivityMonitor {
public:
    explicit ConnectivityMonitor(bool online = true, bool visible = true);

    ConnectivityMonitor(const ConnectivityMonitor&) = delete;
    ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

    void SetOnline(bool online);
    void SetVisible(bool visible);

    [[nodiscard]] bool IsOnline() const { return m_online; }
    [[nodiscard]] bool IsVisible() const { return m_visible; }

    /**
     * @brief Register a listener; the listener must stay alive until RemoveListener() returns
     */
    void AddListener(IConnectivityListener* listener);
    void RemoveListener(IConnectivityListener* listener);

    [[nodiscard]] size_t GetListenerCount() const;

private:
    template <typename Fn>
    void Notify(Fn fn);

    bool IsRegistered(IConnectivityListener* listener) const;

    std::atomic<bool> m_online;
    std::atomic<bool> m_visible;
    std::vector<IConnectivityListener*> m_listeners;
    mutable std::mutex m_mutex;
    std::recursive_mutex m_notifyMutex;     // Held for a whole notification pass
};

} // namespace Tether
