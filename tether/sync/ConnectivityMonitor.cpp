#include "sync/ConnectivityMonitor.hpp"
#include "core/Logger.hpp"

#include <algorithm>

namespace Tether {

ConnectivityMonitor::ConnectivityMonitor(bool online, bool visible)
    : m_online(online)
    , m_visible(visible) {}

void ConnectivityMonitor::SetOnline(bool online) {
    if (m_online.exchange(online) == online) {
        return;
    }

    TETHER_LOG_INFO("Connectivity changed: {}", online ? "online" : "offline");
    Notify([online](IConnectivityListener* listener) { listener->OnConnectivityChanged(online); });
}

void ConnectivityMonitor::SetVisible(bool visible) {
    if (m_visible.exchange(visible) == visible) {
        return;
    }

    TETHER_LOG_DEBUG("Visibility changed: {}", visible ? "visible" : "hidden");
    Notify([visible](IConnectivityListener* listener) { listener->OnVisibilityChanged(visible); });
}

void ConnectivityMonitor::AddListener(IConnectivityListener* listener) {
    if (!listener) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (std::find(m_listeners.begin(), m_listeners.end(), listener) == m_listeners.end()) {
        m_listeners.push_back(listener);
    }
}

void ConnectivityMonitor::RemoveListener(IConnectivityListener* listener) {
    std::lock_guard<std::recursive_mutex> pass(m_notifyMutex);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listeners.erase(std::remove(m_listeners.begin(), m_listeners.end(), listener), m_listeners.end());
}

size_t ConnectivityMonitor::GetListenerCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_listeners.size();
}

template <typename Fn>
void ConnectivityMonitor::Notify(Fn fn) {
    std::lock_guard<std::recursive_mutex> pass(m_notifyMutex);

    std::vector<IConnectivityListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listeners = m_listeners;
    }

    for (IConnectivityListener* listener : listeners) {
        // Earlier listeners may have removed (and destroyed) later ones
        if (IsRegistered(listener)) {
            fn(listener);
        }
    }
}

bool ConnectivityMonitor::IsRegistered(IConnectivityListener* listener) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::find(m_listeners.begin(), m_listeners.end(), listener) != m_listeners.end();
}

} // namespace Tether
