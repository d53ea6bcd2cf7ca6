#include "sync/SaveSession.hpp"
#include "core/Logger.hpp"

#include <stdexcept>

namespace Tether {

SaveSession::SaveSession(std::string storageKey,
                         SaveFunction saveFunction,
                         Dependencies dependencies,
                         AutoSaveConfig config)
    : m_storageKey(std::move(storageKey))
    , m_connectivity(dependencies.connectivity)
    , m_observer(dependencies.observer) {
    if (m_storageKey.empty()) {
        throw std::invalid_argument("SaveSession requires a storage key");
    }
    if (!saveFunction) {
        throw std::invalid_argument("SaveSession requires a save function");
    }
    if (!dependencies.scheduler || !dependencies.store) {
        throw std::invalid_argument("SaveSession requires a scheduler and a durable store");
    }

    m_manager = std::make_unique<AutoSaveManager>(std::move(config), *dependencies.scheduler,
                                                  *dependencies.store, m_connectivity);
    m_manager->SetValidator(std::move(dependencies.validator));
    m_manager->SetConflictResolver(std::move(dependencies.resolver));

    if (!m_manager->Initialize(std::move(saveFunction), m_observer, m_storageKey)) {
        throw std::invalid_argument("SaveSession could not initialize auto-save for " + m_storageKey);
    }

    if (m_connectivity) {
        m_connectivity->AddListener(this);
    }
}

SaveSession::~SaveSession() {
    if (m_connectivity) {
        m_connectivity->RemoveListener(this);
    }
    m_manager->Cleanup();
}

void SaveSession::SetBaseline(const nlohmann::json& data, std::optional<uint64_t> version) {
    m_manager->SetBaseline(data, version);
}

void SaveSession::UpdateData(const nlohmann::json& newData) {
    m_manager->ScheduleAutoSaveIfChanged(newData);
}

std::shared_future<SaveOutcome> SaveSession::ForceSave() {
    return SaveCurrent(nullptr);
}

std::shared_future<SaveOutcome> SaveSession::ManualSave() {
    return SaveCurrent([observer = m_observer, key = m_storageKey](const SaveOutcome& outcome) {
        if (outcome.Succeeded()) {
            TETHER_LOG_INFO("Saved '{}'", key);
        } else {
            TETHER_LOG_ERROR("Manual save of '{}' failed ({}): {}", key, ToString(outcome.state), outcome.message);
        }

        if (observer) {
            observer->OnManualSaveResult(outcome);
        }
    });
}

std::shared_future<ReplayReport> SaveSession::RetryFailedSaves() {
    return m_manager->ReplayQueue();
}

std::shared_future<SaveOutcome> SaveSession::ResolveConflict(const nlohmann::json& merged) {
    return m_manager->ResolveConflict(merged);
}

void SaveSession::ClearPendingChanges() {
    m_manager->ClearPendingChanges();
}

std::optional<nlohmann::json> SaveSession::GetRecoveryData() const {
    return m_manager->GetBackupData();
}

bool SaveSession::HasPendingChanges() const {
    return m_manager->HasPendingChanges();
}

bool SaveSession::HasUnsavedChangesOnExit() const {
    return m_manager->HasPendingChanges() ||
           m_manager->GetState() == SaveState::Saving ||
           GetQueuedSaveCount() > 0;
}

SaveState SaveSession::GetState() const {
    return m_manager->GetState();
}

std::optional<ConflictCase> SaveSession::GetConflict() const {
    return m_manager->GetConflict();
}

size_t SaveSession::GetQueuedSaveCount() const {
    const OfflineQueue* queue = m_manager->GetQueue();
    return queue ? queue->Size() : 0;
}

void SaveSession::OnConnectivityChanged(bool online) {
    if (!online) {
        TETHER_LOG_WARN("Connection lost, saves of '{}' will be queued", m_storageKey);
        return;
    }

    if (GetQueuedSaveCount() > 0) {
        TETHER_LOG_INFO("Connection restored, syncing queued saves of '{}'", m_storageKey);
        m_manager->ReplayQueue();
    } else if (m_manager->GetState() == SaveState::Offline && m_manager->HasPendingChanges()) {
        SaveCurrent(nullptr);
    }
}

void SaveSession::OnVisibilityChanged(bool visible) {
    if (!visible && m_manager->HasPendingChanges()) {
        TETHER_LOG_DEBUG("Host hidden, saving '{}' now", m_storageKey);
        SaveCurrent(nullptr);
    }
}

std::shared_future<SaveOutcome> SaveSession::SaveCurrent(AutoSaveManager::CompletionCallback onComplete) {
    std::optional<nlohmann::json> data = m_manager->GetBackupData();
    if (data) {
        return m_manager->ForceSave(*data, std::move(onComplete));
    }

    SaveOutcome outcome{m_manager->GetState(), "nothing to save"};
    if (onComplete) {
        onComplete(outcome);
    }

    std::promise<SaveOutcome> promise;
    promise.set_value(std::move(outcome));
    return promise.get_future().share();
}

} // namespace Tether
