#pragma once

#include "config/AutoSaveConfig.hpp"
#include "core/TaskScheduler.hpp"
#include "persistence/IDurableStore.hpp"
#include "sync/AutoSaveManager.hpp"
#include "sync/ConflictResolver.hpp"
#include "sync/ConnectivityMonitor.hpp"
#include "sync/SaveTypes.hpp"
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace Tether {

/**
 * @brief Auto-save surface for one open record
 *
 * Owns the session's AutoSaveManager (and through it the offline queue).
 * Listens to the connectivity monitor: reconnecting drains the queue and
 * losing visibility with unsaved changes saves immediately.
 *
 * Usage:
 * @code
 * SaveSession::Dependencies deps;
 * deps.scheduler = &scheduler;
 * deps.store = &store;
 * deps.connectivity = &connectivity;
 * SaveSession session("profile/42", saveFunction, deps);
 * session.UpdateData(record);
 * @endcode
 */
class SaveSession : public IConnectivityListener {
public:
    struct Dependencies {
        ITaskScheduler* scheduler = nullptr;             // Required
        IDurableStore* store = nullptr;                  // Required
        ConnectivityMonitor* connectivity = nullptr;
        ISaveObserver* observer = nullptr;
        std::shared_ptr<IConflictResolver> resolver;
        ValidateFunction validator;
    };

    /**
     * @throws std::invalid_argument for an empty key, missing save function,
     *         missing scheduler/store or an invalid config
     */
    SaveSession(std::string storageKey,
                SaveFunction saveFunction,
                Dependencies dependencies,
                AutoSaveConfig config = {});
    ~SaveSession() override;

    SaveSession(const SaveSession&) = delete;
    SaveSession& operator=(const SaveSession&) = delete;

    /**
     * @brief Record the state of the record when the session opens
     */
    void SetBaseline(const nlohmann::json& data, std::optional<uint64_t> version = std::nullopt);

    /**
     * @brief Submit edited data; unchanged data is ignored
     */
    void UpdateData(const nlohmann::json& newData);

    std::shared_future<SaveOutcome> ForceSave();

    /**
     * @brief ForceSave() reported to the user
     *
     * The outcome is logged and passed to ISaveObserver::OnManualSaveResult.
     */
    std::shared_future<SaveOutcome> ManualSave();

    /**
     * @brief Replay saves that could not reach the remote store
     */
    std::shared_future<ReplayReport> RetryFailedSaves();

    std::shared_future<SaveOutcome> ResolveConflict(const nlohmann::json& merged);

    void ClearPendingChanges();

    /**
     * @brief Latest edited value for a "restore unsaved changes" prompt
     */
    [[nodiscard]] std::optional<nlohmann::json> GetRecoveryData() const;

    [[nodiscard]] bool HasPendingChanges() const;

    /**
     * @brief Whether closing now could lose edits (pending, in flight or queued)
     */
    [[nodiscard]] bool HasUnsavedChangesOnExit() const;

    [[nodiscard]] SaveState GetState() const;
    [[nodiscard]] std::optional<ConflictCase> GetConflict() const;
    [[nodiscard]] size_t GetQueuedSaveCount() const;
    [[nodiscard]] const std::string& GetStorageKey() const { return m_storageKey; }

    AutoSaveManager& GetManager() { return *m_manager; }
    const AutoSaveManager& GetManager() const { return *m_manager; }

    // IConnectivityListener
    void OnConnectivityChanged(bool online) override;
    void OnVisibilityChanged(bool visible) override;

private:
    std::shared_future<SaveOutcome> SaveCurrent(AutoSaveManager::CompletionCallback onComplete);

    std::string m_storageKey;
    ConnectivityMonitor* m_connectivity;
    ISaveObserver* m_observer;
    std::unique_ptr<AutoSaveManager> m_manager;
};

} // namespace Tether
