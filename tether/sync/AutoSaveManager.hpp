#pragma once

#include "config/AutoSaveConfig.hpp"
#include "core/TaskScheduler.hpp"
#include "persistence/IDurableStore.hpp"
#include "sync/ConflictResolver.hpp"
#include "sync/ConnectivityMonitor.hpp"
#include "sync/OfflineQueue.hpp"
#include "sync/SaveTypes.hpp"
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace Tether {

/**
 * @brief Save state machine for one editing session
 *
 * Turns a stream of data updates into as few remote save attempts as
 * possible:
 * - Debounced scheduling, only the latest value is ever submitted
 * - Durable recovery snapshot written before every attempt
 * - Exponential backoff on transient failures, bounded by maxRetries
 * - Offline queueing when the host is offline or retries are exhausted
 * - Version based conflict detection with a pluggable resolver
 *
 * Every remote call, retry and queue replay runs as a task on the scheduler,
 * so at most one call is in flight. Public methods may be called from any
 * thread; observers are invoked without internal locks held.
 */
class AutoSaveManager {
public:
    using CompletionCallback = std::function<void(const SaveOutcome&)>;

    /**
     * @param scheduler Timer and serial executor, must outlive the manager
     * @param store Durable store for backups and the offline queue, must outlive the manager
     * @param connectivity Optional host connectivity; treated as online when null
     */
    AutoSaveManager(AutoSaveConfig config,
                    ITaskScheduler& scheduler,
                    IDurableStore& store,
                    ConnectivityMonitor* connectivity = nullptr);
    ~AutoSaveManager();

    AutoSaveManager(const AutoSaveManager&) = delete;
    AutoSaveManager& operator=(const AutoSaveManager&) = delete;

    /**
     * @brief Bind the remote save contract, observer and storage key
     *
     * Restores any backup younger than backupMaxAge and any queued saves.
     * @return False if already initialized or the arguments are unusable
     */
    bool Initialize(SaveFunction saveFunction, ISaveObserver* observer, const std::string& storageKey);

    void SetValidator(ValidateFunction validator);
    void SetConflictResolver(std::shared_ptr<IConflictResolver> resolver);

    /**
     * @brief Record the last saved record and remote version known at session start
     */
    void SetBaseline(const nlohmann::json& data, std::optional<uint64_t> version);

    /**
     * @brief Restart the debounce window with new data
     */
    void ScheduleAutoSave(const nlohmann::json& data);

    /**
     * @brief ScheduleAutoSave() unless data equals the current snapshot, or
     * the last saved record when there is no snapshot yet
     * @return True if a save was scheduled
     */
    bool ScheduleAutoSaveIfChanged(const nlohmann::json& data);

    /**
     * @brief Cancel timers and save data immediately
     * @param onComplete Optional callback invoked with the outcome, on the scheduler thread
     * @return Resolves once the attempt chain reaches a terminal state
     */
    std::shared_future<SaveOutcome> ForceSave(const nlohmann::json& data, CompletionCallback onComplete = nullptr);

    /**
     * @brief Treat the current data as saved without any remote call
     */
    void ClearPendingChanges();

    /**
     * @brief Resolve a conflict with a caller provided record
     *
     * Adopts the remote version reported with the conflict and force-saves
     * merged. Resolves immediately with the current state when there is no
     * conflict to resolve.
     */
    std::shared_future<SaveOutcome> ResolveConflict(const nlohmann::json& merged);

    /**
     * @brief Replay the offline queue on the scheduler
     */
    std::shared_future<ReplayReport> ReplayQueue();

    /**
     * @brief Cancel timers and stop accepting work; safe to call repeatedly
     */
    void Cleanup();

    /**
     * @brief Latest intended value: in-memory snapshot, else the restored backup
     */
    [[nodiscard]] std::optional<nlohmann::json> GetBackupData() const;

    /**
     * @brief Last value passed to ScheduleAutoSave()/ForceSave() in this process
     */
    [[nodiscard]] std::optional<nlohmann::json> GetCurrentData() const;

    [[nodiscard]] SaveState GetState() const;
    [[nodiscard]] bool HasPendingChanges() const;
    [[nodiscard]] std::optional<nlohmann::json> GetLastSavedData() const;
    [[nodiscard]] std::optional<uint64_t> GetRemoteVersion() const;
    [[nodiscard]] std::optional<ConflictCase> GetConflict() const;
    [[nodiscard]] uint64_t GetLastSavedAt() const;
    [[nodiscard]] bool IsInitialized() const;
    [[nodiscard]] const AutoSaveConfig& GetConfig() const { return m_config; }
    [[nodiscard]] const std::string& GetStorageKey() const { return m_storageKey; }
    [[nodiscard]] std::string GetBackupKey() const;

    /**
     * @brief Offline queue of this session, null before Initialize()
     */
    [[nodiscard]] OfflineQueue* GetQueue() { return m_queue.get(); }
    [[nodiscard]] const OfflineQueue* GetQueue() const { return m_queue.get(); }

    /**
     * @brief Delay before retrying after the given failed attempt (1-based)
     */
    [[nodiscard]] static Milliseconds ComputeRetryDelay(const AutoSaveConfig& config, int failedAttempt);

private:
    // Keeps scheduled tasks from touching a destroyed manager
    struct Lifetime {
        std::mutex mutex;
        bool alive = true;
    };

    struct Waiter {
        std::promise<SaveOutcome> promise;
        CompletionCallback onComplete;
    };

    // Side effects collected under m_mutex and delivered after unlocking
    struct Events {
        std::vector<std::pair<SaveState, SaveState>> transitions;
        std::optional<ConflictCase> conflict;
        std::optional<ReplayReport> stalled;
        std::vector<Waiter> completed;
        SaveOutcome outcome;
    };

    template <typename Fn>
    Task Guarded(Fn fn) {
        return [life = m_lifetime, fn = std::move(fn)]() {
            std::lock_guard<std::mutex> lock(life->mutex);
            if (life->alive) {
                fn();
            }
        };
    }

    // Scheduler tasks
    void OnDebounceFired();
    void StartForcedChain();
    void RunAttempt();
    void RunReplay(std::shared_ptr<std::promise<ReplayReport>> promise);

    void HandleResult(const SaveRequest& request, const SaveResult& result);
    void HandleOffline(const nlohmann::json& data);
    void HandleConflict(ConflictCase conflict, std::optional<std::string> queueItemId);
    SaveResult ReplayItem(const QueueItem& item);

    // Helpers expecting m_mutex held
    void ScheduleLocked(const nlohmann::json& data, Events& events);
    void SetStateLocked(SaveState state, Events& events);
    void CompleteWaitersLocked(SaveState state, const std::string& message, Events& events);
    void CancelTimersLocked();
    void WriteBackupLocked(const nlohmann::json& data);
    void RemoveBackupLocked();
    void EnqueueLocked(const nlohmann::json& data);
    void AdoptMergedLocked(const nlohmann::json& merged);

    void RestoreBackup();
    void Dispatch(Events& events);
    bool IsOnline() const;
    static std::shared_future<SaveOutcome> ReadyOutcome(SaveState state, std::string message);
    static uint64_t GetCurrentTimestamp();

    AutoSaveConfig m_config;
    ITaskScheduler& m_scheduler;
    IDurableStore& m_store;
    ConnectivityMonitor* m_connectivity;
    std::shared_ptr<Lifetime> m_lifetime;

    SaveFunction m_saveFunction;
    ValidateFunction m_validator;
    std::shared_ptr<IConflictResolver> m_resolver;
    ISaveObserver* m_observer = nullptr;
    std::string m_storageKey;
    std::unique_ptr<OfflineQueue> m_queue;

    mutable std::mutex m_mutex;
    SaveState m_state = SaveState::Idle;
    std::optional<nlohmann::json> m_snapshot;        // Latest UpdateData/ForceSave value
    std::optional<nlohmann::json> m_pendingData;     // Value the next attempt submits
    std::optional<nlohmann::json> m_recoveredBackup; // Backup restored at Initialize()
    std::optional<nlohmann::json> m_lastSavedData;
    uint64_t m_lastSavedAt = 0;
    std::optional<uint64_t> m_remoteVersion;
    std::optional<ConflictCase> m_conflict;
    std::optional<std::string> m_conflictItemId;     // Queued item superseded by a merge
    std::optional<ConflictCase> m_replayConflict;

    TaskId m_debounceTask = 0;
    TaskId m_retryTask = 0;
    int m_attempt = 0;
    bool m_attemptInFlight = false;
    bool m_initialized = false;
    bool m_destroyed = false;

    std::vector<Waiter> m_queuedWaiters;    // ForceSave calls whose chain has not started
    std::vector<Waiter> m_activeWaiters;    // Waiting on the running chain
    std::vector<std::shared_ptr<std::promise<ReplayReport>>> m_replayWaiters;
};

} // namespace Tether
