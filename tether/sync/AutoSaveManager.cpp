#include "sync/AutoSaveManager.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>

namespace Tether {

namespace {
    constexpr int BACKUP_FORMAT = 1;

    bool Holds(const std::optional<nlohmann::json>& value, const nlohmann::json& data) {
        return value.has_value() && *value == data;
    }
}

AutoSaveManager::AutoSaveManager(AutoSaveConfig config,
                                 ITaskScheduler& scheduler,
                                 IDurableStore& store,
                                 ConnectivityMonitor* connectivity)
    : m_config(std::move(config))
    , m_scheduler(scheduler)
    , m_store(store)
    , m_connectivity(connectivity)
    , m_lifetime(std::make_shared<Lifetime>()) {
    std::string reason;
    if (!Validate(m_config, &reason)) {
        throw std::invalid_argument("Invalid auto-save config: " + reason);
    }
}

AutoSaveManager::~AutoSaveManager() {
    Cleanup();

    // Waits for a running task, later ones see the flag and return
    std::lock_guard<std::mutex> lock(m_lifetime->mutex);
    m_lifetime->alive = false;
}

bool AutoSaveManager::Initialize(SaveFunction saveFunction, ISaveObserver* observer, const std::string& storageKey) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_initialized) {
            TETHER_LOG_WARN("AutoSaveManager already initialized for '{}'", m_storageKey);
            return false;
        }
        if (m_destroyed) {
            TETHER_LOG_ERROR("AutoSaveManager cannot be initialized after cleanup");
            return false;
        }
        if (!saveFunction) {
            TETHER_LOG_ERROR("AutoSaveManager requires a save function");
            return false;
        }
        if (storageKey.empty()) {
            TETHER_LOG_ERROR("AutoSaveManager requires a storage key");
            return false;
        }

        m_saveFunction = std::move(saveFunction);
        m_observer = observer;
        m_storageKey = storageKey;

        m_queue = std::make_unique<OfflineQueue>(m_store,
                                                 m_config.storageKeyPrefix + "_" + m_storageKey + "_queue",
                                                 m_config.maxQueueSize);
        if (!m_queue->Load()) {
            TETHER_LOG_WARN("Offline queue for '{}' could not be restored", m_storageKey);
        }
        m_queue->RegisterProcessor(m_storageKey, [this](const QueueItem& item) { return ReplayItem(item); });

        RestoreBackup();
        m_initialized = true;
    }

    TETHER_LOG_INFO("Auto-save initialized for '{}' (debounce {}ms, {} attempts, retry delay {}ms)",
                    storageKey, m_config.debounce.count(), m_config.maxRetries, m_config.retryDelay.count());
    return true;
}

void AutoSaveManager::SetValidator(ValidateFunction validator) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_validator = std::move(validator);
}

void AutoSaveManager::SetConflictResolver(std::shared_ptr<IConflictResolver> resolver) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_resolver = std::move(resolver);
}

void AutoSaveManager::SetBaseline(const nlohmann::json& data, std::optional<uint64_t> version) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_lastSavedData = data;
    m_remoteVersion = version;
}

// ============================================================================
// Triggers
// ============================================================================

void AutoSaveManager::ScheduleAutoSave(const nlohmann::json& data) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_initialized || m_destroyed) {
            TETHER_LOG_WARN("ScheduleAutoSave ignored, session is not active");
            return;
        }
        ScheduleLocked(data, events);
    }
    Dispatch(events);
}

bool AutoSaveManager::ScheduleAutoSaveIfChanged(const nlohmann::json& data) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_initialized || m_destroyed) {
            TETHER_LOG_WARN("ScheduleAutoSave ignored, session is not active");
            return false;
        }

        const std::optional<nlohmann::json>& reference = m_snapshot ? m_snapshot : m_lastSavedData;
        if (Holds(reference, data)) {
            return false;
        }
        ScheduleLocked(data, events);
    }
    Dispatch(events);
    return true;
}

std::shared_future<SaveOutcome> AutoSaveManager::ForceSave(const nlohmann::json& data, CompletionCallback onComplete) {
    SaveOutcome rejected;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_initialized && !m_destroyed) {
            CancelTimersLocked();
            m_snapshot = data;
            m_pendingData = data;
            WriteBackupLocked(data);

            Waiter waiter;
            waiter.onComplete = std::move(onComplete);
            auto future = waiter.promise.get_future().share();
            m_queuedWaiters.push_back(std::move(waiter));

            m_scheduler.Post(Guarded([this] { StartForcedChain(); }));
            return future;
        }

        rejected.state = m_state;
        rejected.message = m_destroyed ? "session closed" : "session not initialized";
    }

    TETHER_LOG_WARN("ForceSave rejected: {}", rejected.message);
    if (onComplete) {
        onComplete(rejected);
    }
    return ReadyOutcome(rejected.state, rejected.message);
}

void AutoSaveManager::ClearPendingChanges() {
    Events events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_initialized || m_destroyed) {
            return;
        }

        CancelTimersLocked();
        if (m_snapshot) {
            m_lastSavedData = m_snapshot;
        }
        m_pendingData.reset();
        m_attempt = 0;
        m_conflict.reset();
        m_conflictItemId.reset();
        RemoveBackupLocked();
        m_recoveredBackup.reset();

        std::move(m_queuedWaiters.begin(), m_queuedWaiters.end(), std::back_inserter(m_activeWaiters));
        m_queuedWaiters.clear();
        CompleteWaitersLocked(SaveState::Idle, "changes discarded", events);
        SetStateLocked(SaveState::Idle, events);
    }

    TETHER_LOG_INFO("Pending changes for '{}' cleared", m_storageKey);
    Dispatch(events);
}

std::shared_future<SaveOutcome> AutoSaveManager::ResolveConflict(const nlohmann::json& merged) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_initialized || m_destroyed) {
        return ReadyOutcome(m_state, "session not active");
    }
    if (m_state != SaveState::Conflict || !m_conflict) {
        TETHER_LOG_WARN("ResolveConflict called for '{}' without a conflict", m_storageKey);
        return ReadyOutcome(m_state, "no conflict to resolve");
    }

    AdoptMergedLocked(merged);

    Waiter waiter;
    auto future = waiter.promise.get_future().share();
    m_queuedWaiters.push_back(std::move(waiter));
    m_scheduler.Post(Guarded([this] { StartForcedChain(); }));

    TETHER_LOG_INFO("Conflict on '{}' resolved by caller", m_storageKey);
    return future;
}

std::shared_future<ReplayReport> AutoSaveManager::ReplayQueue() {
    auto promise = std::make_shared<std::promise<ReplayReport>>();
    auto future = promise->get_future().share();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized || m_destroyed) {
        ReplayReport report;
        report.error = "session not active";
        report.remaining = m_queue ? m_queue->Size() : 0;
        promise->set_value(report);
        return future;
    }

    m_replayWaiters.push_back(promise);
    m_scheduler.Post(Guarded([this, promise] { RunReplay(promise); }));
    return future;
}

void AutoSaveManager::Cleanup() {
    Events events;
    std::vector<std::shared_ptr<std::promise<ReplayReport>>> replays;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_destroyed) {
            return;
        }
        m_destroyed = true;

        CancelTimersLocked();
        std::move(m_queuedWaiters.begin(), m_queuedWaiters.end(), std::back_inserter(m_activeWaiters));
        m_queuedWaiters.clear();
        CompleteWaitersLocked(m_state, "session closed", events);
        replays = std::move(m_replayWaiters);
        m_replayWaiters.clear();
    }

    Dispatch(events);

    for (auto& promise : replays) {
        ReplayReport report;
        report.error = "session closed";
        report.remaining = m_queue ? m_queue->Size() : 0;
        promise->set_value(report);
    }

    if (!m_storageKey.empty()) {
        TETHER_LOG_DEBUG("Auto-save for '{}' cleaned up", m_storageKey);
    }
}

// ============================================================================
// Scheduler tasks
// ============================================================================

void AutoSaveManager::OnDebounceFired() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_debounceTask = 0;

        if (m_destroyed || !m_pendingData) {
            return;
        }
        if (m_attemptInFlight) {
            TETHER_LOG_WARN("Debounced save for '{}' skipped, an attempt is in flight", m_storageKey);
            return;
        }

        if (m_retryTask != 0) {
            m_scheduler.Cancel(m_retryTask);
            m_retryTask = 0;
        }
        m_attempt = 0;
    }
    RunAttempt();
}

void AutoSaveManager::StartForcedChain() {
    Events events;
    bool start = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_destroyed) {
            return;
        }

        std::move(m_queuedWaiters.begin(), m_queuedWaiters.end(), std::back_inserter(m_activeWaiters));
        m_queuedWaiters.clear();

        if (!m_pendingData) {
            // An earlier chain already covered this data
            CompleteWaitersLocked(m_state, "", events);
        } else {
            if (m_retryTask != 0) {
                m_scheduler.Cancel(m_retryTask);
                m_retryTask = 0;
            }
            m_attempt = 0;
            start = true;
        }
    }
    Dispatch(events);

    if (start) {
        RunAttempt();
    }
}

void AutoSaveManager::RunAttempt() {
    SaveRequest request;
    ValidateFunction validator;
    SaveFunction saveFunction;
    Events events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_retryTask = 0;

        if (m_destroyed || !m_pendingData) {
            return;
        }
        if (m_attemptInFlight) {
            TETHER_LOG_WARN("Save attempt for '{}' skipped, another is in flight", m_storageKey);
            return;
        }

        request.storageKey = m_storageKey;
        request.data = *m_pendingData;
        request.attempt = ++m_attempt;
        if (m_config.enableConflictDetection) {
            request.expectedVersion = m_remoteVersion;
        }
        validator = m_validator;
        saveFunction = m_saveFunction;

        WriteBackupLocked(m_snapshot.value_or(request.data));
        SetStateLocked(SaveState::Saving, events);
        m_attemptInFlight = true;
    }
    Dispatch(events);

    if (validator) {
        std::optional<std::string> error;
        try {
            error = validator(request.data);
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (error) {
            HandleResult(request, SaveResult::ValidationFailure(*error));
            return;
        }
    }

    if (!IsOnline()) {
        HandleOffline(request.data);
        return;
    }

    TETHER_LOG_DEBUG("Saving '{}' (attempt {}/{})", request.storageKey, request.attempt, m_config.maxRetries);

    SaveResult result;
    try {
        result = saveFunction(request);
    } catch (const std::exception& e) {
        result = SaveResult::TransientFailure(e.what());
    }

    HandleResult(request, result);
}

void AutoSaveManager::HandleResult(const SaveRequest& request, const SaveResult& result) {
    Events events;
    std::optional<ConflictCase> conflict;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_attemptInFlight = false;

        if (m_state != SaveState::Saving) {
            // Discarded while in flight, only the remote facts still apply
            if (result.Ok()) {
                if (result.version) {
                    m_remoteVersion = result.version;
                }
                m_lastSavedData = request.data;
                m_lastSavedAt = GetCurrentTimestamp();
            }
            TETHER_LOG_DEBUG("Save result for '{}' arrived after the session moved on", m_storageKey);
            return;
        }

        // A debounce or forced save armed mid-flight owns m_pendingData, even
        // when it carries the same value as this attempt
        const bool newerData = m_debounceTask != 0;
        const bool forcedNext = !m_queuedWaiters.empty();
        if (!newerData && !forcedNext && Holds(m_pendingData, request.data)) {
            m_pendingData.reset();
        }

        switch (result.kind) {
            case SaveErrorKind::None:
                if (result.version) {
                    m_remoteVersion = result.version;
                }
                m_lastSavedData = request.data;
                m_lastSavedAt = GetCurrentTimestamp();
                m_conflict.reset();
                if (m_conflictItemId) {
                    // The merged record supersedes the queued edit it came from
                    if (!m_queue->RemoveItem(*m_conflictItemId)) {
                        TETHER_LOG_WARN("Queued item {} not removed after merge", *m_conflictItemId);
                    }
                    m_conflictItemId.reset();
                }
                if (Holds(m_snapshot, request.data)) {
                    RemoveBackupLocked();
                    m_recoveredBackup.reset();
                }
                m_attempt = 0;
                SetStateLocked(SaveState::Saved, events);
                CompleteWaitersLocked(SaveState::Saved, "", events);
                break;

            case SaveErrorKind::Validation:
                TETHER_LOG_ERROR("Save of '{}' rejected: {}", m_storageKey, result.message);
                m_attempt = 0;
                SetStateLocked(SaveState::Error, events);
                CompleteWaitersLocked(SaveState::Error, result.message, events);
                break;

            case SaveErrorKind::Conflict:
                m_attempt = 0;
                conflict = ConflictCase{m_snapshot.value_or(request.data), result.remoteData,
                                        result.version, request.expectedVersion};
                break;

            case SaveErrorKind::Transient:
                if (newerData || forcedNext) {
                    TETHER_LOG_DEBUG("Failed save of '{}' superseded by newer data: {}", m_storageKey, result.message);
                    m_attempt = 0;
                    break;
                }
                if (m_attempt < m_config.maxRetries) {
                    m_pendingData = request.data;
                    Milliseconds delay = ComputeRetryDelay(m_config, request.attempt);
                    m_retryTask = m_scheduler.ScheduleAfter(delay, Guarded([this] { RunAttempt(); }));
                    TETHER_LOG_WARN("Save attempt {}/{} for '{}' failed: {}; retrying in {}ms",
                                    request.attempt, m_config.maxRetries, m_storageKey, result.message, delay.count());
                    break;
                }

                TETHER_LOG_ERROR("Save of '{}' failed after {} attempts: {}",
                                 m_storageKey, request.attempt, result.message);
                if (m_config.enableOfflineQueue) {
                    EnqueueLocked(request.data);
                }
                m_attempt = 0;
                SetStateLocked(SaveState::Error, events);
                CompleteWaitersLocked(SaveState::Error, result.message, events);
                break;
        }

        if (newerData && !conflict) {
            SetStateLocked(SaveState::Pending, events);
        }
    }
    Dispatch(events);

    if (conflict) {
        HandleConflict(std::move(*conflict), std::nullopt);
    }
}

void AutoSaveManager::HandleOffline(const nlohmann::json& data) {
    Events events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_attemptInFlight = false;

        if (m_state != SaveState::Saving) {
            return;
        }

        if (m_config.enableOfflineQueue) {
            EnqueueLocked(data);
        }
        const bool newerData = m_debounceTask != 0;
        if (!newerData && m_queuedWaiters.empty() && Holds(m_pendingData, data)) {
            m_pendingData.reset();
        }
        m_attempt = 0;

        SetStateLocked(SaveState::Offline, events);
        CompleteWaitersLocked(SaveState::Offline, "offline, save queued", events);
        if (newerData) {
            SetStateLocked(SaveState::Pending, events);
        }
    }

    TETHER_LOG_WARN("Host offline, save of '{}' deferred", m_storageKey);
    Dispatch(events);
}

void AutoSaveManager::HandleConflict(ConflictCase conflict, std::optional<std::string> queueItemId) {
    std::shared_ptr<IConflictResolver> resolver;
    {
        Events events;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_conflict = conflict;
            m_conflictItemId = std::move(queueItemId);
            resolver = m_resolver;
            SetStateLocked(SaveState::Conflict, events);
            events.conflict = conflict;
        }

        TETHER_LOG_WARN("Conflict saving '{}': remote version {} differs from expected {}",
                        m_storageKey,
                        conflict.remoteVersion ? std::to_string(*conflict.remoteVersion) : "unknown",
                        conflict.expectedVersion ? std::to_string(*conflict.expectedVersion) : "none");
        Dispatch(events);
    }

    std::optional<nlohmann::json> merged;
    if (resolver) {
        try {
            merged = resolver->Resolve(conflict);
        } catch (const std::exception& e) {
            TETHER_LOG_ERROR("Conflict resolver for '{}' failed: {}", m_storageKey, e.what());
        }
    }

    Events events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (merged && m_state == SaveState::Conflict && !m_destroyed) {
            AdoptMergedLocked(*merged);
            m_scheduler.Post(Guarded([this] { RunAttempt(); }));
            TETHER_LOG_INFO("Conflict on '{}' merged, saving merged record", m_storageKey);
        } else {
            if (!resolver) {
                TETHER_LOG_INFO("Conflict on '{}' awaits explicit resolution", m_storageKey);
            }
            CompleteWaitersLocked(SaveState::Conflict, "remote version changed", events);
        }
    }
    Dispatch(events);
}

void AutoSaveManager::RunReplay(std::shared_ptr<std::promise<ReplayReport>> promise) {
    ReplayReport report;
    SaveState before = SaveState::Idle;
    Events events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = std::find(m_replayWaiters.begin(), m_replayWaiters.end(), promise);
        if (it == m_replayWaiters.end()) {
            return;     // Resolved by Cleanup()
        }
        m_replayWaiters.erase(it);

        report.remaining = m_queue->Size();
        if (m_attemptInFlight) {
            report.alreadyRunning = true;
        } else if (report.remaining > 0 && !IsOnline()) {
            report.error = "offline";
        }

        if (report.remaining == 0 || report.alreadyRunning || !report.error.empty()) {
            promise->set_value(report);
            return;
        }

        before = m_state;
        m_attemptInFlight = true;
        m_replayConflict.reset();
        SetStateLocked(SaveState::Saving, events);
    }
    Dispatch(events);

    TETHER_LOG_INFO("Replaying {} queued save(s) for '{}'", report.remaining, m_storageKey);
    report = m_queue->ProcessQueue();

    std::optional<ConflictCase> conflict;
    Events done;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_attemptInFlight = false;

        if (m_state == SaveState::Saving) {
            if (m_replayConflict) {
                conflict = std::move(m_replayConflict);
                done.stalled = report;
            } else if (report.Succeeded()) {
                m_conflict.reset();
                m_conflictItemId.reset();
                if (m_lastSavedData && Holds(m_snapshot, *m_lastSavedData)) {
                    RemoveBackupLocked();
                    m_recoveredBackup.reset();
                }
                SetStateLocked(SaveState::Saved, done);
            } else if (report.stalled) {
                SetStateLocked(IsOnline() ? SaveState::Error : SaveState::Offline, done);
                done.stalled = report;
            } else {
                SetStateLocked(before, done);
            }

            if (!conflict && m_debounceTask != 0) {
                SetStateLocked(SaveState::Pending, done);
            }
        }
        m_replayConflict.reset();
    }
    Dispatch(done);
    promise->set_value(report);

    if (conflict) {
        HandleConflict(std::move(*conflict), report.stalledItemId);
    }
}

SaveResult AutoSaveManager::ReplayItem(const QueueItem& item) {
    SaveRequest request;
    SaveFunction saveFunction;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        request.storageKey = item.key;
        request.data = item.payload;
        request.attempt = item.attemptCount + 1;
        if (m_config.enableConflictDetection) {
            request.expectedVersion = m_remoteVersion;
        }
        saveFunction = m_saveFunction;
    }

    if (!IsOnline()) {
        return SaveResult::TransientFailure("offline");
    }

    SaveResult result;
    try {
        result = saveFunction(request);
    } catch (const std::exception& e) {
        result = SaveResult::TransientFailure(e.what());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (result.Ok()) {
        if (result.version) {
            m_remoteVersion = result.version;
        }
        m_lastSavedData = item.payload;
        m_lastSavedAt = GetCurrentTimestamp();
    } else if (result.kind == SaveErrorKind::Conflict) {
        m_replayConflict = ConflictCase{m_snapshot.value_or(item.payload), result.remoteData,
                                        result.version, request.expectedVersion};
    }
    return result;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<nlohmann::json> AutoSaveManager::GetBackupData() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot ? m_snapshot : m_recoveredBackup;
}

std::optional<nlohmann::json> AutoSaveManager::GetCurrentData() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

SaveState AutoSaveManager::GetState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool AutoSaveManager::HasPendingChanges() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot.has_value() && !(m_lastSavedData && *m_lastSavedData == *m_snapshot);
}

std::optional<nlohmann::json> AutoSaveManager::GetLastSavedData() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastSavedData;
}

std::optional<uint64_t> AutoSaveManager::GetRemoteVersion() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_remoteVersion;
}

std::optional<ConflictCase> AutoSaveManager::GetConflict() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_conflict;
}

uint64_t AutoSaveManager::GetLastSavedAt() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastSavedAt;
}

bool AutoSaveManager::IsInitialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized && !m_destroyed;
}

std::string AutoSaveManager::GetBackupKey() const {
    return m_config.storageKeyPrefix + "_" + m_storageKey + "_backup";
}

Milliseconds AutoSaveManager::ComputeRetryDelay(const AutoSaveConfig& config, int failedAttempt) {
    Milliseconds delay = config.retryDelay;
    for (int i = 1; i < failedAttempt && delay < config.maxRetryDelay; ++i) {
        delay *= 2;
    }
    return std::min(delay, config.maxRetryDelay);
}

// ============================================================================
// Internal helpers
// ============================================================================

void AutoSaveManager::SetStateLocked(SaveState state, Events& events) {
    if (m_state == state) {
        return;
    }

    if (!IsValidTransition(m_state, state)) {
        TETHER_LOG_ERROR("Rejected save state transition {} -> {} for '{}'",
                         ToString(m_state), ToString(state), m_storageKey);
        return;
    }

    TETHER_LOG_TRACE("'{}' save state {} -> {}", m_storageKey, ToString(m_state), ToString(state));
    events.transitions.emplace_back(m_state, state);
    m_state = state;
}

void AutoSaveManager::ScheduleLocked(const nlohmann::json& data, Events& events) {
    m_snapshot = data;
    m_pendingData = data;
    WriteBackupLocked(data);

    if (m_debounceTask != 0) {
        m_scheduler.Cancel(m_debounceTask);
    }
    m_debounceTask = m_scheduler.ScheduleAfter(m_config.debounce, Guarded([this] { OnDebounceFired(); }));

    // With a call in flight the state follows once its result is applied
    if (!m_attemptInFlight) {
        if (m_retryTask != 0) {
            m_scheduler.Cancel(m_retryTask);
            m_retryTask = 0;
            m_attempt = 0;
        }
        SetStateLocked(SaveState::Pending, events);
    }
}

void AutoSaveManager::CompleteWaitersLocked(SaveState state, const std::string& message, Events& events) {
    events.outcome = SaveOutcome{state, message};
    std::move(m_activeWaiters.begin(), m_activeWaiters.end(), std::back_inserter(events.completed));
    m_activeWaiters.clear();
}

void AutoSaveManager::CancelTimersLocked() {
    if (m_debounceTask != 0) {
        m_scheduler.Cancel(m_debounceTask);
        m_debounceTask = 0;
    }
    if (m_retryTask != 0) {
        m_scheduler.Cancel(m_retryTask);
        m_retryTask = 0;
    }
}

void AutoSaveManager::WriteBackupLocked(const nlohmann::json& data) {
    if (!m_config.enableLocalBackup) {
        return;
    }

    nlohmann::json backup = {
        {"data", data},
        {"timestamp", GetCurrentTimestamp()},
        {"baseVersion", m_remoteVersion ? nlohmann::json(*m_remoteVersion) : nlohmann::json(nullptr)},
        {"format", BACKUP_FORMAT}
    };

    if (!m_store.Set(GetBackupKey(), backup.dump())) {
        TETHER_LOG_ERROR("Failed to write recovery backup for '{}'", m_storageKey);
    }
}

void AutoSaveManager::RemoveBackupLocked() {
    if (!m_config.enableLocalBackup) {
        return;
    }

    if (!m_store.Remove(GetBackupKey())) {
        TETHER_LOG_WARN("Failed to remove recovery backup for '{}'", m_storageKey);
    }
}

void AutoSaveManager::EnqueueLocked(const nlohmann::json& data) {
    auto id = m_queue->Enqueue(m_storageKey, data);
    if (!id) {
        TETHER_LOG_ERROR("Could not queue save of '{}': {}; changes remain in the recovery backup",
                         m_storageKey, ToString(id.error()));
    }
}

void AutoSaveManager::AdoptMergedLocked(const nlohmann::json& merged) {
    CancelTimersLocked();
    if (m_conflict && m_conflict->remoteVersion) {
        m_remoteVersion = m_conflict->remoteVersion;
    }
    m_conflict.reset();
    m_snapshot = merged;
    m_pendingData = merged;
    m_attempt = 0;
    WriteBackupLocked(merged);
}

void AutoSaveManager::RestoreBackup() {
    if (!m_config.enableLocalBackup) {
        return;
    }

    auto stored = m_store.Get(GetBackupKey());
    if (!stored) {
        return;
    }

    nlohmann::json backup = nlohmann::json::parse(*stored, nullptr, false);
    if (backup.is_discarded() || !backup.is_object() || !backup.contains("data")) {
        TETHER_LOG_WARN("Ignoring unreadable recovery backup for '{}'", m_storageKey);
        return;
    }

    uint64_t timestamp = 0;
    if (backup.contains("timestamp") && backup["timestamp"].is_number_unsigned()) {
        timestamp = backup["timestamp"].get<uint64_t>();
    }

    const uint64_t now = GetCurrentTimestamp();
    const uint64_t age = now > timestamp ? now - timestamp : 0;
    if (age >= static_cast<uint64_t>(m_config.backupMaxAge.count())) {
        TETHER_LOG_INFO("Ignoring recovery backup for '{}' older than {}ms", m_storageKey,
                        m_config.backupMaxAge.count());
        return;
    }

    m_recoveredBackup = backup["data"];
    TETHER_LOG_INFO("Recovered unsaved changes for '{}' ({}s old)", m_storageKey, age / 1000);
}

void AutoSaveManager::Dispatch(Events& events) {
    if (m_observer) {
        for (const auto& [from, to] : events.transitions) {
            m_observer->OnStateChanged(from, to);
        }
        if (events.conflict) {
            m_observer->OnConflict(*events.conflict);
        }
        if (events.stalled) {
            m_observer->OnSyncStalled(*events.stalled);
        }
    }

    for (auto& waiter : events.completed) {
        if (waiter.onComplete) {
            try {
                waiter.onComplete(events.outcome);
            } catch (const std::exception& e) {
                TETHER_LOG_ERROR("Save completion callback failed: {}", e.what());
            }
        }
        waiter.promise.set_value(events.outcome);
    }
    events.completed.clear();
}

bool AutoSaveManager::IsOnline() const {
    return m_connectivity == nullptr || m_connectivity->IsOnline();
}

std::shared_future<SaveOutcome> AutoSaveManager::ReadyOutcome(SaveState state, std::string message) {
    std::promise<SaveOutcome> promise;
    promise.set_value(SaveOutcome{state, std::move(message)});
    return promise.get_future().share();
}

uint64_t AutoSaveManager::GetCurrentTimestamp() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace Tether
