#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace Tether {

/**
 * @brief Save state of a session; exactly one is active at a time
 */
enum class SaveState {
    Idle,
    Pending,
    Saving,
    Saved,
    Error,
    Offline,
    Conflict
};

[[nodiscard]] std::string_view ToString(SaveState state) noexcept;

/**
 * @brief Whether the state machine allows moving from one state to another
 */
[[nodiscard]] bool IsValidTransition(SaveState from, SaveState to) noexcept;

/**
 * @brief Failure classification reported by the remote save contract
 */
enum class SaveErrorKind {
    None,           // Success
    Validation,     // Bad input, never retried
    Transient,      // Network or server unavailable, retried with backoff
    Conflict        // Remote version differs from the expected one
};

[[nodiscard]] std::string_view ToString(SaveErrorKind kind) noexcept;

/**
 * @brief One invocation of the remote save contract
 */
struct SaveRequest {
    std::string storageKey;
    nlohmann::json data;
    std::optional<uint64_t> expectedVersion;  // Unset when conflict detection is off
    int attempt = 1;                          // 1-based within the current chain
};

/**
 * @brief Result of the remote save contract
 */
struct SaveResult {
    SaveErrorKind kind = SaveErrorKind::None;
    std::string message;
    std::optional<uint64_t> version;    // New remote version on success, current one on conflict
    nlohmann::json remoteData;          // Remote record on conflict

    [[nodiscard]] bool Ok() const { return kind == SaveErrorKind::None; }

    static SaveResult Success(std::optional<uint64_t> newVersion = std::nullopt);
    static SaveResult ValidationFailure(std::string message);
    static SaveResult TransientFailure(std::string message);
    static SaveResult ConflictWith(nlohmann::json remote, uint64_t remoteVersion,
                                   std::string message = "remote version changed");
};

/**
 * @brief Remote save contract; may block, always runs on the session scheduler
 */
using SaveFunction = std::function<SaveResult(const SaveRequest&)>;

/**
 * @brief Optional validator, returns an error description for invalid data
 */
using ValidateFunction = std::function<std::optional<std::string>(const nlohmann::json&)>;

/**
 * @brief Local and remote versions that diverged
 */
struct ConflictCase {
    nlohmann::json localData;
    nlohmann::json remoteData;
    std::optional<uint64_t> remoteVersion;
    std::optional<uint64_t> expectedVersion;
};

/**
 * @brief Terminal result of a forced or manual save
 */
struct SaveOutcome {
    SaveState state = SaveState::Idle;
    std::string message;

    [[nodiscard]] bool Succeeded() const { return state == SaveState::Saved; }
};

/**
 * @brief Aggregate result of an offline queue replay pass
 */
struct ReplayReport {
    size_t attempted = 0;
    size_t succeeded = 0;
    size_t remaining = 0;
    bool stalled = false;           // An item failed and blocked the rest
    bool alreadyRunning = false;    // Another pass was in progress
    std::string error;
    std::optional<std::string> stalledItemId;

    [[nodiscard]] bool Succeeded() const { return !stalled && !alreadyRunning && remaining == 0; }
};

/**
 * @brief Receives session events
 *
 * Called from the session scheduler thread, or from the caller's thread for
 * transitions caused directly by UpdateData/ClearPendingChanges.
 */
class ISaveObserver {
public:
    virtual ~ISaveObserver() = default;

    virtual void OnStateChanged(SaveState from, SaveState to) = 0;
    virtual void OnConflict(const ConflictCase& conflict) {}
    virtual void OnSyncStalled(const ReplayReport& report) {}
    virtual void OnManualSaveResult(const SaveOutcome& outcome) {}
};

} // namespace Tether
