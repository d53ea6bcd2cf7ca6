#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace Tether {

/**
 * @brief Errors reported while loading an AutoSaveConfig
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    InvalidValue,
    WriteError
};

[[nodiscard]] std::string_view ToString(ConfigError error) noexcept;

/**
 * @brief Per-session auto-save settings, fixed when the session is created
 */
struct AutoSaveConfig {
    std::chrono::milliseconds debounce{1000};           // Quiet period before a save fires
    int maxRetries = 3;                                 // Total attempts per save chain
    std::chrono::milliseconds retryDelay{2000};         // Base backoff delay
    std::chrono::milliseconds maxRetryDelay{30000};     // Backoff cap
    bool enableLocalBackup = true;
    bool enableConflictDetection = true;
    bool enableOfflineQueue = true;
    std::string storageKeyPrefix = "autosave";
    std::chrono::milliseconds backupMaxAge{24 * 60 * 60 * 1000};  // Older backups are ignored
    size_t maxQueueSize = 100;

    bool operator==(const AutoSaveConfig&) const = default;
};

/**
 * @brief Build a config from JSON, missing keys keep their defaults
 *
 * Recognised keys: debounce_ms, max_retries, retry_delay_ms,
 * max_retry_delay_ms, enable_local_backup, enable_conflict_detection,
 * enable_offline_queue, storage_key_prefix, backup_max_age_ms, max_queue_size.
 */
[[nodiscard]] std::expected<AutoSaveConfig, ConfigError> LoadAutoSaveConfig(const nlohmann::json& json);

/**
 * @brief Load a config from a JSON file
 */
[[nodiscard]] std::expected<AutoSaveConfig, ConfigError> LoadAutoSaveConfigFile(const std::filesystem::path& filepath);

/**
 * @brief Write a config to a JSON file, creating parent directories
 */
[[nodiscard]] std::expected<void, ConfigError> SaveAutoSaveConfigFile(const AutoSaveConfig& config,
                                                                      const std::filesystem::path& filepath);

[[nodiscard]] nlohmann::json ToJson(const AutoSaveConfig& config);

/**
 * @brief Check value ranges (maxRetries >= 1, non-negative delays, ...)
 */
[[nodiscard]] bool Validate(const AutoSaveConfig& config, std::string* reason = nullptr);

} // namespace Tether
