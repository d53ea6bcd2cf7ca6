#include "config/AutoSaveConfig.hpp"
#include "core/Logger.hpp"

#include <fstream>
#include <iomanip>

namespace Tether {

namespace {

    template<typename T>
    void ReadIfPresent(const nlohmann::json& json, const char* key, T& out) {
        if (json.contains(key) && !json[key].is_null()) {
            out = json[key].get<T>();
        }
    }

    void ReadMillisIfPresent(const nlohmann::json& json, const char* key, std::chrono::milliseconds& out) {
        if (json.contains(key) && !json[key].is_null()) {
            out = std::chrono::milliseconds(json[key].get<int64_t>());
        }
    }

} // namespace

std::string_view ToString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::ParseError:   return "parse error";
        case ConfigError::InvalidValue: return "invalid value";
        case ConfigError::WriteError:   return "write error";
    }
    return "unknown";
}

bool Validate(const AutoSaveConfig& config, std::string* reason) {
    auto fail = [reason](const char* message) {
        if (reason) {
            *reason = message;
        }
        return false;
    };

    if (config.debounce.count() < 0) return fail("debounce must not be negative");
    if (config.maxRetries < 1) return fail("max_retries must be at least 1");
    if (config.retryDelay.count() < 0) return fail("retry_delay must not be negative");
    if (config.maxRetryDelay < config.retryDelay) return fail("max_retry_delay must be >= retry_delay");
    if (config.backupMaxAge.count() <= 0) return fail("backup_max_age must be positive");
    if (config.maxQueueSize == 0) return fail("max_queue_size must be positive");
    if (config.storageKeyPrefix.empty()) return fail("storage_key_prefix must not be empty");
    return true;
}

std::expected<AutoSaveConfig, ConfigError> LoadAutoSaveConfig(const nlohmann::json& json) {
    AutoSaveConfig config;

    if (json.is_null()) {
        return config;
    }
    if (!json.is_object()) {
        TETHER_LOG_ERROR("Auto-save config must be a JSON object");
        return std::unexpected(ConfigError::InvalidValue);
    }

    try {
        ReadMillisIfPresent(json, "debounce_ms", config.debounce);
        ReadIfPresent(json, "max_retries", config.maxRetries);
        ReadMillisIfPresent(json, "retry_delay_ms", config.retryDelay);
        ReadMillisIfPresent(json, "max_retry_delay_ms", config.maxRetryDelay);
        ReadIfPresent(json, "enable_local_backup", config.enableLocalBackup);
        ReadIfPresent(json, "enable_conflict_detection", config.enableConflictDetection);
        ReadIfPresent(json, "enable_offline_queue", config.enableOfflineQueue);
        ReadIfPresent(json, "storage_key_prefix", config.storageKeyPrefix);
        ReadMillisIfPresent(json, "backup_max_age_ms", config.backupMaxAge);
        ReadIfPresent(json, "max_queue_size", config.maxQueueSize);
    } catch (const nlohmann::json::exception& e) {
        TETHER_LOG_ERROR("Invalid auto-save config value: {}", e.what());
        return std::unexpected(ConfigError::InvalidValue);
    }

    // A base delay above the default cap raises the cap rather than failing
    if (!json.contains("max_retry_delay_ms") && config.maxRetryDelay < config.retryDelay) {
        config.maxRetryDelay = config.retryDelay;
    }

    std::string reason;
    if (!Validate(config, &reason)) {
        TETHER_LOG_ERROR("Invalid auto-save config: {}", reason);
        return std::unexpected(ConfigError::InvalidValue);
    }

    return config;
}

std::expected<AutoSaveConfig, ConfigError> LoadAutoSaveConfigFile(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        TETHER_LOG_WARN("Config file not found: {}", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        TETHER_LOG_ERROR("Failed to open config file: {}", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        TETHER_LOG_ERROR("Failed to parse config file: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }

    auto config = LoadAutoSaveConfig(json);
    if (config) {
        TETHER_LOG_INFO("Loaded auto-save configuration from: {}", filepath.string());
    }
    return config;
}

std::expected<void, ConfigError> SaveAutoSaveConfigFile(const AutoSaveConfig& config,
                                                        const std::filesystem::path& filepath) {
    std::error_code ec;
    if (filepath.has_parent_path()) {
        std::filesystem::create_directories(filepath.parent_path(), ec);
        if (ec) {
            TETHER_LOG_ERROR("Failed to create config directory: {}", ec.message());
            return std::unexpected(ConfigError::WriteError);
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        TETHER_LOG_ERROR("Failed to open config file for writing: {}", filepath.string());
        return std::unexpected(ConfigError::WriteError);
    }

    file << std::setw(4) << ToJson(config) << std::endl;
    if (!file) {
        return std::unexpected(ConfigError::WriteError);
    }
    return {};
}

nlohmann::json ToJson(const AutoSaveConfig& config) {
    return {
        {"debounce_ms", config.debounce.count()},
        {"max_retries", config.maxRetries},
        {"retry_delay_ms", config.retryDelay.count()},
        {"max_retry_delay_ms", config.maxRetryDelay.count()},
        {"enable_local_backup", config.enableLocalBackup},
        {"enable_conflict_detection", config.enableConflictDetection},
        {"enable_offline_queue", config.enableOfflineQueue},
        {"storage_key_prefix", config.storageKeyPrefix},
        {"backup_max_age_ms", config.backupMaxAge.count()},
        {"max_queue_size", config.maxQueueSize}
    };
}

} // namespace Tether
