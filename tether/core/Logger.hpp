#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>

namespace Tether {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Provides the TETHER_LOG_* macros used across the library. Until Initialize()
 * is called the macros write through spdlog's default logger.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Get the library logger (default logger if not initialized)
     */
    static std::shared_ptr<spdlog::logger> Get();

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace Tether

#define TETHER_LOG_TRACE(...)    ::Tether::Logger::Get()->trace(__VA_ARGS__)
#define TETHER_LOG_DEBUG(...)    ::Tether::Logger::Get()->debug(__VA_ARGS__)
#define TETHER_LOG_INFO(...)     ::Tether::Logger::Get()->info(__VA_ARGS__)
#define TETHER_LOG_WARN(...)     ::Tether::Logger::Get()->warn(__VA_ARGS__)
#define TETHER_LOG_ERROR(...)    ::Tether::Logger::Get()->error(__VA_ARGS__)
#define TETHER_LOG_CRITICAL(...) ::Tether::Logger::Get()->critical(__VA_ARGS__)
