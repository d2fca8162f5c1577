#pragma once

#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace emberfall {

class Config;

/// Named loggers of the simulation. ENGINE covers the tick loop and config,
/// CONTENT template and animation loading, GAMEPLAY the per-entity systems.
/// All three share one set of sinks and one level.
class Log {
public:
    static void init(const std::string& logFile = "", const std::string& level = "debug",
                     const std::string& flushLevel = "warn");

    /// Reads log.file, log.level and log.flush_level
    static void init(const Config& config);

    static void shutdown();

    /// Accepts spdlog's names ("trace" ... "critical", "off") plus "warning"
    static std::optional<spdlog::level::level_enum> parseLevel(const std::string& name);

    /// Changes the level of every logger without rebuilding the sinks
    static void setLevel(spdlog::level::level_enum level);

    static std::shared_ptr<spdlog::logger>& getEngineLogger();
    static std::shared_ptr<spdlog::logger>& getContentLogger();
    static std::shared_ptr<spdlog::logger>& getGameplayLogger();

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_contentLogger;
    static std::shared_ptr<spdlog::logger> s_gameplayLogger;
};

} // namespace emberfall

// Engine logging macros
#define LOG_TRACE(...)    ::emberfall::Log::getEngineLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::emberfall::Log::getEngineLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::emberfall::Log::getEngineLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::emberfall::Log::getEngineLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::emberfall::Log::getEngineLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::emberfall::Log::getEngineLogger()->critical(__VA_ARGS__)

// Content (template/animation loading) logging macros
#define CONTENT_LOG_TRACE(...)    ::emberfall::Log::getContentLogger()->trace(__VA_ARGS__)
#define CONTENT_LOG_DEBUG(...)    ::emberfall::Log::getContentLogger()->debug(__VA_ARGS__)
#define CONTENT_LOG_INFO(...)     ::emberfall::Log::getContentLogger()->info(__VA_ARGS__)
#define CONTENT_LOG_WARN(...)     ::emberfall::Log::getContentLogger()->warn(__VA_ARGS__)
#define CONTENT_LOG_ERROR(...)    ::emberfall::Log::getContentLogger()->error(__VA_ARGS__)
#define CONTENT_LOG_CRITICAL(...) ::emberfall::Log::getContentLogger()->critical(__VA_ARGS__)

// Gameplay system logging macros
#define GAME_LOG_TRACE(...)    ::emberfall::Log::getGameplayLogger()->trace(__VA_ARGS__)
#define GAME_LOG_DEBUG(...)    ::emberfall::Log::getGameplayLogger()->debug(__VA_ARGS__)
#define GAME_LOG_INFO(...)     ::emberfall::Log::getGameplayLogger()->info(__VA_ARGS__)
#define GAME_LOG_WARN(...)     ::emberfall::Log::getGameplayLogger()->warn(__VA_ARGS__)
#define GAME_LOG_ERROR(...)    ::emberfall::Log::getGameplayLogger()->error(__VA_ARGS__)
