#include "engine/Log.hpp"
#include "engine/Config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <vector>

namespace emberfall {

std::shared_ptr<spdlog::logger> Log::s_engineLogger;
std::shared_ptr<spdlog::logger> Log::s_contentLogger;
std::shared_ptr<spdlog::logger> Log::s_gameplayLogger;

namespace {

std::vector<spdlog::sink_ptr> makeSinks(const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }
    return sinks;
}

std::shared_ptr<spdlog::logger> makeLogger(const std::string& name, const std::vector<spdlog::sink_ptr>& sinks) {
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    return logger;
}

} // namespace

void Log::init(const std::string& logFile, const std::string& level, const std::string& flushLevel) {
    // Re-initialization (e.g. a second Simulation) replaces the old loggers
    auto sinks = makeSinks(logFile);
    s_engineLogger = makeLogger("ENGINE", sinks);
    s_contentLogger = makeLogger("CONTENT", sinks);
    s_gameplayLogger = makeLogger("GAMEPLAY", sinks);

    auto parsed = parseLevel(level);
    setLevel(parsed.value_or(spdlog::level::debug));
    if (!parsed) {
        s_engineLogger->warn("Log: unknown level '{}', using debug", level);
    }

    auto flushOn = parseLevel(flushLevel);
    if (!flushOn) {
        s_engineLogger->warn("Log: unknown flush level '{}', using warn", flushLevel);
    }
    for (auto* logger : {&s_engineLogger, &s_contentLogger, &s_gameplayLogger}) {
        (*logger)->flush_on(flushOn.value_or(spdlog::level::warn));
    }
}

void Log::init(const Config& config) {
    init(config.getString("log.file", ""), config.getString("log.level", "info"),
         config.getString("log.flush_level", "warn"));
}

void Log::shutdown() {
    s_engineLogger.reset();
    s_contentLogger.reset();
    s_gameplayLogger.reset();
    spdlog::shutdown();
}

std::optional<spdlog::level::level_enum> Log::parseLevel(const std::string& name) {
    // from_str maps every unknown name to off
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") return std::nullopt;
    return level;
}

void Log::setLevel(spdlog::level::level_enum level) {
    for (auto& logger : {getEngineLogger(), getContentLogger(), getGameplayLogger()}) {
        logger->set_level(level);
    }
}

std::shared_ptr<spdlog::logger>& Log::getEngineLogger() {
    if (!s_engineLogger) init();
    return s_engineLogger;
}

std::shared_ptr<spdlog::logger>& Log::getContentLogger() {
    if (!s_contentLogger) init();
    return s_contentLogger;
}

std::shared_ptr<spdlog::logger>& Log::getGameplayLogger() {
    if (!s_gameplayLogger) init();
    return s_gameplayLogger;
}

} // namespace emberfall
