#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace delve {

class Log {
public:
    static void init(const std::string& logFile = "", const std::string& level = "debug");
    static void shutdown();

    /// True once init() has created both loggers.
    static bool isInitialized();

    static std::shared_ptr<spdlog::logger>& getEngineLogger();
    static std::shared_ptr<spdlog::logger>& getGameLogger();

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_gameLogger;
};

} // namespace delve

// Engine logging macros (config, window, renderer, content loading)
#define LOG_TRACE(...)    ::delve::Log::getEngineLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::delve::Log::getEngineLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::delve::Log::getEngineLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::delve::Log::getEngineLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::delve::Log::getEngineLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::delve::Log::getEngineLogger()->critical(__VA_ARGS__)

// Game logging macros (turns, combat, descent, progression)
#define GAME_LOG_TRACE(...)    ::delve::Log::getGameLogger()->trace(__VA_ARGS__)
#define GAME_LOG_DEBUG(...)    ::delve::Log::getGameLogger()->debug(__VA_ARGS__)
#define GAME_LOG_INFO(...)     ::delve::Log::getGameLogger()->info(__VA_ARGS__)
#define GAME_LOG_WARN(...)     ::delve::Log::getGameLogger()->warn(__VA_ARGS__)
#define GAME_LOG_ERROR(...)    ::delve::Log::getGameLogger()->error(__VA_ARGS__)
#define GAME_LOG_CRITICAL(...) ::delve::Log::getGameLogger()->critical(__VA_ARGS__)
