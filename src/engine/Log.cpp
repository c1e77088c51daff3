#include "engine/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <vector>

namespace delve {

std::shared_ptr<spdlog::logger> Log::s_engineLogger;
std::shared_ptr<spdlog::logger> Log::s_gameLogger;

namespace {

spdlog::level::level_enum parseLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off")      return spdlog::level::off;
    return spdlog::level::debug;
}

} // namespace

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Re-initialising replaces the previous loggers
    spdlog::drop("ENGINE");
    spdlog::drop("GAME");

    s_engineLogger = std::make_shared<spdlog::logger>("ENGINE", sinks.begin(), sinks.end());
    s_gameLogger = std::make_shared<spdlog::logger>("GAME", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_engineLogger->set_level(spdLevel);
    s_gameLogger->set_level(spdLevel);

    spdlog::register_logger(s_engineLogger);
    spdlog::register_logger(s_gameLogger);
}

void Log::shutdown() {
    spdlog::shutdown();
}

bool Log::isInitialized() {
    return s_engineLogger != nullptr && s_gameLogger != nullptr;
}

std::shared_ptr<spdlog::logger>& Log::getEngineLogger() {
    return s_engineLogger;
}

std::shared_ptr<spdlog::logger>& Log::getGameLogger() {
    return s_gameLogger;
}

} // namespace delve
