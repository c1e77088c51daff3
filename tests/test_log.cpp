#include <gtest/gtest.h>
#include "engine/Log.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace delve;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::drop_all();
    }

    void TearDown() override {
        spdlog::drop_all();
        Log::init("", "warn");
    }
};

TEST_F(LogTest, InitWithDefaults) {
    ASSERT_NO_THROW(Log::init());
    EXPECT_TRUE(Log::isInitialized());
    EXPECT_NE(Log::getEngineLogger(), nullptr);
    EXPECT_NE(Log::getGameLogger(), nullptr);
}

TEST_F(LogTest, InitWithLogLevel) {
    Log::init("", "warn");
    EXPECT_EQ(Log::getEngineLogger()->level(), spdlog::level::warn);
    EXPECT_EQ(Log::getGameLogger()->level(), spdlog::level::warn);
}

TEST_F(LogTest, EngineAndGameLoggersAreSeparate) {
    Log::init();
    EXPECT_EQ(Log::getEngineLogger()->name(), "ENGINE");
    EXPECT_EQ(Log::getGameLogger()->name(), "GAME");
}

TEST_F(LogTest, ReinitReplacesLoggers) {
    Log::init("", "info");
    Log::init("", "error");
    EXPECT_EQ(Log::getEngineLogger()->level(), spdlog::level::err);
    EXPECT_EQ(spdlog::get("ENGINE"), Log::getEngineLogger());
}

TEST_F(LogTest, AllLogLevels) {
    for (const auto& level : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        ASSERT_NO_THROW(Log::init("", level));
    }
    EXPECT_EQ(Log::getEngineLogger()->level(), spdlog::level::off);
}

TEST_F(LogTest, UnknownLevelFallsBackToDebug) {
    Log::init("", "verbose");
    EXPECT_EQ(Log::getEngineLogger()->level(), spdlog::level::debug);
}

TEST_F(LogTest, ShutdownSafe) {
    Log::init();
    EXPECT_NO_THROW(Log::shutdown());
}

TEST_F(LogTest, AllMacroLevels) {
    Log::init("", "off");
    EXPECT_NO_THROW(LOG_TRACE("trace message"));
    EXPECT_NO_THROW(LOG_DEBUG("debug {}", 1));
    EXPECT_NO_THROW(LOG_INFO("info {}", "x"));
    EXPECT_NO_THROW(LOG_WARN("warn message"));
    EXPECT_NO_THROW(LOG_ERROR("error message"));
    EXPECT_NO_THROW(LOG_CRITICAL("critical message"));
    EXPECT_NO_THROW(GAME_LOG_TRACE("trace message"));
    EXPECT_NO_THROW(GAME_LOG_DEBUG("depth {}", 3));
    EXPECT_NO_THROW(GAME_LOG_INFO("info message"));
    EXPECT_NO_THROW(GAME_LOG_WARN("warn message"));
    EXPECT_NO_THROW(GAME_LOG_ERROR("error message"));
    EXPECT_NO_THROW(GAME_LOG_CRITICAL("critical message"));
}

class LogFileTest : public ::testing::Test {
protected:
    std::string logPath;

    void SetUp() override {
        spdlog::drop_all();
        logPath = (std::filesystem::temp_directory_path() / "delve_test_log.txt").string();
        std::filesystem::remove(logPath);
    }

    void TearDown() override {
        spdlog::drop_all();
        Log::init("", "warn");
        std::filesystem::remove(logPath);
    }
};

TEST_F(LogFileTest, FileLoggingWritesBothLoggers) {
    Log::init(logPath, "debug");
    LOG_INFO("engine line");
    GAME_LOG_INFO("game line");
    Log::getEngineLogger()->flush();
    Log::getGameLogger()->flush();

    std::ifstream f(logPath);
    ASSERT_TRUE(f.good()) << "Log file should have been created";
    std::string contents((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("engine line"), std::string::npos);
    EXPECT_NE(contents.find("game line"), std::string::npos);
    EXPECT_NE(contents.find("[GAME]"), std::string::npos);
}
