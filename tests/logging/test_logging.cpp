// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>

#include "exception/exception.hpp"
#include "logging/logging.hpp"

using namespace skyfetch::logging;

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        initLogging({});
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_ =
        std::filesystem::temp_directory_path() / "skyfetch_logging_test";
};

TEST_F(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(parseLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(parseLevel("Warning"), spdlog::level::warn);
    EXPECT_EQ(parseLevel("err"), spdlog::level::err);
    EXPECT_EQ(parseLevel("fatal"), spdlog::level::critical);
    EXPECT_EQ(parseLevel("none"), spdlog::level::off);
    EXPECT_THROW((void)parseLevel("verbose"),
                 skyfetch::InvalidConfigurationError);
}

TEST_F(LoggingTest, FileSinkReceivesMessages) {
    LoggingConfig config;
    config.consoleLevel = "off";
    config.fileLevel = "debug";
    config.logFile = (dir_ / "logs" / "skyfetch.log").string();
    initLogging(config);

    spdlog::debug("debug line for the file sink");
    spdlog::default_logger()->flush();

    std::ifstream in(config.logFile);
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("debug line for the file sink"), std::string::npos);
}

TEST_F(LoggingTest, InvalidLevelLeavesLoggerUsable) {
    LoggingConfig config;
    config.consoleLevel = "chatty";
    EXPECT_THROW(initLogging(config), skyfetch::InvalidConfigurationError);
    ASSERT_NE(spdlog::default_logger(), nullptr);
    spdlog::info("still logging");
}

TEST_F(LoggingTest, ConfigJsonRoundTrip) {
    LoggingConfig config;
    config.logFile = "out.log";
    config.maxFiles = 5;
    auto restored = LoggingConfig::fromJson(config.toJson());
    EXPECT_EQ(restored.logFile, "out.log");
    EXPECT_EQ(restored.maxFiles, 5u);
    EXPECT_EQ(restored.pattern, config.pattern);
}
