// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "exception/exception.hpp"

namespace skyfetch::logging {

namespace {

constexpr const char* LOGGER_NAME = "skyfetch";

void ensureDirectoryExists(const std::string& filePath) {
    std::filesystem::path path(filePath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

}  // namespace

auto parseLevel(const std::string& name) -> spdlog::level::level_enum {
    std::string str(name);
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off" || str == "none") return spdlog::level::off;

    THROW_INVALID_CONFIGURATION("Unknown log level: " + name);
}

void initLogging(const LoggingConfig& config) {
    const auto consoleLevel = parseLevel(config.consoleLevel);
    const auto fileLevel = parseLevel(config.fileLevel);

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_level(consoleLevel);
    console->set_pattern(config.pattern);
    sinks.push_back(console);

    auto loggerLevel = consoleLevel;
    if (!config.logFile.empty()) {
        try {
            ensureDirectoryExists(config.logFile);
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logFile, config.maxFileSize, config.maxFiles);
            file->set_level(fileLevel);
            file->set_pattern(config.pattern);
            sinks.push_back(file);
            loggerLevel = std::min(consoleLevel, fileLevel);
        } catch (const spdlog::spdlog_ex& e) {
            THROW_INVALID_CONFIGURATION("Cannot open log file " +
                                        config.logFile + ": " + e.what());
        } catch (const std::filesystem::filesystem_error& e) {
            THROW_INVALID_CONFIGURATION("Cannot create log directory for " +
                                        config.logFile + ": " + e.what());
        }
    }

    spdlog::drop(LOGGER_NAME);
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(),
                                                   sinks.end());
    logger->set_level(loggerLevel);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::debug("Logging initialized with {} sinks", sinks.size());
}

void shutdownLogging() {
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
    spdlog::shutdown();
}

}  // namespace skyfetch::logging
