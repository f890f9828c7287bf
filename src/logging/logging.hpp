// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_LOGGING_LOGGING_HPP
#define SKYFETCH_LOGGING_LOGGING_HPP

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace skyfetch::logging {

using json = nlohmann::json;

/**
 * @brief Console and file logging settings
 *
 * @example
 * ```json
 * "logging": {
 *   "consoleLevel": "info",
 *   "fileLevel": "debug",
 *   "logFile": "logs/skyfetch.log",
 *   "maxFileSize": 10485760,
 *   "maxFiles": 3
 * }
 * ```
 */
struct LoggingConfig {
    std::string consoleLevel{"info"};  ///< Console log level
    std::string fileLevel{"debug"};    ///< File log level
    std::string logFile;               ///< Empty disables the file sink

    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size before rotation
    size_t maxFiles{3};                    ///< Max number of rotated files

    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};

    [[nodiscard]] json toJson() const {
        return {{"consoleLevel", consoleLevel},
                {"fileLevel", fileLevel},
                {"logFile", logFile},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig fromJson(const json& j) {
        LoggingConfig cfg;
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);
        cfg.logFile = j.value("logFile", cfg.logFile);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }
};

/**
 * @brief Map a level name to spdlog's level
 *
 * Accepts trace, debug, info, warn/warning, error/err, critical/fatal and
 * off/none, case-insensitively.
 *
 * @throws InvalidConfigurationError for anything else
 */
[[nodiscard]] auto parseLevel(const std::string& name)
    -> spdlog::level::level_enum;

/**
 * @brief Install the default logger: colored stdout plus optional rotating
 * file
 * @throws InvalidConfigurationError on bad levels or an unusable log file
 */
void initLogging(const LoggingConfig& config = {});

/**
 * @brief Flush and drop every logger
 */
void shutdownLogging();

}  // namespace skyfetch::logging

#endif  // SKYFETCH_LOGGING_LOGGING_HPP
