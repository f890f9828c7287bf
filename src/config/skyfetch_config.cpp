// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "skyfetch_config.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace skyfetch::config {

namespace {

/// Count option: an integer of at least 1
auto readCount(const json& j, const char* key, size_t fallback) -> size_t {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        THROW_INVALID_CONFIGURATION(std::string(key) +
                                    " must be an integer, got " + value.dump());
    }
    const auto count = value.get<std::int64_t>();
    if (count < 1) {
        THROW_INVALID_CONFIGURATION(std::string(key) +
                                    " must be at least 1, got " +
                                    std::to_string(count));
    }
    return static_cast<size_t>(count);
}

}  // namespace

auto SkyFetchConfig::buildCatalog() const -> survey::SurveyCatalog {
    if (surveys) {
        return survey::SurveyCatalog::fromJson(*surveys);
    }
    return survey::SurveyCatalog::createDefault();
}

void SkyFetchConfig::validate() const {
    if (workerCount < 1) {
        THROW_INVALID_CONFIGURATION("workerCount must be at least 1");
    }
    if (cacheCapacity < 1) {
        THROW_INVALID_CONFIGURATION("cacheCapacity must be at least 1");
    }
    if (!std::isfinite(fovArcmin) || !(fovArcmin > 0.0)) {
        THROW_INVALID_CONFIGURATION("fov must be a positive finite number");
    }
    if (!std::isfinite(pixscale) || !std::isfinite(blankThreshold)) {
        THROW_INVALID_CONFIGURATION("pixscale and blankThreshold must be finite");
    }
    if (sizePx < 0 || batchMaxPixels < 0 || pixscale < 0.0) {
        THROW_INVALID_CONFIGURATION("Sizes and pixel scale must not be negative");
    }
    if (blankThreshold < 0.0) {
        THROW_INVALID_CONFIGURATION("blankThreshold must not be negative");
    }
    if (resolverRetries < 0 || fetchRetries < 0) {
        THROW_INVALID_CONFIGURATION("Retry counts must not be negative");
    }
    if (requestTimeout.count() <= 0) {
        THROW_INVALID_CONFIGURATION("requestTimeoutMs must be positive");
    }
    if (resolverBackoff.count() < 0 || fetchBackoff.count() < 0) {
        THROW_INVALID_CONFIGURATION("Backoff delays must not be negative");
    }
    if (sesameUrl.empty()) {
        THROW_INVALID_CONFIGURATION("sesameUrl cannot be empty");
    }

    [[maybe_unused]] auto level = logging::parseLevel(loggingConfig.consoleLevel);
    level = logging::parseLevel(loggingConfig.fileLevel);

    buildCatalog().validateRequest(surveyId);
}

auto SkyFetchConfig::fetchOptions() const -> fetch::FetchOptions {
    fetch::FetchOptions options;
    if (!survey::SurveyCatalog::isAuto(surveyId)) {
        options.survey = surveyId;
    }
    options.fovArcmin = fovArcmin;
    options.sizePx = sizePx;
    options.pixscale = pixscale;
    return options;
}

auto SkyFetchConfig::batchOptions() const -> fetch::FetchOptions {
    auto options = fetchOptions();
    options.maxSizePx = batchMaxPixels;
    return options;
}

auto SkyFetchConfig::fallbackConfig() const -> fetch::FallbackConfig {
    fetch::FallbackConfig cfg;
    cfg.networkRetries = fetchRetries;
    cfg.retryDelay = fetchBackoff;
    cfg.blankThreshold = blankThreshold;
    return cfg;
}

auto SkyFetchConfig::retryPolicy() const -> resolver::RetryPolicy {
    resolver::RetryPolicy policy;
    policy.maxRetries = resolverRetries;
    policy.baseDelay = resolverBackoff;
    return policy;
}

json SkyFetchConfig::toJson() const {
    json j = {{"survey", surveyId},
              {"fov", fovArcmin},
              {"size", sizePx},
              {"pixscale", pixscale},
              {"batchMaxPixels", batchMaxPixels},
              {"blankThreshold", blankThreshold},
              {"workerCount", workerCount},
              {"cacheCapacity", cacheCapacity},
              {"requestTimeoutMs", requestTimeout.count()},
              {"resolverRetries", resolverRetries},
              {"resolverBackoffMs", resolverBackoff.count()},
              {"fetchRetries", fetchRetries},
              {"fetchBackoffMs", fetchBackoff.count()},
              {"sesameUrl", sesameUrl},
              {"userAgent", userAgent},
              {"logging", loggingConfig.toJson()}};
    if (proxyUrl) {
        j["proxyUrl"] = *proxyUrl;
    }
    if (surveys) {
        j["surveys"] = *surveys;
    }
    return j;
}

SkyFetchConfig SkyFetchConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        THROW_INVALID_CONFIGURATION("Configuration must be a JSON object");
    }

    SkyFetchConfig cfg;
    try {
        cfg.surveyId = j.value("survey", cfg.surveyId);
        cfg.fovArcmin = j.value("fov", cfg.fovArcmin);
        cfg.sizePx = j.value("size", cfg.sizePx);
        cfg.pixscale = j.value("pixscale", cfg.pixscale);
        cfg.batchMaxPixels = j.value("batchMaxPixels", cfg.batchMaxPixels);
        cfg.blankThreshold = j.value("blankThreshold", cfg.blankThreshold);
        cfg.workerCount = readCount(j, "workerCount", cfg.workerCount);
        cfg.cacheCapacity = readCount(j, "cacheCapacity", cfg.cacheCapacity);
        cfg.requestTimeout = std::chrono::milliseconds{
            j.value("requestTimeoutMs", cfg.requestTimeout.count())};
        cfg.resolverRetries = j.value("resolverRetries", cfg.resolverRetries);
        cfg.resolverBackoff = std::chrono::milliseconds{
            j.value("resolverBackoffMs", cfg.resolverBackoff.count())};
        cfg.fetchRetries = j.value("fetchRetries", cfg.fetchRetries);
        cfg.fetchBackoff = std::chrono::milliseconds{
            j.value("fetchBackoffMs", cfg.fetchBackoff.count())};
        cfg.sesameUrl = j.value("sesameUrl", cfg.sesameUrl);
        cfg.userAgent = j.value("userAgent", cfg.userAgent);
        if (j.contains("proxyUrl")) {
            cfg.proxyUrl = j.at("proxyUrl").get<std::string>();
        }
        if (j.contains("logging")) {
            cfg.loggingConfig = logging::LoggingConfig::fromJson(j.at("logging"));
        }
        if (j.contains("surveys")) {
            cfg.surveys = j.at("surveys");
        }
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIGURATION(std::string("Invalid configuration: ") +
                                    e.what());
    }
    return cfg;
}

SkyFetchConfig SkyFetchConfig::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_INVALID_CONFIGURATION("Cannot open configuration file: " +
                                    path.string());
    }

    json j;
    try {
        j = json::parse(file, nullptr, true, true);
    } catch (const json::parse_error& e) {
        THROW_INVALID_CONFIGURATION("Cannot parse " + path.string() + ": " +
                                    e.what());
    }

    auto cfg = fromJson(j);
    cfg.validate();
    spdlog::info("Loaded configuration from {}", path.string());
    return cfg;
}

}  // namespace skyfetch::config
