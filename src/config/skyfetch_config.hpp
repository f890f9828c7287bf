// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_CONFIG_SKYFETCH_CONFIG_HPP
#define SKYFETCH_CONFIG_SKYFETCH_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "fetch/fallback_fetcher.hpp"
#include "logging/logging.hpp"
#include "resolver/name_resolver.hpp"
#include "survey/survey_catalog.hpp"

namespace skyfetch::config {

using json = nlohmann::json;

/**
 * @brief Top level configuration
 *
 * Every field has a working default, so an empty JSON object is a valid
 * configuration. CLI options are applied on top of the loaded values.
 *
 * @example
 * ```json
 * {
 *   "survey": "auto",
 *   "fov": 2.0,
 *   "workerCount": 8,
 *   "cacheCapacity": 256,
 *   "requestTimeoutMs": 30000,
 *   "logging": { "consoleLevel": "info" }
 * }
 * ```
 */
struct SkyFetchConfig {
    // ========================================================================
    // Fetch Defaults
    // ========================================================================

    std::string surveyId{"auto"};  ///< "auto" or a catalog id
    double fovArcmin{1.0};       ///< Field of view in arcminutes
    int sizePx{0};               ///< 0 derives the size from the fov
    double pixscale{0.0};        ///< 0 uses the survey default
    int batchMaxPixels{512};     ///< Cap on derived sizes in batch mode
    double blankThreshold{10.0}; ///< Pixel stddev below which a cutout is blank

    // ========================================================================
    // Concurrency and Caching
    // ========================================================================

    size_t workerCount{8};
    size_t cacheCapacity{256};

    // ========================================================================
    // Network
    // ========================================================================

    std::chrono::milliseconds requestTimeout{30000};
    int resolverRetries{2};
    std::chrono::milliseconds resolverBackoff{500};
    int fetchRetries{1};
    std::chrono::milliseconds fetchBackoff{500};
    std::string sesameUrl{"https://cds.unistra.fr/cgi-bin/nph-sesame/-oI/SNV"};
    std::string userAgent{"SkyFetch/1.0"};
    std::optional<std::string> proxyUrl;

    // ========================================================================
    // Sections
    // ========================================================================

    logging::LoggingConfig loggingConfig;
    std::optional<json> surveys;  ///< Replaces the built-in catalog when set

    /**
     * @brief Build the survey catalog this configuration describes
     * @throws InvalidConfigurationError for a malformed survey list
     */
    [[nodiscard]] auto buildCatalog() const -> survey::SurveyCatalog;

    /**
     * @brief Check ranges and that the default survey exists
     * @throws InvalidConfigurationError, UnknownSurveyError
     */
    void validate() const;

    /**
     * @brief Fetch options for single fetches
     */
    [[nodiscard]] auto fetchOptions() const -> fetch::FetchOptions;

    /**
     * @brief Fetch options for batches, capping derived sizes at
     * batchMaxPixels
     */
    [[nodiscard]] auto batchOptions() const -> fetch::FetchOptions;

    [[nodiscard]] auto fallbackConfig() const -> fetch::FallbackConfig;
    [[nodiscard]] auto retryPolicy() const -> resolver::RetryPolicy;

    [[nodiscard]] json toJson() const;

    /**
     * @throws InvalidConfigurationError on type mismatches
     */
    [[nodiscard]] static SkyFetchConfig fromJson(const json& j);

    /**
     * @brief Load and validate a JSON file
     * @throws InvalidConfigurationError if the file is missing, unparsable
     *         or invalid
     */
    [[nodiscard]] static SkyFetchConfig loadFromFile(
        const std::filesystem::path& path);
};

}  // namespace skyfetch::config

#endif  // SKYFETCH_CONFIG_SKYFETCH_CONFIG_HPP
