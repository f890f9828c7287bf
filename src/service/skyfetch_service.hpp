// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_SERVICE_SKYFETCH_SERVICE_HPP
#define SKYFETCH_SERVICE_SKYFETCH_SERVICE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/skyfetch_config.hpp"
#include "fetch/batch_executor.hpp"
#include "fetch/fetch_result.hpp"
#include "resolver/resolution_backend.hpp"
#include "resolver/resolution_cache.hpp"
#include "survey/cutout_service.hpp"
#include "survey/survey_catalog.hpp"

namespace skyfetch::service {

/**
 * @brief Entry point wiring resolver, catalog, cutout service and batch
 * executor from one SkyFetchConfig
 *
 * Options left unset on a call fall back to the configured defaults.
 *
 * Usage:
 * @code
 * SkyFetchService service(SkyFetchConfig::loadFromFile("skyfetch.json"));
 * auto result = service.fetchOne("NGC 788");
 * auto results = service.fetchMany({"M31", "150.0 2.2"});
 * @endcode
 */
class SkyFetchService {
public:
    /**
     * @brief Build the production stack (libcurl, Sesame, HTTP cutouts)
     * @throws InvalidConfigurationError, UnknownSurveyError
     */
    explicit SkyFetchService(const config::SkyFetchConfig& config = {});

    /**
     * @brief Build with injected remote services
     * @throws InvalidConfigurationError, UnknownSurveyError
     * @throws std::invalid_argument on null collaborators
     */
    SkyFetchService(const config::SkyFetchConfig& config,
                    resolver::NameResolutionBackendPtr backend,
                    survey::CutoutServicePtr cutouts);

    ~SkyFetchService();

    SkyFetchService(const SkyFetchService&) = delete;
    SkyFetchService& operator=(const SkyFetchService&) = delete;
    SkyFetchService(SkyFetchService&&) noexcept;
    SkyFetchService& operator=(SkyFetchService&&) noexcept;

    [[nodiscard]] auto fetchOne(
        const std::string& token,
        const std::optional<fetch::FetchOptions>& options = std::nullopt)
        -> fetch::FetchResult;

    [[nodiscard]] auto fetchOne(
        const target::Target& target,
        const std::optional<fetch::FetchOptions>& options = std::nullopt)
        -> fetch::FetchResult;

    /**
     * @brief Fetch many targets; output[i] belongs to tokens[i]
     *
     * Without explicit options the batch defaults apply, which cap derived
     * sizes at batchMaxPixels.
     */
    [[nodiscard]] auto fetchMany(
        const std::vector<std::string>& tokens,
        const std::optional<fetch::FetchOptions>& options = std::nullopt,
        std::optional<size_t> workerCount = std::nullopt,
        const fetch::ProgressCallback& progress = nullptr)
        -> std::vector<fetch::FetchResult>;

    [[nodiscard]] auto fetchMany(
        const std::vector<target::Target>& targets,
        const std::optional<fetch::FetchOptions>& options = std::nullopt,
        std::optional<size_t> workerCount = std::nullopt,
        const fetch::ProgressCallback& progress = nullptr)
        -> std::vector<fetch::FetchResult>;

    /**
     * @throws NameResolutionError
     */
    [[nodiscard]] auto resolve(const std::string& name)
        -> target::ResolvedCoordinate;

    [[nodiscard]] auto catalog() const -> const survey::SurveyCatalog&;
    [[nodiscard]] auto cacheStats() const -> resolver::CacheStats;
    [[nodiscard]] auto config() const -> const config::SkyFetchConfig&;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace skyfetch::service

#endif  // SKYFETCH_SERVICE_SKYFETCH_SERVICE_HPP
