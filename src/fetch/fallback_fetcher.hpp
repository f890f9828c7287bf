// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_FETCH_FALLBACK_FETCHER_HPP
#define SKYFETCH_FETCH_FALLBACK_FETCHER_HPP

#include <chrono>
#include <memory>
#include <string>

#include "fetch_result.hpp"
#include "resolver/name_resolver.hpp"
#include "survey/cutout_service.hpp"
#include "survey/image_statistics.hpp"
#include "survey/survey_catalog.hpp"

namespace skyfetch::fetch {

/**
 * @brief Fallback behaviour shared by every fetch
 */
struct FallbackConfig {
    int networkRetries = 1;                     ///< Per survey, after the first try
    std::chrono::milliseconds retryDelay{500};  ///< Doubled on each retry
    double blankThreshold = survey::DEFAULT_BLANK_THRESHOLD;
};

/**
 * @brief Resolve one target and walk the survey fallback chain
 *
 * Attempt order comes from SurveyCatalog::candidates(). A survey that is
 * blank, not covering or unreachable moves on to the next one. Only option
 * errors throw; every per-target failure ends up in FetchResult::status.
 *
 * Safe to share between threads as long as the injected collaborators are.
 */
class FallbackFetcher {
public:
    /**
     * @throws std::invalid_argument if a collaborator is nullptr
     */
    FallbackFetcher(survey::SurveyCatalogPtr catalog,
                    std::shared_ptr<resolver::NameResolver> resolver,
                    survey::CutoutServicePtr cutouts,
                    const FallbackConfig& config = {});

    /**
     * @brief Fetch a raw token: coordinates or an object name
     * @throws InvalidConfigurationError, UnknownSurveyError on bad options
     */
    [[nodiscard]] auto fetchOne(const std::string& token,
                                const FetchOptions& options = {})
        -> FetchResult;

    /**
     * @throws InvalidConfigurationError, UnknownSurveyError on bad options
     */
    [[nodiscard]] auto fetchOne(const target::Target& target,
                                const FetchOptions& options = {})
        -> FetchResult;

    /**
     * @brief Reject non-finite or non-positive fov, negative sizes and
     * unknown surveys
     */
    void validateOptions(const FetchOptions& options) const;

    /**
     * @brief Coordinates of a target, going through the resolver for names
     * @throws NameResolutionError
     * @throws CoordinateParseError for a coordinate outside ra [0, 360),
     *         dec [-90, 90]
     */
    [[nodiscard]] auto resolveTarget(const target::Target& target)
        -> target::ResolvedCoordinate;

    /**
     * @brief Pixel size requested from one survey
     *
     * An explicit size is only clamped to the survey limit. A size derived
     * from the fov is additionally capped by options.maxSizePx.
     */
    [[nodiscard]] static auto sizeFor(const survey::SurveyDescriptor& survey,
                                      const FetchOptions& options) -> int;

    [[nodiscard]] auto catalog() const noexcept
        -> const survey::SurveyCatalogPtr& {
        return catalog_;
    }

    [[nodiscard]] auto config() const noexcept -> const FallbackConfig& {
        return config_;
    }

private:
    auto trySurvey(const survey::SurveyDescriptor& survey,
                   const target::ResolvedCoordinate& coord,
                   const FetchOptions& options,
                   std::optional<survey::CutoutImage>& image) -> SurveyAttempt;

    survey::SurveyCatalogPtr catalog_;
    std::shared_ptr<resolver::NameResolver> resolver_;
    survey::CutoutServicePtr cutouts_;
    FallbackConfig config_;
};

}  // namespace skyfetch::fetch

#endif  // SKYFETCH_FETCH_FALLBACK_FETCHER_HPP
