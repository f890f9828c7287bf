// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_FETCH_FETCH_RESULT_HPP
#define SKYFETCH_FETCH_FETCH_RESULT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "survey/cutout_service.hpp"
#include "target/target.hpp"

namespace skyfetch::fetch {

/**
 * @brief Terminal state of one target
 */
enum class FetchStatus {
    Success,           ///< Non-blank image from survey_used
    Blank,             ///< Explicit survey answered with a blank image
    Exhausted,         ///< Every candidate survey was blank or unavailable
    ResolutionFailed,  ///< Target could not be parsed or resolved
    NetworkError       ///< Every attempt failed at the transport level
};

[[nodiscard]] constexpr auto toString(FetchStatus status) noexcept
    -> std::string_view {
    switch (status) {
        case FetchStatus::Success:
            return "success";
        case FetchStatus::Blank:
            return "blank";
        case FetchStatus::Exhausted:
            return "exhausted";
        case FetchStatus::ResolutionFailed:
            return "resolution_failed";
        case FetchStatus::NetworkError:
            return "network_error";
    }
    return "unknown";
}

/**
 * @brief Outcome of one survey within the fallback chain
 */
enum class AttemptOutcome { Success, Blank, NotCovered, NetworkError, Invalid };

[[nodiscard]] constexpr auto toString(AttemptOutcome outcome) noexcept
    -> std::string_view {
    switch (outcome) {
        case AttemptOutcome::Success:
            return "success";
        case AttemptOutcome::Blank:
            return "blank";
        case AttemptOutcome::NotCovered:
            return "not_covered";
        case AttemptOutcome::NetworkError:
            return "network_error";
        case AttemptOutcome::Invalid:
            return "invalid";
    }
    return "unknown";
}

struct SurveyAttempt {
    std::string surveyId;
    AttemptOutcome outcome = AttemptOutcome::NetworkError;
    int tries = 0;        ///< Requests issued, retries included
    int sizePx = 0;
    std::string message;
};

/**
 * @brief Per-target result; every failure mode is captured here
 */
struct FetchResult {
    target::Target target;
    FetchStatus status = FetchStatus::Exhausted;
    std::optional<target::ResolvedCoordinate> coordinate;
    std::optional<std::string> surveyUsed;  ///< Set for Success and Blank
    std::optional<survey::CutoutImage> image;
    std::string error;
    std::vector<SurveyAttempt> attempts;

    [[nodiscard]] auto isSuccess() const noexcept -> bool {
        return status == FetchStatus::Success;
    }

    [[nodiscard]] auto hasImage() const noexcept -> bool {
        return image.has_value() && !image->empty();
    }
};

/**
 * @brief Per-call fetch options
 */
struct FetchOptions {
    std::optional<std::string> survey;  ///< nullopt or "auto" for fallback
    double fovArcmin = 1.0;
    int sizePx = 0;         ///< 0 derives the size from fovArcmin
    double pixscale = 0.0;  ///< arcsec / pixel, 0 for the survey default
    int maxSizePx = 0;      ///< Extra cap on derived sizes, 0 for none
};

}  // namespace skyfetch::fetch

#endif  // SKYFETCH_FETCH_FETCH_RESULT_HPP
