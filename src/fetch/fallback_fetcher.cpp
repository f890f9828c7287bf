// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "fallback_fetcher.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <variant>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "target/coordinate_parser.hpp"

namespace skyfetch::fetch {

FallbackFetcher::FallbackFetcher(
    survey::SurveyCatalogPtr catalog,
    std::shared_ptr<resolver::NameResolver> resolver,
    survey::CutoutServicePtr cutouts, const FallbackConfig& config)
    : catalog_(std::move(catalog)),
      resolver_(std::move(resolver)),
      cutouts_(std::move(cutouts)),
      config_(config) {
    if (!catalog_) {
        throw std::invalid_argument("Survey catalog cannot be null");
    }
    if (!resolver_) {
        throw std::invalid_argument("Name resolver cannot be null");
    }
    if (!cutouts_) {
        throw std::invalid_argument("Cutout service cannot be null");
    }
    if (config_.networkRetries < 0 || config_.blankThreshold < 0.0) {
        THROW_INVALID_CONFIGURATION(
            "Retries and blank threshold must not be negative");
    }
}

void FallbackFetcher::validateOptions(const FetchOptions& options) const {
    if (!std::isfinite(options.fovArcmin) || !(options.fovArcmin > 0.0)) {
        THROW_INVALID_CONFIGURATION(
            "Field of view must be a positive finite number, got " +
            std::to_string(options.fovArcmin));
    }
    if (options.sizePx < 0 || options.maxSizePx < 0) {
        THROW_INVALID_CONFIGURATION("Pixel sizes must not be negative");
    }
    if (!std::isfinite(options.pixscale) || options.pixscale < 0.0) {
        THROW_INVALID_CONFIGURATION(
            "Pixel scale must be finite and not negative");
    }
    catalog_->validateRequest(options.survey);
}

auto FallbackFetcher::sizeFor(const survey::SurveyDescriptor& survey,
                              const FetchOptions& options) -> int {
    if (options.sizePx > 0) {
        return std::min(options.sizePx, survey.maxSize);
    }
    int size = survey.pixelsForFov(options.fovArcmin, options.pixscale);
    if (options.maxSizePx > 0) {
        size = std::min(size, options.maxSizePx);
    }
    return size;
}

auto FallbackFetcher::resolveTarget(const target::Target& target)
    -> target::ResolvedCoordinate {
    return std::visit(
        [this](const auto& value) -> target::ResolvedCoordinate {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, target::Coordinate>) {
                if (!target::isValidRaDec(value.ra, value.dec)) {
                    THROW_COORDINATE_PARSE_ERROR(
                        "Coordinates out of range (ra must be in [0, 360), "
                        "dec in [-90, 90]): " +
                        std::format("({}, {})", value.ra, value.dec));
                }
                return {value.ra, value.dec};
            } else {
                return resolver_->resolve(value.name);
            }
        },
        target.value);
}

auto FallbackFetcher::fetchOne(const std::string& token,
                               const FetchOptions& options) -> FetchResult {
    validateOptions(options);
    try {
        return fetchOne(target::CoordinateParser::parse(token), options);
    } catch (const CoordinateParseError& e) {
        spdlog::error("Cannot interpret target '{}': {}", token, e.what());
        FetchResult result;
        result.target = target::Target::fromName(token);
        result.status = FetchStatus::ResolutionFailed;
        result.error = e.what();
        return result;
    }
}

auto FallbackFetcher::fetchOne(const target::Target& target,
                               const FetchOptions& options) -> FetchResult {
    validateOptions(options);

    FetchResult result;
    result.target = target;

    try {
        result.coordinate = resolveTarget(target);
    } catch (const NameResolutionError& e) {
        spdlog::error("Skipping '{}': {}", target.displayName(), e.what());
        result.status = FetchStatus::ResolutionFailed;
        result.error = e.what();
        return result;
    } catch (const CoordinateParseError& e) {
        spdlog::error("Skipping '{}': {}", target.displayName(), e.what());
        result.status = FetchStatus::ResolutionFailed;
        result.error = e.what();
        return result;
    }

    const auto& coord = *result.coordinate;
    const auto candidates = catalog_->candidates(coord, options.survey);
    const bool explicitRequest = !survey::SurveyCatalog::isAuto(options.survey);

    if (candidates.empty()) {
        result.status = FetchStatus::Exhausted;
        result.error = "No survey covers dec " + std::to_string(coord.dec);
        spdlog::error("'{}': {}", target.displayName(), result.error);
        return result;
    }

    for (const auto& candidate : candidates) {
        const auto& descriptor = *candidate.descriptor;
        std::optional<survey::CutoutImage> image;
        auto attempt = trySurvey(descriptor, coord, options, image);
        const auto outcome = attempt.outcome;
        result.attempts.push_back(std::move(attempt));

        if (outcome == AttemptOutcome::Success) {
            spdlog::info("'{}' fetched from {} ({}x{})", target.displayName(),
                         descriptor.id, image->width(), image->height());
            result.status = FetchStatus::Success;
            result.surveyUsed = descriptor.id;
            result.image = std::move(image);
            return result;
        }

        if (outcome == AttemptOutcome::Blank && explicitRequest &&
            candidate.covered && candidates.size() == 1) {
            spdlog::warn("'{}': {} returned a blank image, keeping it",
                         target.displayName(), descriptor.id);
            result.status = FetchStatus::Blank;
            result.surveyUsed = descriptor.id;
            result.image = std::move(image);
            return result;
        }

        spdlog::warn("'{}': {} {}, trying next survey", target.displayName(),
                     descriptor.id, toString(outcome));
    }

    const bool allNetwork = std::all_of(
        result.attempts.begin(), result.attempts.end(),
        [](const SurveyAttempt& a) {
            return a.outcome == AttemptOutcome::NetworkError;
        });

    if (allNetwork) {
        result.status = FetchStatus::NetworkError;
        result.error = "All survey requests failed: " +
                       result.attempts.back().message;
    } else {
        result.status = FetchStatus::Exhausted;
        result.error = "No survey returned a usable image";
    }
    spdlog::error("'{}': {}", target.displayName(), result.error);
    return result;
}

auto FallbackFetcher::trySurvey(const survey::SurveyDescriptor& survey,
                                const target::ResolvedCoordinate& coord,
                                const FetchOptions& options,
                                std::optional<survey::CutoutImage>& image)
    -> SurveyAttempt {
    SurveyAttempt attempt;
    attempt.surveyId = survey.id;
    attempt.sizePx = sizeFor(survey, options);

    survey::CutoutRequest request;
    request.ra = coord.ra;
    request.dec = coord.dec;
    request.sizePx = attempt.sizePx;
    request.pixscale = options.pixscale;

    auto delay = config_.retryDelay;
    for (int i = 0; i <= config_.networkRetries; ++i) {
        ++attempt.tries;
        auto outcome = cutouts_->fetchCutout(survey, request);

        if (outcome) {
            const bool blank =
                survey::isBlankImage(outcome->pixels, config_.blankThreshold);
            attempt.outcome =
                blank ? AttemptOutcome::Blank : AttemptOutcome::Success;
            image = std::move(*outcome);
            return attempt;
        }

        const auto& error = outcome.error();
        attempt.message = error.message;
        switch (error.code) {
            case survey::CutoutError::Code::NotCovered:
                attempt.outcome = AttemptOutcome::NotCovered;
                return attempt;
            case survey::CutoutError::Code::InvalidResponse:
                attempt.outcome = AttemptOutcome::Invalid;
                return attempt;
            case survey::CutoutError::Code::NetworkError:
                attempt.outcome = AttemptOutcome::NetworkError;
                break;
        }

        if (i < config_.networkRetries) {
            spdlog::warn("{} request failed, retrying in {}ms: {}", survey.id,
                         delay.count(), error.message);
            std::this_thread::sleep_for(delay);
            delay *= 2;
        }
    }
    return attempt;
}

}  // namespace skyfetch::fetch
