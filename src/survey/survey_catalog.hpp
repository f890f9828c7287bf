// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_SURVEY_SURVEY_CATALOG_HPP
#define SKYFETCH_SURVEY_SURVEY_CATALOG_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "target/target.hpp"

namespace skyfetch::survey {

using json = nlohmann::json;

/**
 * @brief Approximate declination footprint of a survey
 */
struct DecRange {
    double min = -90.0;
    double max = 90.0;

    [[nodiscard]] auto contains(double dec) const noexcept -> bool {
        return dec >= min && dec <= max;
    }
};

/**
 * @brief Static description of one image survey
 *
 * The endpoint template may use the placeholders {ra}, {dec}, {size},
 * {pixscale} and {layer}.
 */
struct SurveyDescriptor {
    std::string id;                  ///< Catalog identifier, e.g. "ls-dr10"
    std::vector<std::string> bands;  ///< Photometric bands (informational)
    DecRange coverage;               ///< Sky coverage predicate over dec
    int priority = 0;                ///< Higher is tried first
    std::string endpointTemplate;    ///< Cutout URL template
    std::string layer;               ///< Layer passed to the service
    double defaultPixscale = 0.262;  ///< arcsec / pixel
    int defaultSize = 256;           ///< Pixels, used when no fov is given
    int maxSize = 3000;              ///< Server side size limit in pixels

    [[nodiscard]] auto covers(double dec) const noexcept -> bool {
        return coverage.contains(dec);
    }

    /**
     * @brief Render the endpoint template for one request
     * @throws InvalidConfigurationError if the template is malformed
     */
    [[nodiscard]] auto cutoutUrl(double ra, double dec, int size,
                                 double pixscale) const -> std::string;

    /**
     * @brief Pixel size covering fov arcminutes, clamped to [1, maxSize]
     * @param pixscale arcsec / pixel, 0 for the survey default
     */
    [[nodiscard]] auto pixelsForFov(double fovArcmin, double pixscale = 0.0) const
        -> int;

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> SurveyDescriptor;
};

/**
 * @brief One entry of a fallback attempt order
 */
struct SurveyCandidate {
    const SurveyDescriptor* descriptor = nullptr;
    bool covered = true;  ///< False only for an explicit, uncovered request
};

/**
 * @brief Immutable, priority ordered registry of surveys
 *
 * Built once at startup and shared read-only between fetch workers.
 */
class SurveyCatalog {
public:
    /// Pseudo survey id selecting the full fallback chain
    static constexpr std::string_view AUTO = "auto";

    /**
     * @brief Build a catalog, ordering by descending priority
     *
     * Equal priorities keep their declaration order.
     *
     * @throws InvalidConfigurationError on an empty list, duplicate ids,
     *         inverted dec ranges or malformed endpoint templates
     */
    explicit SurveyCatalog(std::vector<SurveyDescriptor> descriptors);

    /**
     * @brief Catalog with the built-in surveys
     */
    [[nodiscard]] static auto createDefault() -> SurveyCatalog;

    /**
     * @brief Built-in descriptors: ls-dr10, ls-dr9, panstarrs, sdss,
     * des-dr1, unwise-neo7, galex
     */
    [[nodiscard]] static auto defaultDescriptors()
        -> std::vector<SurveyDescriptor>;

    /**
     * @brief True for nullopt, empty or "auto" (case-insensitive)
     */
    [[nodiscard]] static auto isAuto(const std::optional<std::string>& survey)
        -> bool;

    /**
     * @brief Case-insensitive lookup
     */
    [[nodiscard]] auto find(std::string_view id) const
        -> const SurveyDescriptor*;

    /**
     * @throws UnknownSurveyError if the id is not in the catalog
     */
    [[nodiscard]] auto at(std::string_view id) const -> const SurveyDescriptor&;

    /**
     * @brief Throw UnknownSurveyError unless the request is auto or known
     */
    void validateRequest(const std::optional<std::string>& requested) const;

    /**
     * @brief Fallback attempt order for a position
     *
     * - auto: every covering survey, by priority
     * - explicit and covering: exactly that survey
     * - explicit but not covering: that survey (flagged uncovered), then
     *   every other covering survey by priority
     *
     * @throws UnknownSurveyError for an unknown explicit id
     */
    [[nodiscard]] auto candidates(const target::ResolvedCoordinate& coord,
                                  const std::optional<std::string>& requested =
                                      std::nullopt) const
        -> std::vector<SurveyCandidate>;

    [[nodiscard]] auto descriptors() const noexcept
        -> const std::vector<SurveyDescriptor>& {
        return descriptors_;
    }

    [[nodiscard]] auto ids() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const noexcept -> size_t {
        return descriptors_.size();
    }

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Build a catalog from a JSON array of descriptors
     */
    [[nodiscard]] static auto fromJson(const json& j) -> SurveyCatalog;

private:
    std::vector<SurveyDescriptor> descriptors_;
};

using SurveyCatalogPtr = std::shared_ptr<const SurveyCatalog>;

}  // namespace skyfetch::survey

#endif  // SKYFETCH_SURVEY_SURVEY_CATALOG_HPP
