// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "survey_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_set>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace skyfetch::survey {

namespace {

constexpr std::string_view LEGACY_SURVEY_TEMPLATE =
    "https://www.legacysurvey.org/viewer/cutout.jpg"
    "?ra={ra}&dec={dec}&size={size}&pixscale={pixscale}&layer={layer}";

constexpr std::string_view PANSTARRS_TEMPLATE =
    "https://ps1images.stsci.edu/cgi-bin/fitscut.cgi"
    "?ra={ra}&dec={dec}&size={size}&format=jpg&output_size={size}"
    "&autoscale=99.5&filter=color";

auto toLower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

auto makeDescriptor(std::string id, std::vector<std::string> bands,
                    DecRange coverage, int priority,
                    std::string_view endpoint, double pixscale,
                    int maxSize = 3000) -> SurveyDescriptor {
    SurveyDescriptor d;
    d.layer = id;
    d.id = std::move(id);
    d.bands = std::move(bands);
    d.coverage = coverage;
    d.priority = priority;
    d.endpointTemplate = std::string(endpoint);
    d.defaultPixscale = pixscale;
    d.defaultSize = 256;
    d.maxSize = maxSize;
    return d;
}

}  // namespace

// ============================================================================
// SurveyDescriptor
// ============================================================================

auto SurveyDescriptor::cutoutUrl(double ra, double dec, int size,
                                 double pixscale) const -> std::string {
    try {
        return fmt::format(fmt::runtime(endpointTemplate), fmt::arg("ra", ra),
                           fmt::arg("dec", dec), fmt::arg("size", size),
                           fmt::arg("pixscale", pixscale),
                           fmt::arg("layer", layer.empty() ? id : layer));
    } catch (const fmt::format_error& e) {
        THROW_INVALID_CONFIGURATION("Malformed endpoint template for survey '" +
                                    id + "': " + e.what());
    }
}

auto SurveyDescriptor::pixelsForFov(double fovArcmin, double pixscale) const
    -> int {
    const double scale = pixscale > 0.0 ? pixscale : defaultPixscale;
    if (!std::isfinite(fovArcmin) || !std::isfinite(scale) ||
        fovArcmin <= 0.0 || scale <= 0.0) {
        return std::min(defaultSize, maxSize);
    }
    const double pixels = std::floor(fovArcmin * 60.0 / scale);
    return static_cast<int>(
        std::clamp(pixels, 1.0, static_cast<double>(maxSize)));
}

auto SurveyDescriptor::toJson() const -> json {
    return {{"id", id},
            {"bands", bands},
            {"decMin", coverage.min},
            {"decMax", coverage.max},
            {"priority", priority},
            {"endpoint", endpointTemplate},
            {"layer", layer},
            {"pixscale", defaultPixscale},
            {"defaultSize", defaultSize},
            {"maxSize", maxSize}};
}

auto SurveyDescriptor::fromJson(const json& j) -> SurveyDescriptor {
    SurveyDescriptor d;
    try {
        d.id = j.at("id").get<std::string>();
        d.bands = j.value("bands", d.bands);
        d.coverage.min = j.value("decMin", d.coverage.min);
        d.coverage.max = j.value("decMax", d.coverage.max);
        d.priority = j.value("priority", d.priority);
        d.endpointTemplate =
            j.value("endpoint", std::string(LEGACY_SURVEY_TEMPLATE));
        d.layer = j.value("layer", d.id);
        d.defaultPixscale = j.value("pixscale", d.defaultPixscale);
        d.defaultSize = j.value("defaultSize", d.defaultSize);
        d.maxSize = j.value("maxSize", d.maxSize);
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIGURATION(std::string("Invalid survey entry: ") +
                                    e.what());
    }
    return d;
}

// ============================================================================
// SurveyCatalog
// ============================================================================

SurveyCatalog::SurveyCatalog(std::vector<SurveyDescriptor> descriptors)
    : descriptors_(std::move(descriptors)) {
    if (descriptors_.empty()) {
        THROW_INVALID_CONFIGURATION("Survey catalog cannot be empty");
    }

    std::unordered_set<std::string> seen;
    for (auto& d : descriptors_) {
        if (d.id.empty()) {
            THROW_INVALID_CONFIGURATION("Survey id cannot be empty");
        }
        if (toLower(d.id) == AUTO) {
            THROW_INVALID_CONFIGURATION("'auto' is reserved and cannot be a "
                                        "survey id");
        }
        if (!seen.insert(toLower(d.id)).second) {
            THROW_INVALID_CONFIGURATION("Duplicate survey id: " + d.id);
        }
        if (d.coverage.min > d.coverage.max) {
            THROW_INVALID_CONFIGURATION("Inverted declination range for survey " +
                                        d.id);
        }
        if (d.defaultPixscale <= 0.0 || d.defaultSize <= 0 || d.maxSize <= 0) {
            THROW_INVALID_CONFIGURATION("Invalid size settings for survey " +
                                        d.id);
        }
        if (d.layer.empty()) {
            d.layer = d.id;
        }
        // A template that fails to render is rejected here
        [[maybe_unused]] auto sample = d.cutoutUrl(0.0, 0.0, 1, 1.0);
    }

    std::stable_sort(descriptors_.begin(), descriptors_.end(),
                     [](const SurveyDescriptor& a, const SurveyDescriptor& b) {
                         return a.priority > b.priority;
                     });

    spdlog::debug("Survey catalog built with {} surveys", descriptors_.size());
}

auto SurveyCatalog::defaultDescriptors() -> std::vector<SurveyDescriptor> {
    return {
        makeDescriptor("ls-dr10", {"g", "r", "z"}, {-70.0, 90.0}, 100,
                       LEGACY_SURVEY_TEMPLATE, 0.262),
        makeDescriptor("ls-dr9", {"g", "r", "z"}, {-70.0, 90.0}, 90,
                       LEGACY_SURVEY_TEMPLATE, 0.262),
        makeDescriptor("panstarrs", {"g", "r", "i", "z", "y"}, {-30.0, 90.0},
                       80, PANSTARRS_TEMPLATE, 0.25, 1200),
        makeDescriptor("sdss", {"u", "g", "r", "i", "z"}, {-20.0, 70.0}, 70,
                       LEGACY_SURVEY_TEMPLATE, 0.396),
        makeDescriptor("des-dr1", {"g", "r", "i", "z", "Y"}, {-65.0, 5.0}, 60,
                       LEGACY_SURVEY_TEMPLATE, 0.262),
        makeDescriptor("unwise-neo7", {"W1", "W2"}, {-90.0, 90.0}, 20,
                       LEGACY_SURVEY_TEMPLATE, 2.75),
        makeDescriptor("galex", {"FUV", "NUV"}, {-90.0, 90.0}, 10,
                       LEGACY_SURVEY_TEMPLATE, 1.5),
    };
}

auto SurveyCatalog::createDefault() -> SurveyCatalog {
    return SurveyCatalog(defaultDescriptors());
}

auto SurveyCatalog::isAuto(const std::optional<std::string>& survey) -> bool {
    return !survey.has_value() || survey->empty() || toLower(*survey) == AUTO;
}

auto SurveyCatalog::find(std::string_view id) const
    -> const SurveyDescriptor* {
    const auto wanted = toLower(id);
    auto it = std::find_if(
        descriptors_.begin(), descriptors_.end(),
        [&wanted](const SurveyDescriptor& d) { return toLower(d.id) == wanted; });
    return it == descriptors_.end() ? nullptr : &*it;
}

auto SurveyCatalog::at(std::string_view id) const -> const SurveyDescriptor& {
    if (const auto* d = find(id)) {
        return *d;
    }
    THROW_UNKNOWN_SURVEY("Unknown survey '" + std::string(id) +
                         "'. Available: " + fmt::format("{}", fmt::join(ids(), ", ")));
}

void SurveyCatalog::validateRequest(
    const std::optional<std::string>& requested) const {
    if (!isAuto(requested)) {
        [[maybe_unused]] const auto& d = at(*requested);
    }
}

auto SurveyCatalog::candidates(const target::ResolvedCoordinate& coord,
                               const std::optional<std::string>& requested) const
    -> std::vector<SurveyCandidate> {
    std::vector<SurveyCandidate> result;

    const SurveyDescriptor* explicitSurvey = nullptr;
    if (!isAuto(requested)) {
        explicitSurvey = &at(*requested);
        if (explicitSurvey->covers(coord.dec)) {
            result.push_back({explicitSurvey, true});
            return result;
        }
        spdlog::warn("Survey {} does not cover dec {:.4f}, trying it anyway "
                     "before falling back",
                     explicitSurvey->id, coord.dec);
        result.push_back({explicitSurvey, false});
    }

    for (const auto& d : descriptors_) {
        if (&d == explicitSurvey) {
            continue;
        }
        if (d.covers(coord.dec)) {
            result.push_back({&d, true});
        }
    }
    return result;
}

auto SurveyCatalog::ids() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(descriptors_.size());
    for (const auto& d : descriptors_) {
        out.push_back(d.id);
    }
    return out;
}

auto SurveyCatalog::toJson() const -> json {
    json arr = json::array();
    for (const auto& d : descriptors_) {
        arr.push_back(d.toJson());
    }
    return arr;
}

auto SurveyCatalog::fromJson(const json& j) -> SurveyCatalog {
    if (!j.is_array()) {
        THROW_INVALID_CONFIGURATION("Survey list must be a JSON array");
    }
    std::vector<SurveyDescriptor> descriptors;
    for (const auto& entry : j) {
        descriptors.push_back(SurveyDescriptor::fromJson(entry));
    }
    return SurveyCatalog(std::move(descriptors));
}

}  // namespace skyfetch::survey
