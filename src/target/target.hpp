// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_TARGET_TARGET_HPP
#define SKYFETCH_TARGET_TARGET_HPP

#include <format>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace skyfetch::target {

inline constexpr double RA_MIN_DEG = 0.0;
inline constexpr double RA_MAX_DEG = 360.0;  ///< Exclusive
inline constexpr double DEC_MIN_DEG = -90.0;
inline constexpr double DEC_MAX_DEG = 90.0;

/**
 * @brief Check that an equatorial position lies in ra [0,360), dec [-90,90]
 */
[[nodiscard]] inline auto isValidRaDec(double ra, double dec) noexcept
    -> bool {
    return ra >= RA_MIN_DEG && ra < RA_MAX_DEG && dec >= DEC_MIN_DEG &&
           dec <= DEC_MAX_DEG;
}

/**
 * @brief Equatorial position in decimal degrees (ICRS)
 *
 * Produced by the coordinate parser or the name resolver and never modified
 * afterwards.
 */
struct ResolvedCoordinate {
    double ra = 0.0;   ///< Right ascension in degrees, [0, 360)
    double dec = 0.0;  ///< Declination in degrees, [-90, 90]

    bool operator==(const ResolvedCoordinate&) const = default;
};

/**
 * @brief Object name that still has to go through name resolution
 */
struct RawName {
    std::string name;

    bool operator==(const RawName&) const = default;
};

/**
 * @brief Position given directly by the caller
 */
struct Coordinate {
    double ra = 0.0;
    double dec = 0.0;

    bool operator==(const Coordinate&) const = default;
};

using TargetValue = std::variant<RawName, Coordinate>;

/**
 * @brief A single thing to fetch an image for
 *
 * The original input token is kept so that errors and output rows can be
 * reported in the caller's own terms. An optional label comes from catalog
 * ingestion (e.g. a name column next to ra/dec columns).
 */
struct Target {
    std::string token;
    TargetValue value;
    std::optional<std::string> label;

    [[nodiscard]] auto isName() const noexcept -> bool {
        return std::holds_alternative<RawName>(value);
    }

    [[nodiscard]] auto isCoordinate() const noexcept -> bool {
        return std::holds_alternative<Coordinate>(value);
    }

    /**
     * @brief Label if present, otherwise the original token
     */
    [[nodiscard]] auto displayName() const -> const std::string& {
        return label ? *label : token;
    }

    [[nodiscard]] static auto fromName(std::string name) -> Target {
        Target t;
        t.token = name;
        t.value = RawName{std::move(name)};
        return t;
    }

    /**
     * @brief Build a coordinate target; an empty token becomes "(ra, dec)"
     */
    [[nodiscard]] static auto fromCoordinate(double ra, double dec,
                                             std::string token = {})
        -> Target {
        Target t;
        t.token = token.empty() ? std::format("({:.4f}, {:.4f})", ra, dec)
                                : std::move(token);
        t.value = Coordinate{ra, dec};
        return t;
    }
};

}  // namespace skyfetch::target

#endif  // SKYFETCH_TARGET_TARGET_HPP
