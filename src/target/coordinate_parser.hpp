// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_TARGET_COORDINATE_PARSER_HPP
#define SKYFETCH_TARGET_COORDINATE_PARSER_HPP

#include <optional>
#include <string>
#include <string_view>

#include "target.hpp"

namespace skyfetch::target {

/**
 * @brief Classifies raw target tokens
 *
 * Recognized forms, tried in this order:
 * 1. Two decimal-degree numbers, space or comma separated
 *    ("150.0 2.2", "150.0, 2.2")
 * 2. Sexagesimal hour-angle RA and signed DMS Dec
 *    ("10:00:00 +02:12:00", "10h00m00s +02d12m00s", "10 00 00 +02 12 00")
 * 3. Anything else is an object name and is returned untouched (trimmed)
 *
 * Numeric-looking input that is out of range throws CoordinateParseError
 * instead of silently falling through to name resolution.
 */
class CoordinateParser {
public:
    /**
     * @brief Parse a raw token
     * @param raw Token as given by the caller
     * @return Target holding either a Coordinate or a RawName
     * @throws CoordinateParseError on empty or out-of-range numeric input
     */
    [[nodiscard]] static auto parse(std::string_view raw) -> Target;

    /**
     * @brief Parse a sexagesimal pair
     * @return (ra, dec) in degrees, or nullopt when the text is not
     *         sexagesimal at all
     * @throws CoordinateParseError when the text is sexagesimal but a field
     *         is out of range
     */
    [[nodiscard]] static auto parseSexagesimal(std::string_view text)
        -> std::optional<Coordinate>;

    /**
     * @brief Parse a pair of decimal degree numbers
     * @return (ra, dec), or nullopt when the text is not two numbers
     * @throws CoordinateParseError when both are numbers but out of range
     */
    [[nodiscard]] static auto parseDecimalPair(std::string_view text)
        -> std::optional<Coordinate>;

    /**
     * @brief Hours, minutes, seconds to degrees (x15)
     */
    [[nodiscard]] static auto hmsToDegrees(int hours, int minutes,
                                           double seconds) -> double;

    /**
     * @brief Signed degrees, arcminutes, arcseconds to degrees
     * @param negative Sign taken from the text so that "-00:30:00" works
     */
    [[nodiscard]] static auto dmsToDegrees(bool negative, int degrees,
                                           int arcmin, double arcsec)
        -> double;
};

/**
 * @brief Strip leading and trailing whitespace
 */
[[nodiscard]] auto trim(std::string_view text) -> std::string;

}  // namespace skyfetch::target

#endif  // SKYFETCH_TARGET_COORDINATE_PARSER_HPP
