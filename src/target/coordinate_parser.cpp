// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "coordinate_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace skyfetch::target {

namespace {

constexpr double HOURS_TO_DEGREES = 15.0;
constexpr double MINUTES_PER_UNIT = 60.0;
constexpr double SECONDS_PER_UNIT = 3600.0;

/**
 * @brief Parse a whole token as a double, accepting a leading '+'
 */
auto parseNumber(std::string_view token) -> std::optional<double> {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    if (token.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const char* begin = token.data();
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

auto splitWhitespace(const std::string& text) -> std::vector<std::string> {
    std::istringstream iss(text);
    std::vector<std::string> parts;
    std::string part;
    while (iss >> part) {
        parts.push_back(part);
    }
    return parts;
}

auto commasToSpaces(std::string_view text) -> std::string {
    std::string out(text);
    std::replace(out.begin(), out.end(), ',', ' ');
    return out;
}

// RA: HH:MM:SS[.s] | HHhMMmSS[.s]s | HH MM SS[.s]
// Dec: [+-]DD:MM:SS[.s] | [+-]DDdMMmSS[.s]s | [+-]DD MM SS[.s]
const std::regex& sexagesimalPattern() {
    static const std::regex pattern(
        R"(^(\d{1,2})(?:\s*[:h]\s*|\s+)(\d{1,2})(?:\s*[:m]\s*|\s+)(\d{1,2}(?:\.\d*)?)\s*s?)"
        R"(\s+([+-]?)\s*(\d{1,2})(?:\s*[:d]\s*|\s+)(\d{1,2})(?:\s*[:m']\s*|\s+)(\d{1,2}(?:\.\d*)?)\s*(?:s|"|'')?$)",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

}  // namespace

auto trim(std::string_view text) -> std::string {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto first = std::find_if_not(text.begin(), text.end(), isSpace);
    auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

auto CoordinateParser::hmsToDegrees(int hours, int minutes, double seconds)
    -> double {
    return (hours + minutes / MINUTES_PER_UNIT + seconds / SECONDS_PER_UNIT) *
           HOURS_TO_DEGREES;
}

auto CoordinateParser::dmsToDegrees(bool negative, int degrees, int arcmin,
                                    double arcsec) -> double {
    double value =
        degrees + arcmin / MINUTES_PER_UNIT + arcsec / SECONDS_PER_UNIT;
    return negative ? -value : value;
}

auto CoordinateParser::parseDecimalPair(std::string_view text)
    -> std::optional<Coordinate> {
    auto parts = splitWhitespace(commasToSpaces(text));
    if (parts.size() != 2) {
        return std::nullopt;
    }

    auto ra = parseNumber(parts[0]);
    auto dec = parseNumber(parts[1]);
    if (!ra || !dec) {
        return std::nullopt;
    }

    if (!isValidRaDec(*ra, *dec)) {
        THROW_COORDINATE_PARSE_ERROR(
            "Coordinates out of range (ra must be in [0, 360), dec in "
            "[-90, 90]): " +
            std::string(text));
    }
    return Coordinate{*ra, *dec};
}

auto CoordinateParser::parseSexagesimal(std::string_view text)
    -> std::optional<Coordinate> {
    const std::string normalized = trim(commasToSpaces(text));
    std::smatch match;
    if (!std::regex_match(normalized, match, sexagesimalPattern())) {
        return std::nullopt;
    }

    const int hours = std::stoi(match[1].str());
    const int raMinutes = std::stoi(match[2].str());
    const double raSeconds = std::stod(match[3].str());
    const bool negative = match[4].str() == "-";
    const int degrees = std::stoi(match[5].str());
    const int decMinutes = std::stoi(match[6].str());
    const double decSeconds = std::stod(match[7].str());

    if (hours >= 24 || raMinutes >= 60 || raSeconds >= 60.0) {
        THROW_COORDINATE_PARSE_ERROR("Right ascension out of range: " +
                                     normalized);
    }
    if (degrees > 90 || decMinutes >= 60 || decSeconds >= 60.0) {
        THROW_COORDINATE_PARSE_ERROR("Declination out of range: " +
                                     normalized);
    }

    const double ra = hmsToDegrees(hours, raMinutes, raSeconds);
    const double dec = dmsToDegrees(negative, degrees, decMinutes, decSeconds);
    if (!isValidRaDec(ra, dec)) {
        THROW_COORDINATE_PARSE_ERROR("Coordinates out of range: " +
                                     normalized);
    }
    return Coordinate{ra, dec};
}

auto CoordinateParser::parse(std::string_view raw) -> Target {
    std::string text = trim(raw);
    if (text.empty()) {
        THROW_COORDINATE_PARSE_ERROR("Empty target string");
    }

    Target result;
    result.token = std::string(raw);

    if (auto coord = parseDecimalPair(text)) {
        spdlog::debug("Parsed '{}' as decimal degrees ({}, {})", text,
                      coord->ra, coord->dec);
        result.value = *coord;
        return result;
    }

    if (auto coord = parseSexagesimal(text)) {
        spdlog::debug("Parsed '{}' as sexagesimal ({:.6f}, {:.6f})", text,
                      coord->ra, coord->dec);
        result.value = *coord;
        return result;
    }

    result.value = RawName{std::move(text)};
    return result;
}

}  // namespace skyfetch::target
