// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "catalog_reader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "target/coordinate_parser.hpp"

namespace skyfetch::io {

namespace {

auto toLower(std::string text) -> std::string {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

auto findColumn(const std::vector<std::string>& header,
                const std::string& name) -> std::optional<size_t> {
    const auto wanted = toLower(target::trim(name));
    for (size_t i = 0; i < header.size(); ++i) {
        if (toLower(target::trim(header[i])) == wanted) {
            return i;
        }
    }
    return std::nullopt;
}

auto stripLineEnd(std::string& line) -> void {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

}  // namespace

CatalogReader::CatalogReader(CatalogReaderOptions options)
    : options_(std::move(options)) {}

auto CatalogReader::parseLine(const std::string& line, char delimiter,
                              char quotechar) -> std::vector<std::string> {
    std::vector<std::string> fields;
    std::string field;
    bool inQuotes = false;

    for (size_t i = 0; i < line.length(); ++i) {
        char c = line[i];

        if (c == quotechar) {
            if (inQuotes && i + 1 < line.length() && line[i + 1] == quotechar) {
                field += quotechar;
                ++i;
            } else {
                inQuotes = !inQuotes;
            }
            continue;
        }

        if (c == delimiter && !inQuotes) {
            fields.push_back(field);
            field.clear();
            continue;
        }

        field += c;
    }
    fields.push_back(field);
    return fields;
}

auto CatalogReader::detectDelimiter(const std::filesystem::path& path,
                                    const std::string& headerLine) -> char {
    const auto ext = toLower(path.extension().string());
    if (ext == ".fits" || ext == ".fit" || ext == ".fz") {
        THROW_CATALOG_READ_ERROR("FITS tables are not supported: " +
                                 path.string() + " (export to CSV or TSV)");
    }
    if (ext == ".tsv" || ext == ".tab") {
        return '\t';
    }
    if (ext == ".csv") {
        return ',';
    }
    const bool hasTab = headerLine.find('\t') != std::string::npos;
    const bool hasComma = headerLine.find(',') != std::string::npos;
    return hasTab && !hasComma ? '\t' : ',';
}

auto CatalogReader::read(const std::filesystem::path& path) const
    -> CatalogReadResult {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        THROW_CATALOG_READ_ERROR("Failed to open catalog: " + path.string());
    }

    std::string header;
    if (!std::getline(file, header)) {
        THROW_CATALOG_READ_ERROR("Empty catalog file: " + path.string());
    }

    const char delimiter =
        options_.delimiter.value_or(detectDelimiter(path, header));

    file.clear();
    file.seekg(0);
    auto result = read(file, delimiter);
    spdlog::info("Read {} targets from {} ({} rows skipped)",
                 result.targets.size(), path.string(), result.skippedRows);
    return result;
}

auto CatalogReader::read(std::istream& input, char delimiter) const
    -> CatalogReadResult {
    std::string line;
    if (!std::getline(input, line)) {
        THROW_CATALOG_READ_ERROR("Catalog has no header line");
    }
    stripLineEnd(line);

    const auto header = parseLine(line, delimiter, options_.quotechar);
    const auto raIdx = findColumn(header, options_.raColumn);
    const auto decIdx = findColumn(header, options_.decColumn);
    if (!raIdx || !decIdx) {
        THROW_CATALOG_READ_ERROR("Catalog header lacks columns '" +
                                 options_.raColumn + "' and/or '" +
                                 options_.decColumn + "'");
    }

    std::optional<size_t> nameIdx;
    if (!options_.nameColumn.empty()) {
        nameIdx = findColumn(header, options_.nameColumn);
        if (!nameIdx) {
            spdlog::warn("Name column '{}' not found, labelling by position",
                         options_.nameColumn);
        }
    }

    CatalogReadResult result;
    size_t lineNum = 1;
    while (std::getline(input, line)) {
        ++lineNum;
        stripLineEnd(line);
        if (target::trim(line).empty()) {
            continue;
        }
        if (options_.limit > 0 && result.targets.size() >= options_.limit) {
            break;
        }

        auto fields = parseLine(line, delimiter, options_.quotechar);
        fields.resize(std::max(fields.size(), header.size()));

        const auto raText = target::trim(fields[*raIdx]);
        const auto decText = target::trim(fields[*decIdx]);
        const auto joined = raText + " " + decText;

        std::optional<target::Coordinate> coord;
        std::string reason = "invalid position '" + joined + "'";
        try {
            coord = target::CoordinateParser::parseDecimalPair(joined);
            if (!coord) {
                coord = target::CoordinateParser::parseSexagesimal(joined);
            }
        } catch (const CoordinateParseError& e) {
            reason = e.what();
        }
        if (!coord) {
            ++result.skippedRows;
            result.warnings.push_back("line " + std::to_string(lineNum) +
                                      ": " + reason);
            spdlog::warn("Skipping catalog line {}: {}", lineNum, reason);
            continue;
        }

        auto t = target::Target::fromCoordinate(coord->ra, coord->dec);
        if (nameIdx) {
            auto label = target::trim(fields[*nameIdx]);
            if (!label.empty()) {
                t.label = std::move(label);
            }
        }
        result.targets.push_back(std::move(t));
    }
    return result;
}

}  // namespace skyfetch::io
