// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_IO_CATALOG_READER_HPP
#define SKYFETCH_IO_CATALOG_READER_HPP

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "target/target.hpp"

namespace skyfetch::io {

/**
 * @brief Column mapping and limits for catalog ingestion
 */
struct CatalogReaderOptions {
    std::string raColumn = "ra";    ///< Matched case-insensitively
    std::string decColumn = "dec";
    std::string nameColumn;         ///< Optional label column
    size_t limit = 0;               ///< Max targets, 0 for all
    std::optional<char> delimiter;  ///< Detected from the file when unset
    char quotechar = '"';
};

/**
 * @brief Targets read from a catalog plus the rows that were dropped
 */
struct CatalogReadResult {
    std::vector<target::Target> targets;
    size_t skippedRows = 0;
    std::vector<std::string> warnings;  ///< One entry per skipped row
};

/**
 * @brief Reads CSV / TSV catalogs of positions into coordinate targets
 *
 * The first line is the header. Rows whose ra/dec cells are not a valid
 * position (decimal degrees or sexagesimal) are skipped with a warning;
 * a missing file, missing header or missing ra/dec column is an error.
 */
class CatalogReader {
public:
    explicit CatalogReader(CatalogReaderOptions options = {});

    /**
     * @throws CatalogReadError
     */
    [[nodiscard]] auto read(const std::filesystem::path& path) const
        -> CatalogReadResult;

    /**
     * @throws CatalogReadError
     */
    [[nodiscard]] auto read(std::istream& input, char delimiter) const
        -> CatalogReadResult;

    /**
     * @brief Split one record, honouring quotes and doubled quotes
     */
    [[nodiscard]] static auto parseLine(const std::string& line, char delimiter,
                                        char quotechar = '"')
        -> std::vector<std::string>;

    /**
     * @brief Tab for .tsv, comma for .csv, otherwise whichever the header
     * line uses
     * @throws CatalogReadError for unsupported formats such as FITS
     */
    [[nodiscard]] static auto detectDelimiter(
        const std::filesystem::path& path, const std::string& headerLine)
        -> char;

    [[nodiscard]] auto options() const noexcept
        -> const CatalogReaderOptions& {
        return options_;
    }

private:
    CatalogReaderOptions options_;
};

}  // namespace skyfetch::io

#endif  // SKYFETCH_IO_CATALOG_READER_HPP
