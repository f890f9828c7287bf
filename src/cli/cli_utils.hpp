// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_CLI_CLI_UTILS_HPP
#define SKYFETCH_CLI_CLI_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "fetch/fetch_result.hpp"

namespace skyfetch::cli {

/// Process exit codes
inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_CONFIG_ERROR = 1;
inline constexpr int EXIT_PARTIAL_FAILURE = 2;

/**
 * @brief Command line split into command, positional targets and options
 */
struct SplitArguments {
    std::string command;
    std::vector<std::string> positionals;
    std::vector<std::string> options;  ///< Program name first, ready to parse
};

/**
 * @brief Separate `skyfetch <command> [targets...] [options...]`
 *
 * Positionals run until the first option token. A token such as "-23.5"
 * is a negative number, not an option.
 */
[[nodiscard]] auto splitArguments(const std::vector<std::string>& argv)
    -> SplitArguments;

/**
 * @brief True for "-x" / "--xyz" tokens, false for negative numbers
 */
[[nodiscard]] auto isOptionToken(std::string_view token) noexcept -> bool;

/**
 * @brief Filesystem safe stem derived from a target label
 */
[[nodiscard]] auto sanitizeFileStem(std::string_view label) -> std::string;

/**
 * @brief ".png" for PNG payloads, ".jpg" otherwise
 */
[[nodiscard]] auto extensionFor(const survey::CutoutImage& image)
    -> std::string;

/**
 * @brief Write the encoded payload of a result to disk
 * @return false if the result has no image or the file cannot be written
 */
[[nodiscard]] auto writeImage(const fetch::FetchResult& result,
                              const std::filesystem::path& path) -> bool;

/**
 * @brief One aligned status line per target
 */
[[nodiscard]] auto formatResultRow(size_t index,
                                   const fetch::FetchResult& result)
    -> std::string;

/**
 * @brief Exit code for a finished batch: 0 when every target succeeded
 */
[[nodiscard]] auto exitCodeFor(const std::vector<fetch::FetchResult>& results)
    -> int;

}  // namespace skyfetch::cli

#endif  // SKYFETCH_CLI_CLI_UTILS_HPP
