// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "cli_utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>

#include <spdlog/spdlog.h>

namespace skyfetch::cli {

auto isOptionToken(std::string_view token) noexcept -> bool {
    if (token.size() < 2 || token.front() != '-') {
        return false;
    }
    const unsigned char next = token[1];
    return !(std::isdigit(next) || next == '.');
}

auto splitArguments(const std::vector<std::string>& argv) -> SplitArguments {
    SplitArguments split;
    split.options.push_back(argv.empty() ? std::string("skyfetch") : argv[0]);
    if (argv.size() < 2) {
        return split;
    }

    size_t i = 1;
    if (!isOptionToken(argv[1])) {
        split.command = argv[1];
        i = 2;
    }

    for (; i < argv.size() && !isOptionToken(argv[i]); ++i) {
        split.positionals.push_back(argv[i]);
    }
    for (; i < argv.size(); ++i) {
        split.options.push_back(argv[i]);
    }
    return split;
}

auto sanitizeFileStem(std::string_view label) -> std::string {
    std::string stem;
    stem.reserve(label.size());
    for (unsigned char c : label) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '+') {
            stem += static_cast<char>(c);
        } else if (!stem.empty() && stem.back() != '_') {
            stem += '_';
        }
    }
    while (!stem.empty() && (stem.back() == '_' || stem.back() == '.')) {
        stem.pop_back();
    }
    return stem.empty() ? std::string("target") : stem;
}

auto extensionFor(const survey::CutoutImage& image) -> std::string {
    if (image.contentType.find("png") != std::string::npos) {
        return ".png";
    }
    return ".jpg";
}

auto writeImage(const fetch::FetchResult& result,
                const std::filesystem::path& path) -> bool {
    if (!result.hasImage() || result.image->encoded.empty()) {
        return false;
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create {}: {}", path.parent_path().string(),
                          ec.message());
            return false;
        }
    }

    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        spdlog::error("Cannot write {}", path.string());
        return false;
    }
    const auto& bytes = result.image->encoded;
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(file);
}

auto formatResultRow(size_t index, const fetch::FetchResult& result)
    -> std::string {
    std::string position = "-";
    if (result.coordinate) {
        position = std::format("{:10.5f} {:+10.5f}", result.coordinate->ra,
                               result.coordinate->dec);
    }
    return std::format("{:>4}  {:<28} {:<22} {:<18} {:<12} {}", index + 1,
                       result.target.displayName(), position,
                       fetch::toString(result.status),
                       result.surveyUsed.value_or("-"), result.error);
}

auto exitCodeFor(const std::vector<fetch::FetchResult>& results) -> int {
    const bool allOk =
        std::all_of(results.begin(), results.end(),
                    [](const fetch::FetchResult& r) { return r.isSuccess(); });
    return allOk ? EXIT_OK : EXIT_PARTIAL_FAILURE;
}

}  // namespace skyfetch::cli
