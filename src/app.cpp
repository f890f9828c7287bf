// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include <charconv>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

#include "cli/cli_utils.hpp"
#include "config/skyfetch_config.hpp"
#include "exception/exception.hpp"
#include "io/catalog_reader.hpp"
#include "logging/logging.hpp"
#include "service/skyfetch_service.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;

using skyfetch::cli::EXIT_CONFIG_ERROR;
using skyfetch::cli::EXIT_OK;
using skyfetch::cli::EXIT_PARTIAL_FAILURE;

namespace {

constexpr const char* USAGE = R"(Usage: skyfetch <command> [targets...] [options]

Commands:
  fetch <target>      Fetch one cutout and write it to -o (default <label>.jpg)
  batch [targets...]  Fetch many targets, optionally from --file
  resolve <name>      Print the coordinates of an object name
  surveys             List the survey catalog

Targets are object names ("NGC 788"), decimal degrees ("150.0 2.2") or
sexagesimal positions ("10:00:00 +02:12:00").
)";

auto joinPositionals(const std::vector<std::string>& positionals)
    -> std::string {
    return fmt::format("{}", fmt::join(positionals, " "));
}

auto parseDouble(const std::string& text, const std::string& option)
    -> double {
    double value = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec == std::errc() && ptr == end) {
        return value;
    }
    THROW_INVALID_CONFIGURATION("Option --" + option +
                                " expects a number, got '" + text + "'");
}

void registerOptions(atom::utils::ArgumentParser& program) {
    using ArgType = atom::utils::ArgumentParser::ArgType;

    program.addArgument("config", ArgType::STRING, false, ""s,
                        "Path to a JSON configuration file", {"c"});
    program.addArgument("log-level", ArgType::STRING, false, ""s,
                        "Console log level (trace/debug/info/warn/error)",
                        {"l"});
    program.addArgument("survey", ArgType::STRING, false, ""s,
                        "Survey id or 'auto' for the fallback chain", {"s"});
    program.addArgument("fov", ArgType::STRING, false, ""s,
                        "Field of view in arcminutes", {"f"});
    program.addArgument("size", ArgType::INTEGER, false, 0,
                        "Cutout size in pixels (overrides the fov)");
    program.addArgument("output", ArgType::STRING, false, ""s,
                        "Output file (fetch) or directory (batch)", {"o"});
    program.addArgument("file", ArgType::STRING, false, ""s,
                        "CSV/TSV catalog of targets (batch)");
    program.addArgument("ra-col", ArgType::STRING, false, "ra"s,
                        "Catalog column holding RA");
    program.addArgument("dec-col", ArgType::STRING, false, "dec"s,
                        "Catalog column holding Dec");
    program.addArgument("name-col", ArgType::STRING, false, ""s,
                        "Catalog column holding labels");
    program.addArgument("limit", ArgType::INTEGER, false, 50,
                        "Maximum number of catalog rows", {"n"});
    program.addArgument("workers", ArgType::INTEGER, false, 0,
                        "Concurrent downloads in batch mode", {"w"});

    program.addDescription("SkyFetch - survey cutouts for astronomical targets");
    program.addEpilog(USAGE);
}

auto loadConfig(atom::utils::ArgumentParser& program)
    -> skyfetch::config::SkyFetchConfig {
    skyfetch::config::SkyFetchConfig config;

    auto configPath = program.get<std::string>("config");
    if (configPath && !configPath->empty()) {
        config = skyfetch::config::SkyFetchConfig::loadFromFile(*configPath);
    }

    // Command line values take priority over the file
    if (auto level = program.get<std::string>("log-level");
        level && !level->empty()) {
        config.loggingConfig.consoleLevel = *level;
    }
    if (auto survey = program.get<std::string>("survey");
        survey && !survey->empty()) {
        config.surveyId = *survey;
    }
    if (auto fov = program.get<std::string>("fov"); fov && !fov->empty()) {
        config.fovArcmin = parseDouble(*fov, "fov");
    }
    if (auto size = program.get<int>("size"); size && *size != 0) {
        config.sizePx = *size;
    }
    if (auto workers = program.get<int>("workers"); workers && *workers != 0) {
        if (*workers < 0) {
            THROW_INVALID_CONFIGURATION("--workers must be at least 1");
        }
        config.workerCount = static_cast<size_t>(*workers);
    }

    config.validate();
    return config;
}

auto runFetch(skyfetch::service::SkyFetchService& service,
              const std::vector<std::string>& positionals,
              atom::utils::ArgumentParser& program) -> int {
    if (positionals.empty()) {
        THROW_INVALID_CONFIGURATION("fetch needs a target");
    }

    auto result = service.fetchOne(joinPositionals(positionals));
    std::cout << skyfetch::cli::formatResultRow(0, result) << '\n';

    if (result.hasImage()) {
        fs::path output = program.get<std::string>("output").value_or(""s);
        if (output.empty()) {
            output = skyfetch::cli::sanitizeFileStem(
                         result.target.displayName()) +
                     skyfetch::cli::extensionFor(*result.image);
        }
        if (!skyfetch::cli::writeImage(result, output)) {
            return EXIT_PARTIAL_FAILURE;
        }
        std::cout << std::format("Saved {} ({}x{}) from {}\n", output.string(),
                                 result.image->width(), result.image->height(),
                                 result.surveyUsed.value_or("?"));
    }
    return result.isSuccess() ? EXIT_OK : EXIT_PARTIAL_FAILURE;
}

auto runBatch(skyfetch::service::SkyFetchService& service,
              const std::vector<std::string>& positionals,
              atom::utils::ArgumentParser& program) -> int {
    std::vector<skyfetch::target::Target> targets;

    auto file = program.get<std::string>("file");
    if (file && !file->empty()) {
        skyfetch::io::CatalogReaderOptions options;
        options.raColumn = program.get<std::string>("ra-col").value_or("ra"s);
        options.decColumn =
            program.get<std::string>("dec-col").value_or("dec"s);
        options.nameColumn =
            program.get<std::string>("name-col").value_or(""s);
        const int limit = program.get<int>("limit").value_or(50);
        options.limit = limit > 0 ? static_cast<size_t>(limit) : 0;

        auto catalog = skyfetch::io::CatalogReader(options).read(*file);
        targets = std::move(catalog.targets);
    }

    std::vector<std::string> tokens = positionals;
    if (targets.empty() && tokens.empty()) {
        THROW_INVALID_CONFIGURATION("batch needs targets or --file");
    }

    auto progress = [](size_t completed, size_t total,
                       const skyfetch::fetch::FetchResult& result) {
        spdlog::info("[{}/{}] {}: {}", completed, total,
                     result.target.displayName(),
                     skyfetch::fetch::toString(result.status));
    };

    std::vector<skyfetch::fetch::FetchResult> results;
    if (!tokens.empty()) {
        results = service.fetchMany(tokens, std::nullopt, std::nullopt,
                                    progress);
    }
    if (!targets.empty()) {
        auto fromFile = service.fetchMany(targets, std::nullopt, std::nullopt,
                                          progress);
        results.insert(results.end(), std::make_move_iterator(fromFile.begin()),
                       std::make_move_iterator(fromFile.end()));
    }

    const fs::path outdir = program.get<std::string>("output").value_or(""s);
    int exitCode = skyfetch::cli::exitCodeFor(results);
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        std::cout << skyfetch::cli::formatResultRow(i, result) << '\n';

        if (!outdir.empty() && result.hasImage()) {
            auto name = std::format(
                "{:03}_{}{}", i + 1,
                skyfetch::cli::sanitizeFileStem(result.target.displayName()),
                skyfetch::cli::extensionFor(*result.image));
            if (!skyfetch::cli::writeImage(result, outdir / name)) {
                exitCode = EXIT_PARTIAL_FAILURE;
            }
        }
    }

    const auto stats = service.cacheStats();
    spdlog::info("Name cache: {} entries, {} hits, {} misses", stats.entries,
                 stats.hits, stats.misses);
    return exitCode;
}

auto runResolve(skyfetch::service::SkyFetchService& service,
                const std::vector<std::string>& positionals) -> int {
    if (positionals.empty()) {
        THROW_INVALID_CONFIGURATION("resolve needs a name");
    }
    const auto name = joinPositionals(positionals);
    try {
        auto coord = service.resolve(name);
        std::cout << std::format("{}: ra={:.6f} dec={:+.6f}\n", name, coord.ra,
                                 coord.dec);
        return EXIT_OK;
    } catch (const skyfetch::NameResolutionError& e) {
        std::cerr << e.what() << '\n';
        return EXIT_PARTIAL_FAILURE;
    }
}

auto runSurveys(const skyfetch::service::SkyFetchService& service) -> int {
    std::cout << std::format("{:<14} {:>8}  {:<16} {:>9}  {}\n", "id",
                             "priority", "dec range", "pixscale", "bands");
    for (const auto& d : service.catalog().descriptors()) {
        std::cout << std::format(
            "{:<14} {:>8}  [{:+5.0f}, {:+5.0f}]  {:>9.3f}  {}\n", d.id,
            d.priority, d.coverage.min, d.coverage.max, d.defaultPixscale,
            fmt::format("{}", fmt::join(d.bands, ",")));
    }
    return EXIT_OK;
}

}  // namespace

int main(int argc, char *argv[]) {
    std::vector<std::string> args(argv, argv + argc);
    auto split = skyfetch::cli::splitArguments(args);

    if (split.command.empty() || split.command == "help") {
        std::cout << USAGE;
        return split.command.empty() && argc < 2 ? EXIT_CONFIG_ERROR : EXIT_OK;
    }

    atom::utils::ArgumentParser program("skyfetch"s);
    registerOptions(program);

    int exitCode = EXIT_OK;
    try {
        program.parse(static_cast<int>(split.options.size()), split.options);

        auto config = loadConfig(program);
        skyfetch::logging::initLogging(config.loggingConfig);

        skyfetch::service::SkyFetchService service(config);

        if (split.command == "fetch") {
            exitCode = runFetch(service, split.positionals, program);
        } else if (split.command == "batch") {
            exitCode = runBatch(service, split.positionals, program);
        } else if (split.command == "resolve") {
            exitCode = runResolve(service, split.positionals);
        } else if (split.command == "surveys") {
            exitCode = runSurveys(service);
        } else {
            std::cerr << "Unknown command: " << split.command << "\n\n"
                      << USAGE;
            exitCode = EXIT_CONFIG_ERROR;
        }
    } catch (const skyfetch::InvalidConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        exitCode = EXIT_CONFIG_ERROR;
    } catch (const skyfetch::CatalogReadError& e) {
        spdlog::error("Catalog error: {}", e.what());
        exitCode = EXIT_CONFIG_ERROR;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        exitCode = EXIT_CONFIG_ERROR;
    }

    skyfetch::logging::shutdownLogging();
    return exitCode;
}
