// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "batch_executor.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace skyfetch::fetch {

BatchExecutor::BatchExecutor(std::shared_ptr<FallbackFetcher> fetcher,
                             size_t workerCount)
    : fetcher_(std::move(fetcher)), workerCount_(workerCount) {
    if (!fetcher_) {
        throw std::invalid_argument("Fallback fetcher cannot be null");
    }
    if (workerCount_ == 0) {
        THROW_INVALID_CONFIGURATION("Worker count must be at least 1");
    }
}

auto BatchExecutor::fetchMany(const std::vector<std::string>& tokens,
                              const FetchOptions& options,
                              const ProgressCallback& progress)
    -> std::vector<FetchResult> {
    fetcher_->validateOptions(options);
    return run(
        tokens.size(),
        [&](size_t i) { return fetcher_->fetchOne(tokens[i], options); },
        [&](size_t i) { return target::Target::fromName(tokens[i]); },
        progress);
}

auto BatchExecutor::fetchMany(const std::vector<target::Target>& targets,
                              const FetchOptions& options,
                              const ProgressCallback& progress)
    -> std::vector<FetchResult> {
    fetcher_->validateOptions(options);
    return run(
        targets.size(),
        [&](size_t i) { return fetcher_->fetchOne(targets[i], options); },
        [&](size_t i) { return targets[i]; }, progress);
}

auto BatchExecutor::run(size_t count, const Task& task,
                        const Placeholder& placeholder,
                        const ProgressCallback& progress)
    -> std::vector<FetchResult> {
    std::vector<FetchResult> results(count);
    if (count == 0) {
        return results;
    }

    const size_t threads = std::min(workerCount_, count);
    spdlog::info("Fetching {} targets with {} workers", count, threads);

    std::atomic<size_t> nextIndex{0};
    size_t completed = 0;
    bool progressEnabled = static_cast<bool>(progress);
    std::mutex progressMutex;

    auto failed = [&](size_t i, const std::string& message) {
        spdlog::error("Target #{} failed unexpectedly: {}", i, message);
        FetchResult result;
        result.target = placeholder(i);
        result.status = FetchStatus::NetworkError;
        result.error = message;
        return result;
    };

    auto worker = [&]() {
        while (true) {
            const size_t i = nextIndex.fetch_add(1);
            if (i >= count) {
                break;
            }

            FetchResult result;
            try {
                result = task(i);
            } catch (const std::exception& e) {
                result = failed(i, e.what());
            } catch (...) {
                result = failed(i, "unknown exception");
            }
            results[i] = std::move(result);

            std::lock_guard lock(progressMutex);
            ++completed;
            if (!progressEnabled) {
                continue;
            }
            try {
                progress(completed, count, results[i]);
            } catch (const std::exception& e) {
                spdlog::error("Progress callback threw, disabling it: {}",
                              e.what());
                progressEnabled = false;
            } catch (...) {
                spdlog::error("Progress callback threw, disabling it");
                progressEnabled = false;
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(threads);
    try {
        for (size_t t = 0; t < threads; ++t) {
            workers.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        if (workers.empty()) {
            throw;
        }
        // Started workers drain the whole queue on their own
        spdlog::warn("Could only start {} of {} workers: {}", workers.size(),
                     threads, e.what());
    }
    for (auto& w : workers) {
        w.join();
    }

    const auto succeeded =
        std::count_if(results.begin(), results.end(),
                      [](const FetchResult& r) { return r.isSuccess(); });
    spdlog::info("Batch finished: {}/{} succeeded", succeeded, count);
    return results;
}

}  // namespace skyfetch::fetch
