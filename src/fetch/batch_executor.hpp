// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_FETCH_BATCH_EXECUTOR_HPP
#define SKYFETCH_FETCH_BATCH_EXECUTOR_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "fallback_fetcher.hpp"

namespace skyfetch::fetch {

/**
 * @brief Called after each target finishes, serialized across workers
 *
 * A callback that throws is logged and not called again for the batch.
 */
using ProgressCallback = std::function<void(
    size_t completed, size_t total, const FetchResult& result)>;

/**
 * @brief Runs FallbackFetcher over many targets with a bounded worker pool
 *
 * The result vector is pre-sized; each worker claims the next index from an
 * atomic counter and writes exactly that slot, so output[i] always belongs
 * to input[i] regardless of completion order.
 */
class BatchExecutor {
public:
    static constexpr size_t DEFAULT_WORKER_COUNT = 8;

    /**
     * @throws std::invalid_argument if fetcher is nullptr
     * @throws InvalidConfigurationError if workerCount is 0
     */
    explicit BatchExecutor(std::shared_ptr<FallbackFetcher> fetcher,
                           size_t workerCount = DEFAULT_WORKER_COUNT);

    /**
     * @brief Fetch raw tokens (coordinates or names)
     * @throws InvalidConfigurationError, UnknownSurveyError before any work
     */
    [[nodiscard]] auto fetchMany(const std::vector<std::string>& tokens,
                                 const FetchOptions& options = {},
                                 const ProgressCallback& progress = nullptr)
        -> std::vector<FetchResult>;

    /**
     * @brief Fetch pre-built targets (e.g. from a catalog file)
     * @throws InvalidConfigurationError, UnknownSurveyError before any work
     */
    [[nodiscard]] auto fetchMany(const std::vector<target::Target>& targets,
                                 const FetchOptions& options = {},
                                 const ProgressCallback& progress = nullptr)
        -> std::vector<FetchResult>;

    [[nodiscard]] auto workerCount() const noexcept -> size_t {
        return workerCount_;
    }

private:
    using Task = std::function<FetchResult(size_t)>;
    using Placeholder = std::function<target::Target(size_t)>;

    auto run(size_t count, const Task& task, const Placeholder& placeholder,
             const ProgressCallback& progress) -> std::vector<FetchResult>;

    std::shared_ptr<FallbackFetcher> fetcher_;
    size_t workerCount_;
};

}  // namespace skyfetch::fetch

#endif  // SKYFETCH_FETCH_BATCH_EXECUTOR_HPP
