// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_RESOLVER_NAME_RESOLVER_HPP
#define SKYFETCH_RESOLVER_NAME_RESOLVER_HPP

#include <chrono>
#include <memory>
#include <string>

#include "resolution_backend.hpp"
#include "resolution_cache.hpp"
#include "target/target.hpp"

namespace skyfetch::resolver {

/**
 * @brief Retry policy for transient backend failures
 *
 * Attempt n (0-based retry index) waits baseDelay * multiplier^n.
 */
struct RetryPolicy {
    int maxRetries = 2;                        ///< Retries after the first call
    std::chrono::milliseconds baseDelay{500};  ///< Delay before first retry
    double multiplier = 2.0;                   ///< Backoff factor

    [[nodiscard]] auto delayFor(int retryIndex) const
        -> std::chrono::milliseconds;
};

/**
 * @brief Cache-aside name resolution
 *
 * Checks the injected ResolutionCache first. On a miss the backend is called
 * once and retried on transient failures according to the RetryPolicy.
 * Successful lookups are cached; "not found" and exhausted retries are not.
 */
class NameResolver {
public:
    /**
     * @throws std::invalid_argument if backend or cache is nullptr
     */
    NameResolver(NameResolutionBackendPtr backend,
                 std::shared_ptr<ResolutionCache> cache,
                 const RetryPolicy& policy = {});

    /**
     * @brief Resolve an object name
     * @throws NameResolutionError if the name is unknown or the backend kept
     *         failing after all retries
     */
    [[nodiscard]] auto resolve(const std::string& name)
        -> target::ResolvedCoordinate;

    [[nodiscard]] auto cache() const -> std::shared_ptr<ResolutionCache> {
        return cache_;
    }

    [[nodiscard]] auto policy() const noexcept -> const RetryPolicy& {
        return policy_;
    }

private:
    NameResolutionBackendPtr backend_;
    std::shared_ptr<ResolutionCache> cache_;
    RetryPolicy policy_;
};

}  // namespace skyfetch::resolver

#endif  // SKYFETCH_RESOLVER_NAME_RESOLVER_HPP
