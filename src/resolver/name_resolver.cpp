// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "name_resolver.hpp"

#include <cmath>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "target/coordinate_parser.hpp"

namespace skyfetch::resolver {

auto RetryPolicy::delayFor(int retryIndex) const -> std::chrono::milliseconds {
    auto scaled = static_cast<double>(baseDelay.count()) *
                  std::pow(multiplier, retryIndex);
    return std::chrono::milliseconds{static_cast<long long>(scaled)};
}

NameResolver::NameResolver(NameResolutionBackendPtr backend,
                           std::shared_ptr<ResolutionCache> cache,
                           const RetryPolicy& policy)
    : backend_(std::move(backend)), cache_(std::move(cache)), policy_(policy) {
    if (!backend_) {
        throw std::invalid_argument("Name resolution backend cannot be null");
    }
    if (!cache_) {
        throw std::invalid_argument("Resolution cache cannot be null");
    }
}

auto NameResolver::resolve(const std::string& name)
    -> target::ResolvedCoordinate {
    const std::string key = target::trim(name);
    if (key.empty()) {
        THROW_NAME_RESOLUTION_ERROR("Cannot resolve an empty name");
    }

    if (auto cached = cache_->get(key)) {
        return *cached;
    }

    ResolutionError lastError;
    for (int attempt = 0; attempt <= policy_.maxRetries; ++attempt) {
        ResolutionOutcome result;
        try {
            result = backend_->resolveName(key);
        } catch (const NetworkError& e) {
            result = std::unexpected(
                ResolutionError{ResolutionError::Code::NetworkError, e.what()});
        }
        if (result) {
            spdlog::info("Resolved '{}' via {} -> ({:.6f}, {:.6f})", key,
                         backend_->name(), result->ra, result->dec);
            cache_->put(key, *result);
            return *result;
        }

        lastError = result.error();
        if (!lastError.isRetryable()) {
            break;
        }

        if (attempt < policy_.maxRetries) {
            auto delay = policy_.delayFor(attempt);
            spdlog::warn(
                "Resolving '{}' failed, retrying in {}ms (attempt {}/{}): {}",
                key, delay.count(), attempt + 1, policy_.maxRetries,
                lastError.message);
            std::this_thread::sleep_for(delay);
        }
    }

    spdlog::error("Could not resolve '{}': {}", key, lastError.message);
    THROW_NAME_RESOLUTION_ERROR("Could not resolve '" + key +
                                "': " + lastError.message);
}

}  // namespace skyfetch::resolver
