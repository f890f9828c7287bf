// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_RESOLVER_RESOLUTION_CACHE_HPP
#define SKYFETCH_RESOLVER_RESOLUTION_CACHE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "target/target.hpp"

namespace skyfetch::resolver {

/**
 * @brief Cache statistics
 */
struct CacheStats {
    size_t entries = 0;
    size_t capacity = 0;
    size_t hits = 0;
    size_t misses = 0;
    double hitRate = 0.0;
};

/**
 * @brief Bounded LRU store of name -> coordinate lookups
 *
 * Each operation runs under the cache's own lock. A get followed by a put is
 * not atomic, so two callers missing on the same name may both resolve it;
 * the second put simply overwrites the first.
 *
 * Lifetime is bound to the owning process; nothing is persisted.
 */
class ResolutionCache {
public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    /**
     * @param capacity Maximum number of entries, must be > 0
     * @throws InvalidConfigurationError if capacity is 0
     */
    explicit ResolutionCache(size_t capacity = DEFAULT_CAPACITY);
    ~ResolutionCache();

    // Non-copyable, movable
    ResolutionCache(const ResolutionCache&) = delete;
    ResolutionCache& operator=(const ResolutionCache&) = delete;
    ResolutionCache(ResolutionCache&&) noexcept;
    ResolutionCache& operator=(ResolutionCache&&) noexcept;

    /**
     * @brief Look up a name; a hit makes the entry most recently used
     */
    [[nodiscard]] auto get(const std::string& name)
        -> std::optional<target::ResolvedCoordinate>;

    /**
     * @brief Insert or refresh an entry, evicting the least recently used
     * entry when full
     */
    void put(const std::string& name, const target::ResolvedCoordinate& coord);

    void clear();

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto capacity() const noexcept -> size_t;
    [[nodiscard]] auto getStats() const -> CacheStats;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace skyfetch::resolver

#endif  // SKYFETCH_RESOLVER_RESOLUTION_CACHE_HPP
