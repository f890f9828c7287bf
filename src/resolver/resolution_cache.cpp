// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "resolution_cache.hpp"

#include <atomic>

#include <spdlog/spdlog.h>
#include "atom/search/lru.hpp"

#include "exception/exception.hpp"

namespace skyfetch::resolver {

/**
 * @brief Implementation class for ResolutionCache using ThreadSafeLRUCache
 */
class ResolutionCache::Impl {
public:
    explicit Impl(size_t capacity) : capacity_(capacity), lru_(capacity) {}

    auto get(const std::string& name)
        -> std::optional<target::ResolvedCoordinate> {
        auto result = lru_.get(name);
        if (result.has_value()) {
            spdlog::debug("Resolution cache hit for '{}'", name);
            hits_++;
            return result.value();
        }
        spdlog::debug("Resolution cache miss for '{}'", name);
        misses_++;
        return std::nullopt;
    }

    void put(const std::string& name, const target::ResolvedCoordinate& coord) {
        spdlog::debug("Caching resolution '{}' -> ({:.6f}, {:.6f})", name,
                      coord.ra, coord.dec);
        lru_.put(name, coord);
    }

    void clear() {
        lru_.clear();
        hits_ = 0;
        misses_ = 0;
    }

    auto size() const -> size_t { return lru_.size(); }

    auto capacity() const noexcept -> size_t { return capacity_; }

    auto getStats() const -> CacheStats {
        CacheStats stats;
        stats.entries = lru_.size();
        stats.capacity = capacity_;
        stats.hits = hits_.load();
        stats.misses = misses_.load();
        if (stats.hits + stats.misses > 0) {
            stats.hitRate = static_cast<double>(stats.hits) /
                            static_cast<double>(stats.hits + stats.misses);
        }
        return stats;
    }

private:
    size_t capacity_;
    atom::search::ThreadSafeLRUCache<std::string, target::ResolvedCoordinate>
        lru_;
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
};

// ============================================================================
// ResolutionCache Implementation
// ============================================================================

ResolutionCache::ResolutionCache(size_t capacity) {
    if (capacity == 0) {
        THROW_INVALID_CONFIGURATION("Resolution cache capacity must be > 0");
    }
    pImpl_ = std::make_unique<Impl>(capacity);
}

ResolutionCache::~ResolutionCache() = default;

ResolutionCache::ResolutionCache(ResolutionCache&& other) noexcept
    : pImpl_(std::move(other.pImpl_)) {}

ResolutionCache& ResolutionCache::operator=(ResolutionCache&& other) noexcept {
    if (this != &other) {
        pImpl_ = std::move(other.pImpl_);
    }
    return *this;
}

auto ResolutionCache::get(const std::string& name)
    -> std::optional<target::ResolvedCoordinate> {
    return pImpl_->get(name);
}

void ResolutionCache::put(const std::string& name,
                          const target::ResolvedCoordinate& coord) {
    pImpl_->put(name, coord);
}

void ResolutionCache::clear() { pImpl_->clear(); }

auto ResolutionCache::size() const -> size_t { return pImpl_->size(); }

auto ResolutionCache::capacity() const noexcept -> size_t {
    return pImpl_->capacity();
}

auto ResolutionCache::getStats() const -> CacheStats {
    return pImpl_->getStats();
}

}  // namespace skyfetch::resolver
