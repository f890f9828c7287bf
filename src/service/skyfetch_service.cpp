// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "skyfetch_service.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "client/http_client.hpp"
#include "fetch/fallback_fetcher.hpp"
#include "resolver/name_resolver.hpp"
#include "resolver/sesame_backend.hpp"

namespace skyfetch::service {

class SkyFetchService::Impl {
public:
    Impl(const config::SkyFetchConfig& config,
         resolver::NameResolutionBackendPtr backend,
         survey::CutoutServicePtr cutouts)
        : config_(config) {
        config_.validate();
        if (!backend) {
            throw std::invalid_argument(
                "Name resolution backend cannot be null");
        }
        if (!cutouts) {
            throw std::invalid_argument("Cutout service cannot be null");
        }

        catalog_ = std::make_shared<const survey::SurveyCatalog>(
            config_.buildCatalog());
        cache_ = std::make_shared<resolver::ResolutionCache>(
            config_.cacheCapacity);
        resolver_ = std::make_shared<resolver::NameResolver>(
            std::move(backend), cache_, config_.retryPolicy());
        fetcher_ = std::make_shared<fetch::FallbackFetcher>(
            catalog_, resolver_, std::move(cutouts),
            config_.fallbackConfig());

        spdlog::info(
            "SkyFetch service ready: {} surveys, default '{}', cache {}",
            catalog_->size(), config_.surveyId, config_.cacheCapacity);
    }

    static auto makeHttpClient(const config::SkyFetchConfig& config)
        -> std::shared_ptr<client::IHttpClient> {
        client::HttpClientConfig httpConfig;
        httpConfig.defaultTimeout = config.requestTimeout;
        httpConfig.userAgent = config.userAgent;
        httpConfig.proxyUrl = config.proxyUrl;
        return std::make_shared<client::HttpClient>(httpConfig);
    }

    auto executor(std::optional<size_t> workerCount) const
        -> fetch::BatchExecutor {
        return fetch::BatchExecutor(fetcher_,
                                    workerCount.value_or(config_.workerCount));
    }

    config::SkyFetchConfig config_;
    survey::SurveyCatalogPtr catalog_;
    std::shared_ptr<resolver::ResolutionCache> cache_;
    std::shared_ptr<resolver::NameResolver> resolver_;
    std::shared_ptr<fetch::FallbackFetcher> fetcher_;
};

SkyFetchService::SkyFetchService(const config::SkyFetchConfig& config)
    : pImpl_([&config] {
          auto http = Impl::makeHttpClient(config);
          resolver::SesameBackendConfig sesame;
          sesame.baseUrl = config.sesameUrl;
          sesame.timeout = config.requestTimeout;
          return std::make_unique<Impl>(
              config,
              std::make_shared<resolver::SesameResolutionBackend>(http, sesame),
              std::make_shared<survey::HttpCutoutService>(
                  http, config.requestTimeout));
      }()) {}

SkyFetchService::SkyFetchService(const config::SkyFetchConfig& config,
                                 resolver::NameResolutionBackendPtr backend,
                                 survey::CutoutServicePtr cutouts)
    : pImpl_(std::make_unique<Impl>(config, std::move(backend),
                                    std::move(cutouts))) {}

SkyFetchService::~SkyFetchService() = default;

SkyFetchService::SkyFetchService(SkyFetchService&&) noexcept = default;
SkyFetchService& SkyFetchService::operator=(SkyFetchService&&) noexcept =
    default;

auto SkyFetchService::fetchOne(const std::string& token,
                               const std::optional<fetch::FetchOptions>& options)
    -> fetch::FetchResult {
    return pImpl_->fetcher_->fetchOne(
        token, options.value_or(pImpl_->config_.fetchOptions()));
}

auto SkyFetchService::fetchOne(const target::Target& target,
                               const std::optional<fetch::FetchOptions>& options)
    -> fetch::FetchResult {
    return pImpl_->fetcher_->fetchOne(
        target, options.value_or(pImpl_->config_.fetchOptions()));
}

auto SkyFetchService::fetchMany(const std::vector<std::string>& tokens,
                                const std::optional<fetch::FetchOptions>& options,
                                std::optional<size_t> workerCount,
                                const fetch::ProgressCallback& progress)
    -> std::vector<fetch::FetchResult> {
    auto executor = pImpl_->executor(workerCount);
    return executor.fetchMany(
        tokens, options.value_or(pImpl_->config_.batchOptions()), progress);
}

auto SkyFetchService::fetchMany(const std::vector<target::Target>& targets,
                                const std::optional<fetch::FetchOptions>& options,
                                std::optional<size_t> workerCount,
                                const fetch::ProgressCallback& progress)
    -> std::vector<fetch::FetchResult> {
    auto executor = pImpl_->executor(workerCount);
    return executor.fetchMany(
        targets, options.value_or(pImpl_->config_.batchOptions()), progress);
}

auto SkyFetchService::resolve(const std::string& name)
    -> target::ResolvedCoordinate {
    return pImpl_->resolver_->resolve(name);
}

auto SkyFetchService::catalog() const -> const survey::SurveyCatalog& {
    return *pImpl_->catalog_;
}

auto SkyFetchService::cacheStats() const -> resolver::CacheStats {
    return pImpl_->cache_->getStats();
}

auto SkyFetchService::config() const -> const config::SkyFetchConfig& {
    return pImpl_->config_;
}

}  // namespace skyfetch::service
