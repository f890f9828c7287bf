// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "http_client.hpp"

#include <chrono>
#include <mutex>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace skyfetch::client {

namespace {

/**
 * @brief RAII wrapper for timing measurements
 */
class TimingGuard {
public:
    explicit TimingGuard(std::chrono::milliseconds& out)
        : out_(out), start_(std::chrono::steady_clock::now()) {}

    ~TimingGuard() {
        auto end = std::chrono::steady_clock::now();
        out_ =
            std::chrono::duration_cast<std::chrono::milliseconds>(end - start_);
    }

private:
    std::chrono::milliseconds& out_;
    std::chrono::steady_clock::time_point start_;
};

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::once_flag curlInitFlag;

void ensureCurlInitialized() {
    std::call_once(curlInitFlag, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

size_t writeCallback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size * nmemb);
    return size * nmemb;
}

auto classifyCurlError(CURLcode code) -> HttpError::Code {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return HttpError::Code::Timeout;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            return HttpError::Code::ConnectionFailed;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_WRITE_ERROR:
            return HttpError::Code::Transfer;
        default:
            return HttpError::Code::Unknown;
    }
}

}  // namespace

/**
 * @brief Implementation class for HttpClient
 */
class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        ensureCurlInitialized();
    }

    auto executeRequest(const HttpRequest& request) -> HttpResult {
        HttpResponse response;
        std::chrono::milliseconds elapsed{0};
        CURLcode res = CURLE_OK;
        {
            TimingGuard timer(elapsed);

            CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
            if (!curl) {
                return std::unexpected(HttpError{
                    HttpError::Code::Unknown, "Failed to initialize CURL"});
            }

            CurlHeaders headers(nullptr, curl_slist_free_all);
            for (const auto& [key, value] : request.headers) {
                std::string line = key + ": " + value;
                headers.reset(curl_slist_append(headers.release(),
                                                line.c_str()));
            }

            auto timeout = request.timeout.count() > 0
                               ? request.timeout
                               : config_.defaultTimeout;

            curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                             static_cast<long>(timeout.count()));
            curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT,
                             config_.userAgent.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION,
                             request.followRedirects ? 1L : 0L);
            if (!request.verifySSL) {
                curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
                curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
            }
            if (config_.proxyUrl.has_value()) {
                curl_easy_setopt(curl.get(), CURLOPT_PROXY,
                                 config_.proxyUrl->c_str());
            }
            if (headers) {
                curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
            }

            spdlog::debug("GET {}", request.url);
            res = curl_easy_perform(curl.get());

            if (res == CURLE_OK) {
                curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE,
                                  &response.statusCode);
                char* contentType = nullptr;
                curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE,
                                  &contentType);
                if (contentType != nullptr) {
                    response.contentType = contentType;
                }
                char* effectiveUrl = nullptr;
                curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL,
                                  &effectiveUrl);
                response.effectiveUrl =
                    effectiveUrl != nullptr ? effectiveUrl : request.url;
            }
        }

        if (res != CURLE_OK) {
            spdlog::warn("HTTP request to {} failed after {}ms: {}",
                         request.url, elapsed.count(), curl_easy_strerror(res));
            return std::unexpected(
                HttpError{classifyCurlError(res), curl_easy_strerror(res)});
        }

        response.responseTime = elapsed;
        spdlog::debug("HTTP {} from {} in {}ms ({} bytes)", response.statusCode,
                      request.url, elapsed.count(), response.body.size());
        return response;
    }

    HttpClientConfig config_;
};

// ============================================================================
// HttpClient Implementation
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&& other) noexcept
    : pImpl_(std::move(other.pImpl_)) {}

HttpClient& HttpClient::operator=(HttpClient&& other) noexcept {
    if (this != &other) {
        pImpl_ = std::move(other.pImpl_);
    }
    return *this;
}

auto HttpClient::request(const HttpRequest& request) -> HttpResult {
    return pImpl_->executeRequest(request);
}

auto HttpClient::config() const -> const HttpClientConfig& {
    return pImpl_->config_;
}

auto HttpClient::urlEncode(const std::string& value) -> std::string {
    ensureCurlInitialized();
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        THROW_NETWORK_ERROR("Failed to initialize CURL for URL encoding");
    }

    char* output = curl_easy_escape(curl.get(), value.c_str(),
                                    static_cast<int>(value.length()));
    if (output == nullptr) {
        THROW_NETWORK_ERROR("Failed to URL encode string: " + value);
    }

    std::string result(output);
    curl_free(output);
    return result;
}

}  // namespace skyfetch::client
