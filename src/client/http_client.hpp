// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_CLIENT_HTTP_CLIENT_HPP
#define SKYFETCH_CLIENT_HTTP_CLIENT_HPP

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace skyfetch::client {

/**
 * @brief HTTP request configuration
 */
struct HttpRequest {
    std::string url;
    std::unordered_map<std::string, std::string> headers;
    std::chrono::milliseconds timeout{30000};
    bool followRedirects = true;
    bool verifySSL = true;
};

/**
 * @brief HTTP response data
 */
struct HttpResponse {
    long statusCode = 0;
    std::string contentType;
    std::string body;
    std::chrono::milliseconds responseTime{0};
    std::string effectiveUrl;  // Final URL after redirects

    [[nodiscard]] auto isSuccess() const noexcept -> bool {
        return statusCode >= 200 && statusCode < 300;
    }

    /**
     * @brief 429 and 5xx responses are worth retrying
     */
    [[nodiscard]] auto isTransientFailure() const noexcept -> bool {
        return statusCode == 429 || statusCode >= 500;
    }
};

/**
 * @brief Transport level failure (no HTTP response at all)
 */
struct HttpError {
    enum class Code {
        Timeout,           ///< Request exceeded its timeout
        ConnectionFailed,  ///< DNS, connect or TLS failure
        Transfer,          ///< Failure while receiving
        Unknown
    };

    Code code = Code::Unknown;
    std::string message;
};

using HttpResult = std::expected<HttpResponse, HttpError>;

/**
 * @brief HTTP client configuration
 */
struct HttpClientConfig {
    std::chrono::milliseconds defaultTimeout{30000};
    std::string userAgent = "SkyFetch/1.0";
    std::optional<std::string> proxyUrl;
};

/**
 * @brief Minimal HTTP GET interface used by the remote backends
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Execute a blocking request
     *
     * A returned HttpResponse may still carry a non-2xx status; only failures
     * without any response end up in the error channel.
     */
    [[nodiscard]] virtual auto request(const HttpRequest& request)
        -> HttpResult = 0;

    /**
     * @brief Convenience GET request
     */
    [[nodiscard]] auto get(const std::string& url,
                           std::chrono::milliseconds timeout =
                               std::chrono::milliseconds{30000})
        -> HttpResult {
        HttpRequest req;
        req.url = url;
        req.timeout = timeout;
        return request(req);
    }
};

/**
 * @brief libcurl backed HTTP client
 *
 * Each request uses its own easy handle, so one client may be shared by any
 * number of worker threads. No retries happen here; retry policy belongs to
 * the caller.
 */
class HttpClient : public IHttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    // Non-copyable, movable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    [[nodiscard]] auto request(const HttpRequest& request)
        -> HttpResult override;

    [[nodiscard]] auto config() const -> const HttpClientConfig&;

    /**
     * @brief Percent-encode a query parameter value
     */
    [[nodiscard]] static auto urlEncode(const std::string& value)
        -> std::string;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace skyfetch::client

#endif  // SKYFETCH_CLIENT_HTTP_CLIENT_HPP
