// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "sesame_backend.hpp"

#include <charconv>
#include <optional>
#include <sstream>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace skyfetch::resolver {

namespace {

auto toDouble(std::string token) -> std::optional<double> {
    if (!token.empty() && token.front() == '+') {
        token.erase(0, 1);
    }
    double value = 0.0;
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

SesameResolutionBackend::SesameResolutionBackend(
    std::shared_ptr<client::IHttpClient> httpClient,
    const SesameBackendConfig& config)
    : httpClient_(std::move(httpClient)), config_(config) {}

auto SesameResolutionBackend::buildUrl(const std::string& name) const
    -> std::string {
    return config_.baseUrl + "?" + client::HttpClient::urlEncode(name);
}

auto SesameResolutionBackend::parseResponse(std::string_view body)
    -> ResolutionOutcome {
    std::istringstream stream{std::string(body)};
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind("%J", 0) != 0) {
            continue;
        }

        std::istringstream fields(line.substr(2));
        std::string raToken;
        std::string decToken;
        fields >> raToken >> decToken;

        auto ra = toDouble(raToken);
        auto dec = toDouble(decToken);
        if (!ra || !dec || !target::isValidRaDec(*ra, *dec)) {
            return std::unexpected(ResolutionError{
                ResolutionError::Code::ParseError,
                "Malformed Sesame position line: " + line});
        }
        return target::ResolvedCoordinate{*ra, *dec};
    }

    return std::unexpected(ResolutionError{ResolutionError::Code::NotFound,
                                           "Sesame returned no position"});
}

auto SesameResolutionBackend::resolveName(const std::string& name)
    -> ResolutionOutcome {
    std::string url;
    try {
        url = buildUrl(name);
    } catch (const NetworkError& e) {
        return std::unexpected(ResolutionError{
            ResolutionError::Code::NetworkError,
            std::string("Cannot build Sesame query: ") + e.what()});
    }
    auto response = httpClient_->get(url, config_.timeout);

    if (!response) {
        return std::unexpected(ResolutionError{
            ResolutionError::Code::NetworkError,
            "Sesame request failed: " + response.error().message});
    }

    if (response->isTransientFailure()) {
        return std::unexpected(ResolutionError{
            ResolutionError::Code::ServiceUnavailable,
            "Sesame answered HTTP " + std::to_string(response->statusCode)});
    }

    if (!response->isSuccess()) {
        return std::unexpected(ResolutionError{
            ResolutionError::Code::Unknown,
            "Sesame answered HTTP " + std::to_string(response->statusCode)});
    }

    auto result = parseResponse(response->body);
    if (!result) {
        spdlog::debug("Sesame could not resolve '{}': {}", name,
                      result.error().message);
        result.error().message += " for '" + name + "'";
    }
    return result;
}

}  // namespace skyfetch::resolver
