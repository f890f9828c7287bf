// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_RESOLVER_SESAME_BACKEND_HPP
#define SKYFETCH_RESOLVER_SESAME_BACKEND_HPP

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "client/http_client.hpp"
#include "resolution_backend.hpp"

namespace skyfetch::resolver {

/**
 * @brief Sesame configuration
 */
struct SesameBackendConfig {
    std::string baseUrl = "https://cds.unistra.fr/cgi-bin/nph-sesame/-oI/SNV";
    std::chrono::milliseconds timeout{30000};
};

/**
 * @brief CDS Sesame name resolver
 *
 * Sesame chains SIMBAD, NED and VizieR ("SNV") and answers in a plain text
 * format where the line starting with "%J" carries the J2000 position in
 * decimal degrees:
 *
 *     %J 10.68470833 +41.26875000 = 00:42:44.33 +41:16:07.5
 *
 * A reply without any "%J" line means the object is unknown.
 */
class SesameResolutionBackend : public INameResolutionBackend {
public:
    static constexpr std::string_view BACKEND_NAME = "Sesame";

    explicit SesameResolutionBackend(
        std::shared_ptr<client::IHttpClient> httpClient,
        const SesameBackendConfig& config = {});

    [[nodiscard]] auto resolveName(const std::string& name)
        -> ResolutionOutcome override;

    [[nodiscard]] auto name() const noexcept -> std::string_view override {
        return BACKEND_NAME;
    }

    /**
     * @brief Build the query URL for a name
     */
    [[nodiscard]] auto buildUrl(const std::string& name) const -> std::string;

    /**
     * @brief Extract the position from a Sesame text reply
     */
    [[nodiscard]] static auto parseResponse(std::string_view body)
        -> ResolutionOutcome;

private:
    std::shared_ptr<client::IHttpClient> httpClient_;
    SesameBackendConfig config_;
};

}  // namespace skyfetch::resolver

#endif  // SKYFETCH_RESOLVER_SESAME_BACKEND_HPP
