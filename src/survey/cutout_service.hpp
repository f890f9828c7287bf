// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_SURVEY_CUTOUT_SERVICE_HPP
#define SKYFETCH_SURVEY_CUTOUT_SERVICE_HPP

#include <chrono>
#include <expected>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "client/http_client.hpp"
#include "survey_catalog.hpp"

namespace skyfetch::survey {

/**
 * @brief Parameters of one cutout request, already resolved to pixels
 */
struct CutoutRequest {
    double ra = 0.0;        ///< degrees
    double dec = 0.0;       ///< degrees
    int sizePx = 256;       ///< Square output size
    double pixscale = 0.0;  ///< arcsec / pixel, 0 for the survey default
};

/**
 * @brief Decoded cutout plus the bytes the server sent
 */
struct CutoutImage {
    cv::Mat pixels;           ///< 8-bit, 1 or 3 channels
    std::string encoded;      ///< Original encoded payload (JPEG/PNG)
    std::string contentType;
    std::string sourceUrl;

    [[nodiscard]] auto width() const noexcept -> int { return pixels.cols; }
    [[nodiscard]] auto height() const noexcept -> int { return pixels.rows; }
    [[nodiscard]] auto empty() const noexcept -> bool {
        return pixels.empty();
    }
};

/**
 * @brief Failure of a single survey request
 */
struct CutoutError {
    enum class Code {
        NotCovered,       ///< Survey has no data at this position
        NetworkError,     ///< Transport failure, timeout or 5xx
        InvalidResponse   ///< Response was not a decodable image
    };

    Code code = Code::NetworkError;
    std::string message;
    long statusCode = 0;

    [[nodiscard]] auto isRetryable() const noexcept -> bool {
        return code == Code::NetworkError;
    }
};

using CutoutOutcome = std::expected<CutoutImage, CutoutError>;

/**
 * @brief Survey image service
 */
class ICutoutService {
public:
    virtual ~ICutoutService() = default;

    /**
     * @brief Fetch and decode one cutout
     *
     * Never throws for remote failures; they are reported in the error
     * channel.
     */
    [[nodiscard]] virtual auto fetchCutout(const SurveyDescriptor& survey,
                                           const CutoutRequest& request)
        -> CutoutOutcome = 0;
};

using CutoutServicePtr = std::shared_ptr<ICutoutService>;

/**
 * @brief ICutoutService over HTTP, decoding with OpenCV
 */
class HttpCutoutService : public ICutoutService {
public:
    explicit HttpCutoutService(
        std::shared_ptr<client::IHttpClient> httpClient,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{30000});

    [[nodiscard]] auto fetchCutout(const SurveyDescriptor& survey,
                                   const CutoutRequest& request)
        -> CutoutOutcome override;

    /**
     * @brief Decode an encoded payload into an 8-bit image
     * @return empty Mat if the payload cannot be decoded
     */
    [[nodiscard]] static auto decode(const std::string& payload) -> cv::Mat;

private:
    std::shared_ptr<client::IHttpClient> httpClient_;
    std::chrono::milliseconds timeout_;
};

}  // namespace skyfetch::survey

#endif  // SKYFETCH_SURVEY_CUTOUT_SERVICE_HPP
