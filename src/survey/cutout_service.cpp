// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "cutout_service.hpp"

#include <stdexcept>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

namespace skyfetch::survey {

namespace {

auto looksLikeImage(const std::string& contentType) -> bool {
    // Some mirrors omit the header entirely; let the decoder decide then
    return contentType.empty() || contentType.rfind("image/", 0) == 0 ||
           contentType.rfind("application/octet-stream", 0) == 0;
}

}  // namespace

HttpCutoutService::HttpCutoutService(
    std::shared_ptr<client::IHttpClient> httpClient,
    std::chrono::milliseconds timeout)
    : httpClient_(std::move(httpClient)), timeout_(timeout) {
    if (!httpClient_) {
        throw std::invalid_argument("HTTP client cannot be null");
    }
}

auto HttpCutoutService::decode(const std::string& payload) -> cv::Mat {
    if (payload.empty()) {
        return {};
    }

    std::vector<uchar> buffer(payload.begin(), payload.end());
    cv::Mat image = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        return {};
    }

    if (image.depth() != CV_8U) {
        double minVal = 0.0;
        double maxVal = 0.0;
        cv::minMaxLoc(image.reshape(1), &minVal, &maxVal);
        const double range = maxVal - minVal;
        const double alpha = range > 0.0 ? 255.0 / range : 0.0;
        image.convertTo(image, CV_8U, alpha, -minVal * alpha);
    }

    if (image.channels() == 4) {
        cv::cvtColor(image, image, cv::COLOR_BGRA2BGR);
    }
    return image;
}

auto HttpCutoutService::fetchCutout(const SurveyDescriptor& survey,
                                    const CutoutRequest& request)
    -> CutoutOutcome {
    const double pixscale =
        request.pixscale > 0.0 ? request.pixscale : survey.defaultPixscale;
    const auto url =
        survey.cutoutUrl(request.ra, request.dec, request.sizePx, pixscale);

    spdlog::debug("Requesting {} cutout: {}", survey.id, url);
    auto response = httpClient_->get(url, timeout_);

    if (!response) {
        return std::unexpected(CutoutError{CutoutError::Code::NetworkError,
                                           response.error().message, 0});
    }

    if (response->statusCode == 404 || response->statusCode == 204) {
        return std::unexpected(
            CutoutError{CutoutError::Code::NotCovered,
                        survey.id + " has no data at this position",
                        response->statusCode});
    }

    if (response->isTransientFailure()) {
        return std::unexpected(
            CutoutError{CutoutError::Code::NetworkError,
                        survey.id + " answered HTTP " +
                            std::to_string(response->statusCode),
                        response->statusCode});
    }

    if (!response->isSuccess()) {
        return std::unexpected(
            CutoutError{CutoutError::Code::InvalidResponse,
                        survey.id + " answered HTTP " +
                            std::to_string(response->statusCode),
                        response->statusCode});
    }

    if (!looksLikeImage(response->contentType)) {
        return std::unexpected(
            CutoutError{CutoutError::Code::InvalidResponse,
                        survey.id + " returned " + response->contentType +
                            " instead of an image",
                        response->statusCode});
    }

    CutoutImage image;
    image.pixels = decode(response->body);
    if (image.pixels.empty()) {
        return std::unexpected(
            CutoutError{CutoutError::Code::InvalidResponse,
                        "Could not decode " + survey.id + " cutout (" +
                            std::to_string(response->body.size()) + " bytes)",
                        response->statusCode});
    }

    image.encoded = std::move(response->body);
    image.contentType = response->contentType;
    image.sourceUrl = response->effectiveUrl.empty() ? url
                                                     : response->effectiveUrl;

    spdlog::debug("{} cutout decoded: {}x{} in {}ms", survey.id, image.width(),
                  image.height(), response->responseTime.count());
    return image;
}

}  // namespace skyfetch::survey
