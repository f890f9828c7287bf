// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include "image_statistics.hpp"

#include <opencv2/core.hpp>

#include "atom/error/exception.hpp"
#include <spdlog/spdlog.h>

namespace skyfetch::survey {

auto computePixelStats(const cv::Mat& image) -> PixelStats {
    if (image.empty()) {
        THROW_INVALID_ARGUMENT("Empty input image");
    }

    // Pool all channels into a single plane
    cv::Mat samples = image.isContinuous() ? image : image.clone();
    samples = samples.reshape(1);

    cv::Scalar mean;
    cv::Scalar stddev;
    cv::meanStdDev(samples, mean, stddev);

    PixelStats stats;
    stats.mean = mean[0];
    stats.stddev = stddev[0];
    cv::minMaxLoc(samples, &stats.min, &stats.max);
    return stats;
}

auto isBlankImage(const cv::Mat& image, double threshold) -> bool {
    if (image.empty()) {
        return true;
    }
    auto stats = computePixelStats(image);
    spdlog::debug("Cutout {}x{}x{}: mean={:.2f} stddev={:.2f} range=[{}, {}]",
                  image.cols, image.rows, image.channels(), stats.mean,
                  stats.stddev, stats.min, stats.max);
    return stats.isUniform() || stats.stddev < threshold;
}

}  // namespace skyfetch::survey
