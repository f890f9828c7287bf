// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#ifndef SKYFETCH_SURVEY_IMAGE_STATISTICS_HPP
#define SKYFETCH_SURVEY_IMAGE_STATISTICS_HPP

#include <opencv2/core.hpp>

namespace skyfetch::survey {

/// Default blank threshold on the standard deviation of 8-bit pixel values
constexpr double DEFAULT_BLANK_THRESHOLD = 10.0;

/**
 * @brief Statistics over every sample of an image, all channels pooled
 */
struct PixelStats {
    double mean = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;

    [[nodiscard]] auto isUniform() const noexcept -> bool {
        return min == max;
    }
};

/**
 * @brief Compute pooled statistics of an image
 * @throws atom::error::InvalidArgument for an empty image
 */
[[nodiscard]] auto computePixelStats(const cv::Mat& image) -> PixelStats;

/**
 * @brief A cutout is blank when it is uniform or its pooled standard
 * deviation is below threshold
 *
 * Empty images count as blank.
 */
[[nodiscard]] auto isBlankImage(const cv::Mat& image,
                                double threshold = DEFAULT_BLANK_THRESHOLD)
    -> bool;

}  // namespace skyfetch::survey

#endif  // SKYFETCH_SURVEY_IMAGE_STATISTICS_HPP
