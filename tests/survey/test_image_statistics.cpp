// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include "atom/error/exception.hpp"
#include "survey/image_statistics.hpp"

using namespace skyfetch::survey;

TEST(ImageStatisticsTest, UniformImageIsBlank) {
    cv::Mat black(32, 32, CV_8UC3, cv::Scalar::all(0));
    cv::Mat grey(32, 32, CV_8UC1, cv::Scalar::all(128));
    EXPECT_TRUE(isBlankImage(black));
    EXPECT_TRUE(isBlankImage(grey));
    EXPECT_TRUE(isBlankImage(grey, 0.0));
}

TEST(ImageStatisticsTest, NoisyImageIsNotBlank) {
    cv::Mat noise(64, 64, CV_8UC3);
    cv::randu(noise, cv::Scalar::all(0), cv::Scalar::all(256));
    EXPECT_FALSE(isBlankImage(noise));
}

TEST(ImageStatisticsTest, FaintStructureBelowThresholdIsBlank) {
    cv::Mat faint(32, 32, CV_8UC1, cv::Scalar::all(20));
    faint(cv::Rect(0, 0, 16, 32)).setTo(cv::Scalar::all(24));
    auto stats = computePixelStats(faint);
    EXPECT_NEAR(stats.stddev, 2.0, 1e-9);
    EXPECT_TRUE(isBlankImage(faint));
    EXPECT_FALSE(isBlankImage(faint, 1.0));
}

TEST(ImageStatisticsTest, StatisticsPoolAllChannels) {
    // Each channel is flat but the channels differ
    cv::Mat image(8, 8, CV_8UC3, cv::Scalar(0, 100, 200));
    auto stats = computePixelStats(image);
    EXPECT_DOUBLE_EQ(stats.mean, 100.0);
    EXPECT_DOUBLE_EQ(stats.min, 0.0);
    EXPECT_DOUBLE_EQ(stats.max, 200.0);
    EXPECT_GT(stats.stddev, 80.0);
    EXPECT_FALSE(stats.isUniform());
}

TEST(ImageStatisticsTest, EmptyImage) {
    EXPECT_TRUE(isBlankImage(cv::Mat{}));
    EXPECT_THROW((void)computePixelStats(cv::Mat{}),
                 atom::error::InvalidArgument);
}
