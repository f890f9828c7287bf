// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "mocks/mock_services.hpp"
#include "survey/cutout_service.hpp"

using namespace skyfetch::survey;
using skyfetch::client::HttpError;
using skyfetch::client::HttpRequest;
using skyfetch::client::HttpResponse;
using skyfetch::client::HttpResult;
using skyfetch::tests::MockHttpClient;
using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Return;

class HttpCutoutServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<MockHttpClient>();
        service_ = std::make_unique<HttpCutoutService>(http_);
        survey_ = SurveyCatalog::createDefault().at("ls-dr10");
        request_.ra = 150.0;
        request_.dec = 2.2;
        request_.sizePx = 64;
    }

    static auto encodedPng() -> std::string {
        cv::Mat image(16, 16, CV_8UC3);
        cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(256));
        std::vector<uchar> buffer;
        cv::imencode(".png", image, buffer);
        return std::string(buffer.begin(), buffer.end());
    }

    static auto response(long status, std::string contentType,
                         std::string body) -> HttpResult {
        HttpResponse r;
        r.statusCode = status;
        r.contentType = std::move(contentType);
        r.body = std::move(body);
        return r;
    }

    std::shared_ptr<MockHttpClient> http_;
    std::unique_ptr<HttpCutoutService> service_;
    SurveyDescriptor survey_;
    CutoutRequest request_;
};

TEST_F(HttpCutoutServiceTest, DecodesImageResponse) {
    EXPECT_CALL(*http_, request(Field(&HttpRequest::url,
                                      HasSubstr("layer=ls-dr10"))))
        .WillOnce(Return(response(200, "image/png", encodedPng())));

    auto outcome = service_->fetchCutout(survey_, request_);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->width(), 16);
    EXPECT_EQ(outcome->height(), 16);
    EXPECT_EQ(outcome->pixels.depth(), CV_8U);
    EXPECT_FALSE(outcome->encoded.empty());
}

TEST_F(HttpCutoutServiceTest, NotFoundMeansNotCovered) {
    EXPECT_CALL(*http_, request(_))
        .WillOnce(Return(response(404, "text/html", "missing")));

    auto outcome = service_->fetchCutout(survey_, request_);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, CutoutError::Code::NotCovered);
    EXPECT_FALSE(outcome.error().isRetryable());
}

TEST_F(HttpCutoutServiceTest, TransportAndServerFailuresAreRetryable) {
    EXPECT_CALL(*http_, request(_))
        .WillOnce(Return(std::unexpected(
            HttpError{HttpError::Code::ConnectionFailed, "refused"})))
        .WillOnce(Return(response(502, "text/html", "bad gateway")));

    EXPECT_TRUE(service_->fetchCutout(survey_, request_).error().isRetryable());
    EXPECT_TRUE(service_->fetchCutout(survey_, request_).error().isRetryable());
}

TEST_F(HttpCutoutServiceTest, NonImagePayloadIsInvalid) {
    EXPECT_CALL(*http_, request(_))
        .WillOnce(Return(response(200, "text/html", "<html>error</html>")))
        .WillOnce(Return(response(200, "image/jpeg", "not really a jpeg")));

    EXPECT_EQ(service_->fetchCutout(survey_, request_).error().code,
              CutoutError::Code::InvalidResponse);
    EXPECT_EQ(service_->fetchCutout(survey_, request_).error().code,
              CutoutError::Code::InvalidResponse);
}

TEST(CutoutDecodeTest, SixteenBitImagesAreStretchedToEightBit) {
    cv::Mat wide(8, 8, CV_16UC1);
    cv::randu(wide, cv::Scalar::all(1000), cv::Scalar::all(60000));
    std::vector<uchar> buffer;
    ASSERT_TRUE(cv::imencode(".png", wide, buffer));

    auto decoded =
        HttpCutoutService::decode(std::string(buffer.begin(), buffer.end()));
    ASSERT_FALSE(decoded.empty());
    EXPECT_EQ(decoded.depth(), CV_8U);

    double minVal = 0.0;
    double maxVal = 0.0;
    cv::minMaxLoc(decoded, &minVal, &maxVal);
    EXPECT_DOUBLE_EQ(minVal, 0.0);
    EXPECT_DOUBLE_EQ(maxVal, 255.0);
}
