// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

#include "exception/exception.hpp"
#include "fetch/fallback_fetcher.hpp"
#include "mocks/mock_services.hpp"

using namespace skyfetch::fetch;
using skyfetch::survey::CutoutRequest;
using skyfetch::survey::SurveyCatalog;
using skyfetch::survey::SurveyDescriptor;
using skyfetch::target::ResolvedCoordinate;
using skyfetch::tests::cutoutNetworkError;
using skyfetch::tests::cutoutNotCovered;
using skyfetch::tests::makeBlank;
using skyfetch::tests::makeStarField;
using skyfetch::tests::MockCutoutService;
using skyfetch::tests::MockResolutionBackend;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;

namespace {

MATCHER_P(SurveyIs, id, "") { return arg.id == id; }

}  // namespace

class FallbackFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<MockResolutionBackend>();
        cutouts_ = std::make_shared<MockCutoutService>();
        catalog_ = std::make_shared<const SurveyCatalog>(
            SurveyCatalog::createDefault());

        skyfetch::resolver::RetryPolicy policy;
        policy.maxRetries = 0;
        resolver_ = std::make_shared<skyfetch::resolver::NameResolver>(
            backend_, std::make_shared<skyfetch::resolver::ResolutionCache>(8),
            policy);

        config_.retryDelay = std::chrono::milliseconds{0};
        fetcher_ = std::make_unique<FallbackFetcher>(catalog_, resolver_,
                                                     cutouts_, config_);
    }

    std::shared_ptr<MockResolutionBackend> backend_;
    std::shared_ptr<MockCutoutService> cutouts_;
    skyfetch::survey::SurveyCatalogPtr catalog_;
    std::shared_ptr<skyfetch::resolver::NameResolver> resolver_;
    FallbackConfig config_;
    std::unique_ptr<FallbackFetcher> fetcher_;
};

TEST_F(FallbackFetcherTest, FirstGoodSurveyWins) {
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("ls-dr10"), _))
        .WillOnce(Return(makeStarField()));

    auto result = fetcher_->fetchOne("150.0 2.2");
    EXPECT_EQ(result.status, FetchStatus::Success);
    EXPECT_EQ(result.surveyUsed, "ls-dr10");
    ASSERT_TRUE(result.hasImage());
    EXPECT_EQ(result.attempts.size(), 1u);
}

TEST_F(FallbackFetcherTest, BlankSurveyFallsThroughToNext) {
    InSequence seq;
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("ls-dr10"), _))
        .WillOnce(Return(makeBlank()));
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("ls-dr9"), _))
        .WillOnce(Return(makeStarField()));

    auto result = fetcher_->fetchOne("150.0 2.2");
    EXPECT_EQ(result.status, FetchStatus::Success);
    EXPECT_EQ(result.surveyUsed, "ls-dr9");
    ASSERT_EQ(result.attempts.size(), 2u);
    EXPECT_EQ(result.attempts[0].outcome, AttemptOutcome::Blank);
}

TEST_F(FallbackFetcherTest, FarSouthStartsAtUnwise) {
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("unwise-neo7"), _))
        .WillOnce(Return(makeStarField()));

    auto result = fetcher_->fetchOne("30.0 -80.0");
    EXPECT_EQ(result.status, FetchStatus::Success);
    EXPECT_EQ(result.surveyUsed, "unwise-neo7");
    ASSERT_EQ(result.attempts.size(), 1u);
}

TEST_F(FallbackFetcherTest, AllBlankIsExhausted) {
    EXPECT_CALL(*cutouts_, fetchCutout(_, _))
        .Times(static_cast<int>(catalog_->size()))
        .WillRepeatedly(Return(makeBlank()));

    auto result = fetcher_->fetchOne("150.0 2.2");
    EXPECT_EQ(result.status, FetchStatus::Exhausted);
    EXPECT_FALSE(result.surveyUsed.has_value());
    EXPECT_FALSE(result.hasImage());
}

TEST_F(FallbackFetcherTest, NotCoveredMovesOn) {
    InSequence seq;
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("ls-dr10"), _))
        .WillOnce(Return(cutoutNotCovered()));
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("ls-dr9"), _))
        .WillOnce(Return(makeStarField()));

    auto result = fetcher_->fetchOne("150.0 2.2");
    EXPECT_EQ(result.surveyUsed, "ls-dr9");
    EXPECT_EQ(result.attempts[0].outcome, AttemptOutcome::NotCovered);
    EXPECT_EQ(result.attempts[0].tries, 1);
}

TEST_F(FallbackFetcherTest, NetworkErrorRetriedOnceThenNextSurvey) {
    InSequence seq;
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("ls-dr10"), _))
        .Times(2)
        .WillRepeatedly(Return(cutoutNetworkError()));
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("ls-dr9"), _))
        .WillOnce(Return(makeStarField()));

    auto result = fetcher_->fetchOne("150.0 2.2");
    EXPECT_EQ(result.status, FetchStatus::Success);
    EXPECT_EQ(result.attempts[0].tries, 2);
    EXPECT_EQ(result.attempts[0].outcome, AttemptOutcome::NetworkError);
}

TEST_F(FallbackFetcherTest, NetworkRecoveryOnRetryUsesSameSurvey) {
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("ls-dr10"), _))
        .WillOnce(Return(cutoutNetworkError()))
        .WillOnce(Return(makeStarField()));

    auto result = fetcher_->fetchOne("150.0 2.2");
    EXPECT_EQ(result.surveyUsed, "ls-dr10");
    EXPECT_EQ(result.attempts[0].tries, 2);
}

TEST_F(FallbackFetcherTest, EveryAttemptFailingOnTheWireIsNetworkError) {
    EXPECT_CALL(*cutouts_, fetchCutout(_, _))
        .WillRepeatedly(Return(cutoutNetworkError("connection refused")));

    auto result = fetcher_->fetchOne("30.0 -80.0");
    EXPECT_EQ(result.status, FetchStatus::NetworkError);
    EXPECT_FALSE(result.surveyUsed.has_value());
    EXPECT_NE(result.error.find("connection refused"), std::string::npos);
}

TEST_F(FallbackFetcherTest, ExplicitCoveringSurveyKeepsBlankImage) {
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("sdss"), _))
        .WillOnce(Return(makeBlank()));

    FetchOptions options;
    options.survey = "sdss";
    auto result = fetcher_->fetchOne("150.0 2.2", options);
    EXPECT_EQ(result.status, FetchStatus::Blank);
    EXPECT_EQ(result.surveyUsed, "sdss");
    EXPECT_TRUE(result.hasImage());
}

TEST_F(FallbackFetcherTest, ExplicitUncoveredSurveyFallsBack) {
    InSequence seq;
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("sdss"), _))
        .WillOnce(Return(makeBlank()));
    EXPECT_CALL(*cutouts_, fetchCutout(SurveyIs("unwise-neo7"), _))
        .WillOnce(Return(makeStarField()));

    FetchOptions options;
    options.survey = "sdss";
    auto result = fetcher_->fetchOne("30.0 -80.0", options);
    EXPECT_EQ(result.status, FetchStatus::Success);
    EXPECT_EQ(result.surveyUsed, "unwise-neo7");
}

TEST_F(FallbackFetcherTest, NamesGoThroughResolver) {
    EXPECT_CALL(*backend_, resolveName("NGC 788"))
        .WillOnce(Return(ResolvedCoordinate{30.2769, -6.8155}));
    EXPECT_CALL(*cutouts_,
                fetchCutout(SurveyIs("ls-dr10"),
                            AllOf(Field(&CutoutRequest::ra, 30.2769),
                                  Field(&CutoutRequest::dec, -6.8155))))
        .WillOnce(Return(makeStarField()));

    auto result = fetcher_->fetchOne("NGC 788");
    EXPECT_EQ(result.status, FetchStatus::Success);
    ASSERT_TRUE(result.coordinate.has_value());
    EXPECT_DOUBLE_EQ(result.coordinate->ra, 30.2769);
    EXPECT_TRUE(result.target.isName());
}

TEST_F(FallbackFetcherTest, UnresolvableNameSkipsImageRequests) {
    EXPECT_CALL(*backend_, resolveName(_))
        .WillOnce(Return(std::unexpected(skyfetch::resolver::ResolutionError{
            skyfetch::resolver::ResolutionError::Code::NotFound,
            "nothing found"})));
    EXPECT_CALL(*cutouts_, fetchCutout(_, _)).Times(0);

    auto result = fetcher_->fetchOne("Not A Galaxy");
    EXPECT_EQ(result.status, FetchStatus::ResolutionFailed);
    EXPECT_FALSE(result.coordinate.has_value());
    EXPECT_FALSE(result.error.empty());
}

TEST_F(FallbackFetcherTest, OutOfRangeCoordinatesAreResolutionFailures) {
    EXPECT_CALL(*cutouts_, fetchCutout(_, _)).Times(0);
    auto result = fetcher_->fetchOne("400.0 10.0");
    EXPECT_EQ(result.status, FetchStatus::ResolutionFailed);
    EXPECT_EQ(result.target.token, "400.0 10.0");
}

TEST_F(FallbackFetcherTest, PrebuiltCoordinateTargetsAreRangeChecked) {
    EXPECT_CALL(*cutouts_, fetchCutout(_, _)).Times(0);
    EXPECT_CALL(*backend_, resolveName(_)).Times(0);

    using skyfetch::target::Target;
    for (const auto& target :
         {Target::fromCoordinate(400.0, 95.0, "far away"),
          Target::fromCoordinate(10.0, -91.0, "below the pole"),
          Target::fromCoordinate(std::numeric_limits<double>::quiet_NaN(),
                                 0.0, "not a number")}) {
        auto result = fetcher_->fetchOne(target);
        EXPECT_EQ(result.status, FetchStatus::ResolutionFailed)
            << target.token;
        EXPECT_FALSE(result.coordinate.has_value()) << target.token;
        EXPECT_FALSE(result.error.empty()) << target.token;
        EXPECT_EQ(result.target.token, target.token);
    }
}

TEST_F(FallbackFetcherTest, SizeDerivedFromFovAndCapped) {
    const auto& ls = catalog_->at("ls-dr10");

    FetchOptions options;
    options.fovArcmin = 2.0;
    EXPECT_EQ(FallbackFetcher::sizeFor(ls, options), 458);

    options.maxSizePx = 300;
    EXPECT_EQ(FallbackFetcher::sizeFor(ls, options), 300);

    options.sizePx = 400;
    EXPECT_EQ(FallbackFetcher::sizeFor(ls, options), 400);

    options.sizePx = 5000;
    EXPECT_EQ(FallbackFetcher::sizeFor(ls, options), ls.maxSize);
}

TEST_F(FallbackFetcherTest, InvalidOptionsThrowBeforeAnyWork) {
    EXPECT_CALL(*cutouts_, fetchCutout(_, _)).Times(0);
    EXPECT_CALL(*backend_, resolveName(_)).Times(0);

    FetchOptions badFov;
    badFov.fovArcmin = 0.0;
    EXPECT_THROW((void)fetcher_->fetchOne("M31", badFov),
                 skyfetch::InvalidConfigurationError);

    FetchOptions badSize;
    badSize.sizePx = -1;
    EXPECT_THROW((void)fetcher_->fetchOne("M31", badSize),
                 skyfetch::InvalidConfigurationError);

    FetchOptions infiniteFov;
    infiniteFov.fovArcmin = std::numeric_limits<double>::infinity();
    EXPECT_THROW((void)fetcher_->fetchOne("M31", infiniteFov),
                 skyfetch::InvalidConfigurationError);

    FetchOptions nanFov;
    nanFov.fovArcmin = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW((void)fetcher_->fetchOne("M31", nanFov),
                 skyfetch::InvalidConfigurationError);

    FetchOptions nanScale;
    nanScale.pixscale = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW((void)fetcher_->fetchOne("M31", nanScale),
                 skyfetch::InvalidConfigurationError);

    FetchOptions unknown;
    unknown.survey = "hubble";
    EXPECT_THROW((void)fetcher_->fetchOne("M31", unknown),
                 skyfetch::UnknownSurveyError);
}
