// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>

#include "exception/exception.hpp"
#include "mocks/mock_services.hpp"
#include "service/skyfetch_service.hpp"

using namespace skyfetch::service;
using skyfetch::config::SkyFetchConfig;
using skyfetch::fetch::FetchOptions;
using skyfetch::fetch::FetchStatus;
using skyfetch::survey::CutoutRequest;
using skyfetch::target::ResolvedCoordinate;
using skyfetch::tests::makeStarField;
using skyfetch::tests::MockCutoutService;
using skyfetch::tests::MockResolutionBackend;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;

class SkyFetchServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<MockResolutionBackend>();
        cutouts_ = std::make_shared<MockCutoutService>();
        ON_CALL(*backend_, name()).WillByDefault(Return("mock"));
        config_.resolverRetries = 0;
        config_.fetchRetries = 0;
        config_.workerCount = 2;
    }

    auto makeService() -> SkyFetchService {
        return SkyFetchService(config_, backend_, cutouts_);
    }

    std::shared_ptr<MockResolutionBackend> backend_;
    std::shared_ptr<MockCutoutService> cutouts_;
    SkyFetchConfig config_;
};

TEST_F(SkyFetchServiceTest, FetchOneUsesConfiguredDefaults) {
    config_.surveyId = "sdss";
    config_.sizePx = 300;
    auto service = makeService();

    EXPECT_CALL(*cutouts_,
                fetchCutout(Field(&skyfetch::survey::SurveyDescriptor::id, "sdss"),
                            Field(&CutoutRequest::sizePx, 300)))
        .WillOnce(Return(makeStarField()));

    auto result = service.fetchOne("150.0 2.2");
    EXPECT_EQ(result.status, FetchStatus::Success);
    EXPECT_EQ(result.surveyUsed, "sdss");
}

TEST_F(SkyFetchServiceTest, ExplicitOptionsOverrideDefaults) {
    auto service = makeService();
    FetchOptions options;
    options.survey = "galex";
    options.sizePx = 64;

    EXPECT_CALL(*cutouts_, fetchCutout(_, Field(&CutoutRequest::sizePx, 64)))
        .WillOnce(Return(makeStarField()));

    auto result = service.fetchOne("150.0 2.2", options);
    EXPECT_EQ(result.surveyUsed, "galex");
}

TEST_F(SkyFetchServiceTest, BatchCapsDerivedSizes) {
    config_.fovArcmin = 10.0;
    auto service = makeService();

    EXPECT_CALL(*cutouts_, fetchCutout(_, Field(&CutoutRequest::sizePx, 512)))
        .Times(2)
        .WillRepeatedly(Return(makeStarField()));

    auto results = service.fetchMany(
        std::vector<std::string>{"150.0 2.2", "10.68 41.27"});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].isSuccess());
    EXPECT_TRUE(results[1].isSuccess());
}

TEST_F(SkyFetchServiceTest, BatchReportsProgress) {
    auto service = makeService();
    EXPECT_CALL(*cutouts_, fetchCutout(_, _))
        .WillRepeatedly(Return(makeStarField()));

    std::atomic<size_t> calls{0};
    auto results = service.fetchMany(
        std::vector<std::string>{"1 1", "2 2", "3 3"}, std::nullopt, 3,
        [&calls](size_t, size_t total, const skyfetch::fetch::FetchResult&) {
            EXPECT_EQ(total, 3u);
            ++calls;
        });
    EXPECT_EQ(results.size(), 3u);
    EXPECT_EQ(calls.load(), 3u);
}

TEST_F(SkyFetchServiceTest, ResolveSharesCacheAcrossCalls) {
    auto service = makeService();
    EXPECT_CALL(*backend_, resolveName("M31"))
        .Times(1)
        .WillOnce(Return(ResolvedCoordinate{10.6847, 41.2690}));
    EXPECT_CALL(*cutouts_, fetchCutout(_, _))
        .WillOnce(Return(makeStarField()));

    auto coord = service.resolve("M31");
    EXPECT_DOUBLE_EQ(coord.ra, 10.6847);

    auto result = service.fetchOne("M31");
    EXPECT_TRUE(result.isSuccess());

    auto stats = service.cacheStats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.entries, 1u);
}

TEST_F(SkyFetchServiceTest, UnresolvableNameThrowsFromResolve) {
    auto service = makeService();
    EXPECT_CALL(*backend_, resolveName(_))
        .WillOnce(Return(std::unexpected(skyfetch::resolver::ResolutionError{
            skyfetch::resolver::ResolutionError::Code::NotFound, "unknown"})));
    EXPECT_THROW((void)service.resolve("Nowhere 1"),
                 skyfetch::NameResolutionError);
}

TEST_F(SkyFetchServiceTest, ExposesCatalogAndConfig) {
    auto service = makeService();
    EXPECT_EQ(service.catalog().size(), 7u);
    EXPECT_EQ(service.catalog().descriptors().front().id, "ls-dr10");
    EXPECT_EQ(service.config().workerCount, 2u);
}

TEST_F(SkyFetchServiceTest, InvalidSetupRejected) {
    config_.surveyId = "hubble";
    EXPECT_THROW(SkyFetchService(config_, backend_, cutouts_),
                 skyfetch::UnknownSurveyError);

    config_ = {};
    config_.cacheCapacity = 0;
    EXPECT_THROW(SkyFetchService(config_, backend_, cutouts_),
                 skyfetch::InvalidConfigurationError);

    config_ = {};
    EXPECT_THROW(SkyFetchService(config_, nullptr, cutouts_),
                 std::invalid_argument);
    EXPECT_THROW(SkyFetchService(config_, backend_, nullptr),
                 std::invalid_argument);
}

TEST_F(SkyFetchServiceTest, ServiceIsMovable) {
    auto service = makeService();
    SkyFetchService moved(std::move(service));
    EXPECT_EQ(moved.catalog().size(), 7u);
}
