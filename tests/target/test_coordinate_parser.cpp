// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * SkyFetch - Survey cutout retrieval for astronomical targets
 * Copyright (C) 2024 Max Qian
 */

#include <gtest/gtest.h>

#include "exception/exception.hpp"
#include "target/coordinate_parser.hpp"

using namespace skyfetch::target;

namespace {

auto asCoordinate(const Target& t) -> Coordinate {
    EXPECT_TRUE(t.isCoordinate());
    return std::get<Coordinate>(t.value);
}

}  // namespace

TEST(CoordinateParserTest, DecimalPairWithSpace) {
    auto t = CoordinateParser::parse("150.0 2.2");
    EXPECT_EQ(asCoordinate(t), (Coordinate{150.0, 2.2}));
    EXPECT_EQ(t.token, "150.0 2.2");
}

TEST(CoordinateParserTest, DecimalPairWithComma) {
    auto t = CoordinateParser::parse("150.0, 2.2");
    EXPECT_EQ(asCoordinate(t), (Coordinate{150.0, 2.2}));
}

TEST(CoordinateParserTest, DecimalPairNegativeAndSignedDec) {
    EXPECT_EQ(asCoordinate(CoordinateParser::parse("30.28 -23.5")),
              (Coordinate{30.28, -23.5}));
    EXPECT_EQ(asCoordinate(CoordinateParser::parse("  10.68,+41.27 ")),
              (Coordinate{10.68, 41.27}));
}

TEST(CoordinateParserTest, ColonSexagesimal) {
    auto c = asCoordinate(CoordinateParser::parse("10:00:00 +02:12:00"));
    EXPECT_NEAR(c.ra, 150.0, 1e-6);
    EXPECT_NEAR(c.dec, 2.2, 1e-6);
}

TEST(CoordinateParserTest, LetterSexagesimal) {
    auto c = asCoordinate(CoordinateParser::parse("00h42m44.3s +41d16m09s"));
    EXPECT_NEAR(c.ra, 10.684583, 1e-5);
    EXPECT_NEAR(c.dec, 41.269167, 1e-5);
}

TEST(CoordinateParserTest, SpaceSeparatedSexagesimalSouth) {
    auto c = asCoordinate(CoordinateParser::parse("02 01 07.2 -23 30 00"));
    EXPECT_NEAR(c.ra, 30.28, 1e-6);
    EXPECT_NEAR(c.dec, -23.5, 1e-6);
}

TEST(CoordinateParserTest, NegativeZeroDegreesKeepsSign) {
    auto c = asCoordinate(CoordinateParser::parse("12:00:00 -00:30:00"));
    EXPECT_NEAR(c.dec, -0.5, 1e-9);
}

TEST(CoordinateParserTest, NamesPassThroughTrimmed) {
    auto t = CoordinateParser::parse("  NGC 788 ");
    ASSERT_TRUE(t.isName());
    EXPECT_EQ(std::get<RawName>(t.value), RawName{"NGC 788"});

    EXPECT_TRUE(CoordinateParser::parse("M31").isName());
    EXPECT_TRUE(CoordinateParser::parse("3C 273").isName());
    EXPECT_TRUE(CoordinateParser::parse("Abell 1689").isName());
}

TEST(CoordinateParserTest, OutOfRangeNumbersThrow) {
    EXPECT_THROW(CoordinateParser::parse("360.0 0.0"),
                 skyfetch::CoordinateParseError);
    EXPECT_THROW(CoordinateParser::parse("10.0 91.0"),
                 skyfetch::CoordinateParseError);
    EXPECT_THROW(CoordinateParser::parse("-1.0 10.0"),
                 skyfetch::CoordinateParseError);
    EXPECT_THROW(CoordinateParser::parse("24:00:00 +00:00:00"),
                 skyfetch::CoordinateParseError);
    EXPECT_THROW(CoordinateParser::parse("10:61:00 +00:00:00"),
                 skyfetch::CoordinateParseError);
}

TEST(CoordinateParserTest, EmptyInputThrows) {
    EXPECT_THROW(CoordinateParser::parse(""), skyfetch::CoordinateParseError);
    EXPECT_THROW(CoordinateParser::parse("   "),
                 skyfetch::CoordinateParseError);
}

TEST(CoordinateParserTest, BoundaryValuesAccepted) {
    EXPECT_EQ(asCoordinate(CoordinateParser::parse("0 -90")),
              (Coordinate{0.0, -90.0}));
    EXPECT_EQ(asCoordinate(CoordinateParser::parse("359.999 90")),
              (Coordinate{359.999, 90.0}));
}

TEST(CoordinateParserTest, ThreeNumbersAreNotAPair) {
    EXPECT_FALSE(CoordinateParser::parseDecimalPair("1 2 3").has_value());
}

TEST(TargetTest, CoordinateTargetsGetAPositionLabel) {
    auto t = Target::fromCoordinate(30.28, -23.5);
    EXPECT_EQ(t.token, "(30.2800, -23.5000)");
    EXPECT_EQ(t.displayName(), t.token);

    t.label = "NGC 788";
    EXPECT_EQ(t.displayName(), "NGC 788");
}
