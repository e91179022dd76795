#include "math_util.h"

#include <cmath>
#include <limits>

#include <gtest/gtest.h>

TEST(MathUtil, normalizeHeadingWraps) {
	using floorscan::normalizeHeading;

	EXPECT_FLOAT_EQ(0, *normalizeHeading(0));
	EXPECT_FLOAT_EQ(359.5, *normalizeHeading(359.5));
	EXPECT_FLOAT_EQ(0, *normalizeHeading(360));
	EXPECT_FLOAT_EQ(10, *normalizeHeading(370));
	EXPECT_FLOAT_EQ(350, *normalizeHeading(-10));
	EXPECT_FLOAT_EQ(90, *normalizeHeading(-270));
}

TEST(MathUtil, normalizeHeadingRejectsNonFinite) {
	using floorscan::normalizeHeading;

	EXPECT_FALSE(normalizeHeading(std::numeric_limits<float>::quiet_NaN()));
	EXPECT_FALSE(normalizeHeading(std::numeric_limits<float>::infinity()));
}

TEST(MathUtil, compassDirectionExamples) {
	using floorscan::compassDirection;

	EXPECT_EQ("N", compassDirection(0));
	EXPECT_EQ("N", compassDirection(22));
	EXPECT_EQ("NE", compassDirection(23));
	EXPECT_EQ("E", compassDirection(90));
	EXPECT_EQ("S", compassDirection(180));
	EXPECT_EQ("W", compassDirection(270));
	EXPECT_EQ("NW", compassDirection(315));
	// Wraps back to north near 360.
	EXPECT_EQ("N", compassDirection(350));
	EXPECT_EQ("N", compassDirection(-5));
}

TEST(MathUtil, degToRad) {
	EXPECT_NEAR(floorscan::pi / 6, floorscan::deg_to_rad(30), 1e-9);
}
