#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numbers>
#include <vector>

#include "geometry.hpp"

namespace {

// Length of one degree along a great circle
const double METERS_PER_DEGREE = EARTH_RADIUS_METERS * std::numbers::pi / 180.0;

}

TEST(HaversineDistance, SamePointIsZero) {
    Coordinate p{43.65, -79.38};
    EXPECT_DOUBLE_EQ(haversineDistance(p, p), 0.0);
}

TEST(HaversineDistance, OneDegreeAlongMeridian) {
    EXPECT_NEAR(haversineDistance({0.0, 0.0}, {1.0, 0.0}), METERS_PER_DEGREE, 1e-6);
    EXPECT_NEAR(haversineDistance({45.0, 10.0}, {46.0, 10.0}), METERS_PER_DEGREE, 1e-6);
}

TEST(HaversineDistance, QuarterOfEquator) {
    EXPECT_NEAR(haversineDistance({0.0, 0.0}, {0.0, 90.0}), EARTH_RADIUS_METERS * std::numbers::pi / 2, 1e-3);
}

TEST(HaversineDistance, LongitudeDegreesShrinkTowardsPoles) {
    double atEquator = haversineDistance({0.0, 0.0}, {0.0, 1.0});
    double at60 = haversineDistance({60.0, 0.0}, {60.0, 1.0});
    EXPECT_NEAR(at60 / atEquator, 0.5, 1e-4);
}

TEST(HaversineDistance, Symmetric) {
    Coordinate a{43.6532, -79.3832};
    Coordinate b{45.5017, -73.5673};
    EXPECT_DOUBLE_EQ(haversineDistance(a, b), haversineDistance(b, a));
    // Toronto to Montreal is roughly 504 km
    EXPECT_NEAR(haversineDistance(a, b), 504000.0, 2000.0);
}

TEST(HaversineDistance, MirroredPointsAreExactlyEquidistant) {
    Coordinate seed{43.657, -79.416};
    EXPECT_EQ(haversineDistance(seed, {43.657, -79.4165}), haversineDistance(seed, {43.657, -79.4155}));
}

TEST(HaversineDistance, NaNPropagates) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(std::isnan(haversineDistance({nan, 0.0}, {1.0, 1.0})));
}

TEST(ClusterCentroid, ArithmeticMeanOfMembers) {
    std::vector<Coordinate> points{{10.0, 20.0}, {99.0, 99.0}, {12.0, 26.0}, {14.0, 20.0}};
    Coordinate c = clusterCentroid({0, 2, 3}, points);
    EXPECT_DOUBLE_EQ(c.lat, 12.0);
    EXPECT_DOUBLE_EQ(c.lng, 22.0);
}

TEST(CalculateBounds, ExtremesOfAllPoints) {
    Bounds b = calculateBounds({{43.65, -79.38}, {43.70, -79.40}, {43.60, -79.30}});
    EXPECT_DOUBLE_EQ(b.north, 43.70);
    EXPECT_DOUBLE_EQ(b.south, 43.60);
    EXPECT_DOUBLE_EQ(b.east, -79.30);
    EXPECT_DOUBLE_EQ(b.west, -79.40);
}

TEST(CalculateBounds, EmptyInputIsInvertedInfiniteBox) {
    Bounds b = calculateBounds({});
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(b.north, -inf);
    EXPECT_EQ(b.south, inf);
    EXPECT_EQ(b.east, -inf);
    EXPECT_EQ(b.west, inf);
}

TEST(CalculateBounds, NoAntimeridianWrap) {
    Bounds b = calculateBounds({{0.0, 179.0}, {0.0, -179.0}});
    EXPECT_DOUBLE_EQ(b.east, 179.0);
    EXPECT_DOUBLE_EQ(b.west, -179.0);
}

TEST(CalculateCenter, MidpointOfBox) {
    Coordinate c = calculateCenter({44.0, 43.0, -79.0, -80.0});
    EXPECT_DOUBLE_EQ(c.lat, 43.5);
    EXPECT_DOUBLE_EQ(c.lng, -79.5);
}

TEST(CalculateZoom, SinglePointUsesMaxZoom) {
    EXPECT_DOUBLE_EQ(calculateZoom({43.65, 43.65, -79.38, -79.38}, MapSize()), 18.0);
}

TEST(CalculateZoom, WholeWorldUsesMinZoom) {
    EXPECT_DOUBLE_EQ(calculateZoom({85.0, -85.0, 180.0, -180.0}, MapSize()), 0.0);
}

TEST(CalculateZoom, LongitudeSpanLimitsZoom) {
    // 400 px / 256 px / (0.01 / 360) = 56250 -> log2 = 15.78
    EXPECT_DOUBLE_EQ(calculateZoom({0.0, 0.0, 0.01, 0.0}, MapSize()), 15.0);
}

TEST(CalculateZoom, LatitudeSpanLimitsZoom) {
    // Near the equator 0.01 deg of latitude projects like 0.01 deg of longitude;
    // 600 px / 256 px / (0.01 / 360) = 84375 -> log2 = 16.36
    EXPECT_DOUBLE_EQ(calculateZoom({0.01, 0.0, 0.0, 0.0}, MapSize()), 16.0);
}

TEST(CalculateZoom, LargerViewportAllowsCloserZoom) {
    Bounds b{43.70, 43.60, -79.30, -79.40};
    double small = calculateZoom(b, {400, 600});
    double large = calculateZoom(b, {1600, 2400});
    EXPECT_DOUBLE_EQ(large, small + 2.0);
}

TEST(CalculateZoom, NaNPropagates) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(std::isnan(calculateZoom({nan, 0.0, 1.0, 0.0}, MapSize())));
}
