/**
 * @file test_coordinate_system.cpp
 * @brief Unit tests for geodetic utilities and PROJ transforms
 */

#include <gtest/gtest.h>
#include "CoordinateSystem.hpp"
#include "GSMP.hpp"
#include <cmath>

using namespace GSMP;

TEST(GeodeticTest, HaversineZeroForSamePoint) {
    EXPECT_DOUBLE_EQ(Geodetic::haversineDistance(10.0, 45.0, 10.0, 45.0), 0.0);
}

TEST(GeodeticTest, HaversineOneDegreeOfLatitude) {
    double d = Geodetic::haversineDistance(0.0, 0.0, 0.0, 1.0);
    EXPECT_NEAR(d, Geodetic::kmPerDegree(), 1e-9);
    EXPECT_NEAR(d, 111.19, 0.01);
}

TEST(GeodeticTest, HaversineHalfDegreeEastAt45North) {
    double d = Geodetic::haversineDistance(10.0, 45.0, 10.5, 45.0);
    EXPECT_NEAR(d, 39.3, 0.1);
}

TEST(GeodeticTest, HaversineIsSymmetric) {
    double a = Geodetic::haversineDistance(-122.4, 37.8, 139.7, 35.7);
    double b = Geodetic::haversineDistance(139.7, 35.7, -122.4, 37.8);
    EXPECT_DOUBLE_EQ(a, b);
}

TEST(GeodeticTest, HaversineAntipodes) {
    double d = Geodetic::haversineDistance(0.0, 0.0, 180.0, 0.0);
    EXPECT_NEAR(d, M_PI * EARTH_RADIUS_KM, 1e-6);
}

TEST(GeodeticTest, UnitSpherePoints) {
    auto a = Geodetic::toUnitSphere(10.0, 45.0);
    EXPECT_NEAR(a[0] * a[0] + a[1] * a[1] + a[2] * a[2], 1.0, 1e-12);

    auto pole = Geodetic::toUnitSphere(123.0, 90.0);
    EXPECT_NEAR(pole[2], 1.0, 1e-12);

    auto origin = Geodetic::toUnitSphere(0.0, 0.0);
    EXPECT_NEAR(origin[0], 1.0, 1e-12);
}

TEST(GeoBoundsTest, ExpandAndCenter) {
    GeoBounds b;
    EXPECT_TRUE(b.empty);

    b.expand(10.0, 45.0);
    b.expand(12.0, 44.0);
    b.expand(11.0, 46.0);

    EXPECT_FALSE(b.empty);
    EXPECT_DOUBLE_EQ(b.getLonSpan(), 2.0);
    EXPECT_DOUBLE_EQ(b.getLatSpan(), 2.0);
    EXPECT_DOUBLE_EQ(b.getCenter().x, 11.0);
    EXPECT_DOUBLE_EQ(b.getCenter().y, 45.0);
    EXPECT_TRUE(b.contains(11.0, 45.0));
    EXPECT_FALSE(b.contains(9.0, 45.0));
}

TEST(CRSDefinitionTest, GeographicWGS84) {
    EXPECT_TRUE(CRSDefinition("EPSG:4326").isGeographicWGS84());
    EXPECT_TRUE(CRSDefinition("4326").isGeographicWGS84());
    EXPECT_FALSE(CRSDefinition("EPSG:32633").isGeographicWGS84());
}

TEST(CRSDefinitionTest, AuthorityNameIgnoresCase) {
    EXPECT_TRUE(CRSDefinition("epsg:4326").isGeographicWGS84());
    EXPECT_TRUE(CRSDefinition("Epsg:4326").isGeographicWGS84());
    EXPECT_TRUE(CRSDefinition("ogc:crs84").isGeographicWGS84());
    EXPECT_FALSE(CRSDefinition("epsg:32633").isGeographicWGS84());
}

TEST(CoordinateTransformerTest, UninitializedTransformFails) {
    CoordinateTransformer t;
    EXPECT_FALSE(t.isValid());

    double x = 1.0, y = 2.0;
    EXPECT_FALSE(t.transform(&x, &y, 1));
    EXPECT_FALSE(t.getLastError().empty());
}

TEST(CoordinateTransformerTest, MissingSourceCRS) {
    CoordinateTransformer t;
    t.setTargetCRS(CRS::WGS84);
    EXPECT_FALSE(t.initialize());
    EXPECT_FALSE(t.getLastError().empty());
}

TEST(CoordinateTransformerTest, UTMToWGS84) {
    CoordinateTransformer t;
    t.setSourceCRS("32633");
    t.setTargetCRS(CRS::WGS84);
    ASSERT_TRUE(t.initialize()) << t.getLastError();

    // Central meridian of UTM zone 33N
    GeoPoint p = t.transform(GeoPoint(500000.0, 4982950.0));
    EXPECT_NEAR(p.x, 15.0, 1e-6);
    EXPECT_NEAR(p.y, 45.0, 1e-3);

    double x[2] = {500000.0, 500000.0};
    double y[2] = {4982950.0, 0.0};
    ASSERT_TRUE(t.transform(x, y, 2)) << t.getLastError();
    EXPECT_NEAR(x[1], 15.0, 1e-6);
    EXPECT_NEAR(y[1], 0.0, 1e-6);
}

TEST(CoordinateTransformerTest, MoveKeepsTransform) {
    CoordinateTransformer t;
    t.setSourceCRS("EPSG:32633");
    t.setTargetCRS(CRS::WGS84);
    ASSERT_TRUE(t.initialize());

    CoordinateTransformer moved(std::move(t));
    EXPECT_TRUE(moved.isValid());
    EXPECT_FALSE(t.isValid());
    EXPECT_FALSE(CoordinateTransformer::getProjVersion().empty());
}
