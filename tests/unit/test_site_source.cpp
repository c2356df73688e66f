/**
 * @file test_site_source.cpp
 * @brief Unit tests for deduplicated and gridded target sites
 */

#include <gtest/gtest.h>
#include "SiteSource.hpp"
#include "SiteModelErrors.hpp"
#include <cmath>
#include <set>

using namespace GSMP;

namespace {

// Square exposure of side_km km with n x n assets, lower-left at (lon0, lat0)
SiteSourceBuilder squareExposure(double lon0, double lat0, double side_km, int n) {
    const double lat_span = side_km / Geodetic::kmPerDegree();
    const double lon_span = lat_span / std::cos(Geodetic::deg2rad(lat0 + lat_span / 2.0));

    SiteSourceBuilder builder;
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < n; ++j) {
            builder.addLocation(lon0 + lon_span * i / (n - 1),
                                lat0 + lat_span * j / (n - 1));
        }
    }
    return builder;
}

} // namespace

TEST(SiteSourceTest, DeduplicatesExactCoordinates) {
    SiteSourceBuilder builder;
    builder.addLocation(10.0, 45.0);
    builder.addLocation(10.1, 45.0);
    builder.addLocation(10.0, 45.0);
    builder.addLocation(10.0, 45.000000000000007);   // Next double, kept
    builder.addLocation(10.1, 45.0);

    auto targets = builder.buildDeduplicated();
    ASSERT_EQ(targets.size(), 3u);

    // First-seen order, position identifiers
    EXPECT_EQ(targets[0].id, "0");
    EXPECT_DOUBLE_EQ(targets[0].lon, 10.0);
    EXPECT_EQ(targets[1].id, "1");
    EXPECT_DOUBLE_EQ(targets[1].lon, 10.1);
    EXPECT_EQ(targets[2].id, "2");
    EXPECT_NE(targets[2].lat, 45.0);
}

TEST(SiteSourceTest, NegativeZeroMatchesZero) {
    SiteSourceBuilder builder;
    builder.addLocation(0.0, 10.0);
    builder.addLocation(-0.0, 10.0);
    EXPECT_EQ(builder.buildDeduplicated().size(), 1u);
}

TEST(SiteSourceTest, ExplicitIdentifiersKept) {
    SiteSourceBuilder builder;
    builder.addLocations({{10.0, 45.0, "site_a"}, {10.0, 45.0, "site_b"}, {11.0, 45.0, ""}});

    auto targets = builder.build(0.0);
    ASSERT_EQ(targets.size(), 2u);
    EXPECT_EQ(targets[0].id, "site_a");
    EXPECT_EQ(targets[1].id, "1");
    EXPECT_EQ(builder.getLocationCount(), 3u);
}

TEST(SiteSourceTest, CoordinatesPreservedExactly) {
    const double lon = 10.123456789012345;
    const double lat = -33.987654321098765;

    SiteSourceBuilder builder;
    builder.addLocation(lon, lat);
    auto targets = builder.build(0.0);
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0].lon, lon);
    EXPECT_EQ(targets[0].lat, lat);
}

TEST(SiteSourceTest, NoLocationsIsEmptyInput) {
    SiteSourceBuilder builder;
    EXPECT_THROW(builder.build(0.0), EmptyInputError);
    EXPECT_THROW(builder.build(10.0), EmptyInputError);
}

TEST(GridSpecTest, CellSizeAndMargin) {
    GeoBounds bounds;
    bounds.expand(10.0, 45.0);
    bounds.expand(10.0, 45.0);

    GridSpec grid = GridSpec::fromExtent(bounds, 10.0);
    EXPECT_EQ(grid.n_lon, 1u);
    EXPECT_EQ(grid.n_lat, 1u);
    EXPECT_EQ(grid.nx(), 3u);
    EXPECT_NEAR(grid.dlat * Geodetic::kmPerDegree(), 10.0, 1e-9);
    EXPECT_NEAR(grid.dlon, grid.dlat / std::cos(Geodetic::deg2rad(45.0)), 1e-12);

    // The single interior cell is centered on the point
    const std::size_t idx = grid.cellIndex(10.0, 45.0);
    EXPECT_EQ(idx, grid.nx() + 1);
    GeoPoint c = grid.cellCentroid(idx);
    EXPECT_NEAR(c.x, 10.0, 1e-12);
    EXPECT_NEAR(c.y, 45.0, 1e-12);
}

TEST(GridSpecTest, InvalidSpacing) {
    GeoBounds bounds;
    bounds.expand(10.0, 45.0);
    EXPECT_THROW(GridSpec::fromExtent(bounds, 0.0), ConfigurationError);
    EXPECT_THROW(GridSpec::fromExtent(bounds, -5.0), ConfigurationError);
    EXPECT_THROW(GridSpec::fromExtent(GeoBounds(), 5.0), ConfigurationError);
}

TEST(GridSpecTest, UpperEdgeBelongsToLastCell) {
    GeoBounds bounds;
    bounds.expand(10.0, 45.0);
    bounds.expand(11.0, 46.0);

    GridSpec grid = GridSpec::fromExtent(bounds, 20.0);
    const std::size_t upper = grid.cellIndex(11.0, 46.0);
    EXPECT_EQ(upper % grid.nx(), grid.n_lon);
    EXPECT_EQ(upper / grid.nx(), grid.n_lat);

    const std::size_t lower = grid.cellIndex(10.0, 45.0);
    EXPECT_EQ(lower % grid.nx(), 1u);
    EXPECT_EQ(lower / grid.nx(), 1u);
}

TEST(SiteSourceTest, GridOverFiftyKmExposure) {
    SiteSourceBuilder builder = squareExposure(10.0, 45.0, 50.0, 21);
    const GeoBounds& bounds = builder.getBounds();

    auto targets = builder.build(10.0);
    EXPECT_GE(targets.size(), 1u);
    EXPECT_LE(targets.size(), 25u);

    std::set<std::string> ids;
    for (const auto& t : targets) {
        EXPECT_TRUE(bounds.contains(t.lon, t.lat))
            << "centroid " << t.lon << ", " << t.lat << " outside extent";
        ids.insert(t.id);
    }
    EXPECT_EQ(ids.size(), targets.size());
}

TEST(SiteSourceTest, GridTargetsOrderedByCellIndex) {
    SiteSourceBuilder builder = squareExposure(-120.0, 35.0, 30.0, 7);
    auto targets = builder.buildGrid(5.0);
    ASSERT_GT(targets.size(), 1u);

    for (std::size_t i = 1; i < targets.size(); ++i) {
        EXPECT_LT(std::stoul(targets[i - 1].id), std::stoul(targets[i].id));
    }
}

TEST(SiteSourceTest, GridShapeIsIdempotent) {
    SiteSourceBuilder builder = squareExposure(10.0, 45.0, 50.0, 11);
    auto first = builder.build(10.0);
    auto second = builder.build(10.0);

    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].id, second[i].id);
        EXPECT_EQ(first[i].lon, second[i].lon);
        EXPECT_EQ(first[i].lat, second[i].lat);
    }
}

TEST(SiteSourceTest, GridMergesNearbyLocations) {
    SiteSourceBuilder builder;
    builder.addLocation(10.0, 45.0);
    builder.addLocation(10.001, 45.001);
    builder.addLocation(10.002, 45.0);

    auto targets = builder.build(50.0);
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_TRUE(builder.getBounds().contains(targets[0].lon, targets[0].lat));
}
