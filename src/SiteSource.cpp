#include "SiteSource.hpp"
#include "SiteModelErrors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <map>
#include <unordered_set>

namespace GSMP {

namespace {

// Exact coordinate key; -0.0 folds onto 0.0 so equal values share a key
struct CoordinateKey {
    std::uint64_t lon_bits;
    std::uint64_t lat_bits;

    bool operator==(const CoordinateKey& other) const {
        return lon_bits == other.lon_bits && lat_bits == other.lat_bits;
    }
};

struct CoordinateKeyHash {
    std::size_t operator()(const CoordinateKey& k) const {
        std::uint64_t h = k.lon_bits * 0x9E3779B97F4A7C15ULL;
        h ^= k.lat_bits + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
        return static_cast<std::size_t>(h);
    }
};

std::uint64_t bitsOf(double v) {
    if (v == 0.0) v = 0.0;
    std::uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

// Smallest positive cosine used for the longitude step (about 89.9 degrees)
constexpr double MIN_LATITUDE_SCALE = 1.0e-3;

} // namespace

// =============================================================================
// GridSpec
// =============================================================================

GridSpec GridSpec::fromExtent(const GeoBounds& bounds, double spacing_km) {
    if (!(spacing_km > 0.0) || !std::isfinite(spacing_km)) {
        throw ConfigurationError("Grid spacing must be a positive number of km");
    }
    if (bounds.empty) {
        throw ConfigurationError("Cannot build a grid over an empty extent");
    }

    GridSpec grid;
    grid.spacing_km = spacing_km;

    const GeoPoint center = bounds.getCenter();
    const double scale = std::max(MIN_LATITUDE_SCALE,
                                  std::cos(Geodetic::deg2rad(center.y)));

    grid.dlat = spacing_km / Geodetic::kmPerDegree();
    grid.dlon = grid.dlat / scale;

    // Relative slack keeps an extent of exactly k cells at k cells
    const double lon_cells = std::ceil(bounds.getLonSpan() / grid.dlon - 1.0e-9);
    const double lat_cells = std::ceil(bounds.getLatSpan() / grid.dlat - 1.0e-9);
    grid.n_lon = static_cast<std::size_t>(std::max(1.0, lon_cells));
    grid.n_lat = static_cast<std::size_t>(std::max(1.0, lat_cells));

    grid.origin_lon = center.x - (grid.n_lon / 2.0 + 1.0) * grid.dlon;
    grid.origin_lat = center.y - (grid.n_lat / 2.0 + 1.0) * grid.dlat;

    return grid;
}

std::size_t GridSpec::cellIndex(double lon, double lat) const {
    const double fx = std::floor((lon - origin_lon) / dlon);
    const double fy = std::floor((lat - origin_lat) / dlat);

    const double ix = std::min(std::max(fx, 1.0), static_cast<double>(n_lon));
    const double iy = std::min(std::max(fy, 1.0), static_cast<double>(n_lat));

    return static_cast<std::size_t>(iy) * nx() + static_cast<std::size_t>(ix);
}

GeoPoint GridSpec::cellCentroid(std::size_t index) const {
    const std::size_t ix = index % nx();
    const std::size_t iy = index / nx();
    return GeoPoint(origin_lon + (ix + 0.5) * dlon,
                    origin_lat + (iy + 0.5) * dlat);
}

// =============================================================================
// SiteSourceBuilder
// =============================================================================

void SiteSourceBuilder::addLocation(double lon, double lat, const std::string& id) {
    LocationRecord rec;
    rec.lon = lon;
    rec.lat = lat;
    rec.id = id;
    locations_.push_back(rec);
    bounds_.expand(lon, lat);
}

void SiteSourceBuilder::addLocations(const std::vector<LocationRecord>& records) {
    locations_.reserve(locations_.size() + records.size());
    for (const auto& rec : records) {
        addLocation(rec.lon, rec.lat, rec.id);
    }
}

std::vector<TargetSite> SiteSourceBuilder::buildDeduplicated() const {
    std::vector<TargetSite> targets;
    std::unordered_set<CoordinateKey, CoordinateKeyHash> seen;
    seen.reserve(locations_.size());

    for (const auto& loc : locations_) {
        CoordinateKey key{bitsOf(loc.lon), bitsOf(loc.lat)};
        if (!seen.insert(key).second) continue;

        TargetSite site;
        site.id = loc.id.empty() ? std::to_string(targets.size()) : loc.id;
        site.lon = loc.lon;
        site.lat = loc.lat;
        targets.push_back(site);
    }

    return targets;
}

std::vector<TargetSite> SiteSourceBuilder::buildGrid(double spacing_km) const {
    std::vector<TargetSite> targets;
    if (locations_.empty()) return targets;

    const GridSpec grid = GridSpec::fromExtent(bounds_, spacing_km);

    // Ordered by cell index; the value counts contributing locations
    std::map<std::size_t, std::size_t> cells;
    for (const auto& loc : locations_) {
        cells[grid.cellIndex(loc.lon, loc.lat)]++;
    }

    targets.reserve(cells.size());
    for (const auto& cell : cells) {
        const GeoPoint c = grid.cellCentroid(cell.first);
        TargetSite site;
        site.id = std::to_string(cell.first);
        site.lon = c.x;
        site.lat = c.y;
        targets.push_back(site);
    }

    return targets;
}

std::vector<TargetSite> SiteSourceBuilder::build(double grid_spacing_km) const {
    if (locations_.empty()) {
        throw EmptyInputError("No asset or site locations to build target sites from");
    }

    std::vector<TargetSite> targets = grid_spacing_km > 0.0
        ? buildGrid(grid_spacing_km)
        : buildDeduplicated();

    if (targets.empty()) {
        throw EmptyInputError("No target sites could be constructed");
    }
    return targets;
}

} // namespace GSMP
