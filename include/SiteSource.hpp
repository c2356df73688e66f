#ifndef SITE_SOURCE_HPP
#define SITE_SOURCE_HPP

#include "GSMP.hpp"
#include "CoordinateSystem.hpp"
#include <string>
#include <vector>

namespace GSMP {

/**
 * @brief Regular longitude/latitude lattice used in grid mode
 *
 * Cells are spacing_km on a side: the latitude step is spacing_km / 111.19
 * degrees and the longitude step is scaled by 1 / cos(mid-latitude) of the
 * data extent. The lattice is centered on the extent and has a one-cell
 * margin on every side, so interior cells have indices 1..n_lon and
 * 1..n_lat and the margin cells never hold data.
 */
struct GridSpec {
    double spacing_km = 0.0;
    double origin_lon = 0.0;        // Lower-left corner of cell (0, 0)
    double origin_lat = 0.0;
    double dlon = 0.0;              // Cell size (degrees)
    double dlat = 0.0;
    std::size_t n_lon = 0;          // Interior cells per axis
    std::size_t n_lat = 0;

    std::size_t nx() const { return n_lon + 2; }
    std::size_t ny() const { return n_lat + 2; }

    /**
     * @brief Build the lattice covering an extent
     * @throws ConfigurationError if spacing_km is not positive or bounds are empty
     */
    static GridSpec fromExtent(const GeoBounds& bounds, double spacing_km);

    // Row-major index of the cell holding a coordinate inside the extent.
    // The upper extent edge belongs to the last interior cell.
    std::size_t cellIndex(double lon, double lat) const;

    GeoPoint cellCentroid(std::size_t index) const;
};

/**
 * @brief Builds the target sites of a run from asset and site locations
 *
 * Locations are accumulated from any number of sources; build() then emits
 * targets either one per distinct coordinate or one per non-empty grid cell.
 */
class SiteSourceBuilder {
public:
    SiteSourceBuilder() = default;

    void addLocation(double lon, double lat, const std::string& id = "");
    void addLocations(const std::vector<LocationRecord>& records);

    std::size_t getLocationCount() const { return locations_.size(); }
    const GeoBounds& getBounds() const { return bounds_; }

    /**
     * @brief One target per distinct (lon, lat), in first-seen order
     *
     * Coordinates are compared exactly, with no tolerance. The identifier is
     * the explicit id of the first occurrence, else its position in the
     * output.
     */
    std::vector<TargetSite> buildDeduplicated() const;

    /**
     * @brief One target per non-empty lattice cell, at the cell centroid
     *
     * Targets are ordered by cell index and identified by it.
     */
    std::vector<TargetSite> buildGrid(double spacing_km) const;

    /**
     * @brief Select the mode from the spacing (0 = deduplicated)
     * @throws EmptyInputError if no target can be built
     */
    std::vector<TargetSite> build(double grid_spacing_km) const;

private:
    std::vector<LocationRecord> locations_;
    GeoBounds bounds_;
};

} // namespace GSMP

#endif // SITE_SOURCE_HPP
