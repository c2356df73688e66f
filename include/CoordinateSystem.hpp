#ifndef COORDINATE_SYSTEM_HPP
#define COORDINATE_SYSTEM_HPP

#include <proj.h>

#include <algorithm>
#include <string>
#include <vector>
#include <array>
#include <cmath>
#include <cstddef>

namespace GSMP {

/**
 * @brief 2D point in geographic or projected coordinates
 */
struct GeoPoint {
    double x;       ///< X coordinate (easting/longitude)
    double y;       ///< Y coordinate (northing/latitude)

    GeoPoint() : x(0), y(0) {}
    GeoPoint(double xx, double yy) : x(xx), y(yy) {}
};

/**
 * @brief Longitude/latitude bounding box grown point by point
 */
struct GeoBounds {
    double lon_min, lon_max;
    double lat_min, lat_max;
    bool empty;

    GeoBounds() : lon_min(0), lon_max(0), lat_min(0), lat_max(0), empty(true) {}

    void expand(double lon, double lat) {
        if (empty) {
            lon_min = lon_max = lon;
            lat_min = lat_max = lat;
            empty = false;
            return;
        }
        lon_min = std::min(lon_min, lon);
        lon_max = std::max(lon_max, lon);
        lat_min = std::min(lat_min, lat);
        lat_max = std::max(lat_max, lat);
    }

    double getLonSpan() const { return lon_max - lon_min; }
    double getLatSpan() const { return lat_max - lat_min; }

    GeoPoint getCenter() const {
        return GeoPoint((lon_min + lon_max) / 2, (lat_min + lat_max) / 2);
    }

    bool contains(double lon, double lat) const {
        return !empty && lon >= lon_min && lon <= lon_max &&
               lat >= lat_min && lat <= lat_max;
    }
};

/**
 * @brief Coordinate Reference System definition
 */
struct CRSDefinition {
    std::string epsg_code;      ///< EPSG code (e.g., "EPSG:4326")
    std::string proj_string;    ///< PROJ string (alternative to EPSG)

    bool isGeographicWGS84() const;

    CRSDefinition() = default;
    CRSDefinition(const std::string& epsg) : epsg_code(epsg) {}
};

/**
 * @brief Coordinate transformation between CRS using PROJ library
 *
 * Used to bring ground-parameter, asset and site coordinates supplied in a
 * projected CRS back to WGS84 longitude/latitude before association.
 *
 * Usage:
 * @code
 * CoordinateTransformer transformer;
 * transformer.setSourceCRS("EPSG:32633");
 * transformer.setTargetCRS("EPSG:4326");
 * if (!transformer.initialize()) { ... transformer.getLastError() ... }
 *
 * GeoPoint lonlat = transformer.transform(GeoPoint(500000.0, 4982950.0));
 * @endcode
 */
class CoordinateTransformer {
public:
    CoordinateTransformer();
    ~CoordinateTransformer();

    // Disable copy (PROJ handles are not copyable)
    CoordinateTransformer(const CoordinateTransformer&) = delete;
    CoordinateTransformer& operator=(const CoordinateTransformer&) = delete;

    CoordinateTransformer(CoordinateTransformer&& other) noexcept;
    CoordinateTransformer& operator=(CoordinateTransformer&& other) noexcept;

    // =========================================================================
    // CRS Configuration
    // =========================================================================

    /**
     * @brief Set source CRS by EPSG code or PROJ string
     * @param crs "EPSG:32633", "32633" or "+proj=utm +zone=33 ..."
     */
    void setSourceCRS(const std::string& crs);

    /**
     * @brief Set target CRS by EPSG code or PROJ string
     */
    void setTargetCRS(const std::string& crs);

    // =========================================================================
    // Transformation Methods
    // =========================================================================

    /**
     * @brief Build the PROJ pipeline (longitude/latitude axis order)
     * @return true if transformation is ready
     */
    bool initialize();

    /**
     * @brief Transform a single point
     * @return Transformed point; the input point on failure (see getLastError)
     */
    GeoPoint transform(const GeoPoint& point) const;

    /**
     * @brief Transform coordinate arrays in place
     * @return true if every point transformed successfully
     */
    bool transform(double* x, double* y, std::size_t n) const;

    // =========================================================================
    // Query Methods
    // =========================================================================

    bool isValid() const { return is_valid_; }
    const CRSDefinition& getSourceCRS() const { return source_crs_; }
    const CRSDefinition& getTargetCRS() const { return target_crs_; }
    const std::string& getLastError() const { return last_error_; }

    static std::string getProjVersion();

private:
    CRSDefinition source_crs_;
    CRSDefinition target_crs_;

    // PROJ handles (opaque pointers)
    PJ_CONTEXT* ctx_;
    PJ* transform_;

    bool is_valid_;
    mutable std::string last_error_;

    void cleanup();
    static CRSDefinition parseCRS(const std::string& crs);
    static std::string definitionString(const CRSDefinition& crs);
};

namespace CRS {
    const std::string WGS84 = "EPSG:4326";           ///< WGS 84 (GPS standard)
}

/**
 * @brief Spherical-earth geodetic utilities (distances in km)
 */
namespace Geodetic {
    inline double deg2rad(double degrees) {
        return degrees * M_PI / 180.0;
    }

    /**
     * @brief Great-circle distance using the Haversine formula
     * @return Distance in km on a sphere of radius EARTH_RADIUS_KM
     */
    double haversineDistance(double lon1, double lat1, double lon2, double lat2);

    /**
     * @brief Point on the unit sphere for a longitude/latitude pair
     *
     * Chord length between unit-sphere points is monotonic in great-circle
     * distance, so Euclidean nearest neighbours on these points are
     * great-circle nearest neighbours.
     */
    std::array<double, 3> toUnitSphere(double lon, double lat);

    /**
     * @brief Length of one degree of latitude (km)
     */
    double kmPerDegree();
}

} // namespace GSMP

#endif // COORDINATE_SYSTEM_HPP
