#ifndef NEAREST_POINT_LOCATOR_HPP
#define NEAREST_POINT_LOCATOR_HPP

#include "GSMP.hpp"
#include "CoordinateSystem.hpp"

#include <nanoflann.hpp>

#include <array>
#include <memory>
#include <vector>

namespace GSMP {

/**
 * @brief Great-circle nearest-neighbour search over ground-parameter points
 *
 * Points are placed on the unit sphere and indexed with a nanoflann k-d
 * tree; the Euclidean (chord) nearest neighbour on the sphere is the
 * great-circle nearest neighbour. Candidates within a hair of the best
 * chord are re-ranked by haversine distance and load order, so exact ties
 * always go to the earliest-loaded point.
 *
 * Below kExhaustiveScanThreshold points the tree is not built and queries
 * scan every point.
 *
 * Queries are const and share no mutable state; one locator can serve any
 * number of concurrent readers.
 */
class NearestPointLocator {
public:
    // Point count under which the exhaustive scan is used
    static constexpr std::size_t kExhaustiveScanThreshold = 32;

    struct Match {
        std::size_t index;          // Position in the point collection
        double distance_km;
    };

    /**
     * @throws NoPointsAvailableError if points is empty
     */
    explicit NearestPointLocator(const std::vector<GroundParameterPoint>& points);
    ~NearestPointLocator();

    // The k-d tree refers to the owned point cloud
    NearestPointLocator(const NearestPointLocator&) = delete;
    NearestPointLocator& operator=(const NearestPointLocator&) = delete;

    Match nearest(double lon, double lat) const;

    // Reference search over every point
    Match nearestExhaustive(double lon, double lat) const;

    bool usesIndex() const { return static_cast<bool>(index_); }
    std::size_t size() const { return lonlat_.size(); }

private:
    // nanoflann dataset adaptor over unit-sphere coordinates
    struct PointCloud {
        std::vector<std::array<double, 3>> xyz;

        inline std::size_t kdtree_get_point_count() const { return xyz.size(); }

        inline double kdtree_get_pt(const std::size_t idx, const std::size_t dim) const {
            return xyz[idx][dim];
        }

        template <class BBOX>
        bool kdtree_get_bbox(BBOX&) const { return false; }
    };

    using KDTree = nanoflann::KDTreeSingleIndexAdaptor<
        nanoflann::L2_Simple_Adaptor<double, PointCloud, double, std::size_t>,
        PointCloud,
        3,
        std::size_t>;

    std::vector<GeoPoint> lonlat_;
    PointCloud cloud_;
    std::unique_ptr<KDTree> index_;
};

} // namespace GSMP

#endif // NEAREST_POINT_LOCATOR_HPP
