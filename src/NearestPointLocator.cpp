#include "NearestPointLocator.hpp"
#include "SiteModelErrors.hpp"
#include <limits>

namespace GSMP {

namespace {

// Squared-chord slack for collecting tie candidates. Far larger than the
// rounding of the chord computation, far smaller than any real separation
// (1e-18 in squared unit-sphere chord is about 6 mm on the ground).
constexpr double TIE_RELATIVE_SLACK = 1.0e-9;
constexpr double TIE_ABSOLUTE_SLACK = 1.0e-18;

} // namespace

NearestPointLocator::NearestPointLocator(const std::vector<GroundParameterPoint>& points) {
    if (points.empty()) {
        throw NoPointsAvailableError();
    }

    lonlat_.reserve(points.size());
    for (const auto& pt : points) {
        lonlat_.emplace_back(pt.lon, pt.lat);
    }

    if (points.size() < kExhaustiveScanThreshold) {
        return;
    }

    cloud_.xyz.reserve(points.size());
    for (const auto& pt : points) {
        cloud_.xyz.push_back(Geodetic::toUnitSphere(pt.lon, pt.lat));
    }

    index_ = std::make_unique<KDTree>(
        3, cloud_,
        nanoflann::KDTreeSingleIndexAdaptorParams(
            10, nanoflann::KDTreeSingleIndexAdaptorFlags::SkipInitialBuildIndex));
    index_->buildIndex();
}

NearestPointLocator::~NearestPointLocator() = default;

NearestPointLocator::Match NearestPointLocator::nearestExhaustive(double lon, double lat) const {
    Match best{0, std::numeric_limits<double>::infinity()};

    for (std::size_t i = 0; i < lonlat_.size(); ++i) {
        const double d = Geodetic::haversineDistance(lon, lat, lonlat_[i].x, lonlat_[i].y);
        // Strict comparison keeps the earliest point on ties
        if (d < best.distance_km) {
            best.index = i;
            best.distance_km = d;
        }
    }

    return best;
}

NearestPointLocator::Match NearestPointLocator::nearest(double lon, double lat) const {
    if (!index_) {
        return nearestExhaustive(lon, lat);
    }

    const std::array<double, 3> query = Geodetic::toUnitSphere(lon, lat);

    std::size_t nearest_index = 0;
    double nearest_dist_sq = 0.0;
    index_->knnSearch(query.data(), 1, &nearest_index, &nearest_dist_sq);

    // Gather everything that could tie with the k-d tree's pick
    const double radius_sq = nearest_dist_sq * (1.0 + TIE_RELATIVE_SLACK) + TIE_ABSOLUTE_SLACK;
    std::vector<nanoflann::ResultItem<std::size_t, double>> matches;
    nanoflann::SearchParameters params;
    params.sorted = false;
    index_->radiusSearch(query.data(), radius_sq, matches, params);

    Match best{nearest_index,
               Geodetic::haversineDistance(lon, lat, lonlat_[nearest_index].x,
                                           lonlat_[nearest_index].y)};

    for (const auto& m : matches) {
        const std::size_t i = m.first;
        const double d = Geodetic::haversineDistance(lon, lat, lonlat_[i].x, lonlat_[i].y);
        if (d < best.distance_km || (d == best.distance_km && i < best.index)) {
            best.index = i;
            best.distance_km = d;
        }
    }

    return best;
}

} // namespace GSMP
