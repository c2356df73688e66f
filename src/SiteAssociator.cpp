#include "SiteAssociator.hpp"
#include "NearestPointLocator.hpp"
#include "SiteModelErrors.hpp"
#include <algorithm>
#include <limits>

namespace GSMP {

// =============================================================================
// SiteAssociator
// =============================================================================

SiteAssociator::SiteAssociator(MPI_Comm comm_in) : comm(comm_in) {
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);
}

void SiteAssociator::blockRange(std::size_t n, int rank, int size,
                                std::size_t& begin, std::size_t& end) {
    const std::size_t p = static_cast<std::size_t>(size);
    const std::size_t r = static_cast<std::size_t>(rank);
    const std::size_t base = n / p;
    const std::size_t extra = n % p;

    // The first `extra` ranks take one more target
    begin = r * base + std::min(r, extra);
    end = begin + base + (r < extra ? 1 : 0);
}

std::vector<AssociationResult> SiteAssociator::associate(
    const std::vector<GroundParameterPoint>& points,
    const std::vector<TargetSite>& targets) const {

    // Every rank builds the same index, so a failure here is raised on all
    // ranks before any collective call
    NearestPointLocator locator(points);

    const std::size_t n = targets.size();
    std::size_t begin = 0, end = 0;
    blockRange(n, rank, size, begin, end);

    std::vector<unsigned long long> local_index;
    std::vector<double> local_distance;
    local_index.reserve(end - begin);
    local_distance.reserve(end - begin);

    for (std::size_t t = begin; t < end; ++t) {
        const NearestPointLocator::Match m = locator.nearest(targets[t].lon, targets[t].lat);
        local_index.push_back(static_cast<unsigned long long>(m.index));
        local_distance.push_back(m.distance_km);
    }

    std::vector<unsigned long long> all_index(n);
    std::vector<double> all_distance(n);

    if (size == 1) {
        all_index = local_index;
        all_distance = local_distance;
    } else {
        std::vector<int> counts(size), displs(size);
        for (int r = 0; r < size; ++r) {
            std::size_t b = 0, e = 0;
            blockRange(n, r, size, b, e);
            counts[r] = static_cast<int>(e - b);
            displs[r] = static_cast<int>(b);
        }

        MPI_Allgatherv(local_index.data(), static_cast<int>(local_index.size()),
                       MPI_UNSIGNED_LONG_LONG, all_index.data(), counts.data(),
                       displs.data(), MPI_UNSIGNED_LONG_LONG, comm);
        MPI_Allgatherv(local_distance.data(), static_cast<int>(local_distance.size()),
                       MPI_DOUBLE, all_distance.data(), counts.data(),
                       displs.data(), MPI_DOUBLE, comm);
    }

    std::vector<AssociationResult> results(n);
    for (std::size_t t = 0; t < n; ++t) {
        results[t].target = t;
        results[t].point = static_cast<std::size_t>(all_index[t]);
        results[t].distance_km = all_distance[t];
    }
    return results;
}

// =============================================================================
// AcceptancePolicy
// =============================================================================

AcceptancePolicy::AcceptancePolicy(double max_distance_km)
    : max_distance_km_(max_distance_km) {
    if (!(max_distance_km > 0.0)) {
        throw ConfigurationError("Association distance must be positive");
    }
}

AcceptancePolicy::Outcome AcceptancePolicy::apply(
    const std::vector<TargetSite>& targets,
    const std::vector<AssociationResult>& results) const {

    Outcome outcome;
    outcome.accepted.reserve(results.size());

    for (const auto& res : results) {
        if (accepts(res.distance_km)) {
            outcome.accepted.push_back(res);
            continue;
        }

        const TargetSite& site = targets.at(res.target);
        AssociationWarning w;
        w.site_id = site.id;
        w.lon = site.lon;
        w.lat = site.lat;
        w.distance_km = res.distance_km;
        outcome.warnings.push_back(w);
    }

    return outcome;
}

// =============================================================================
// AssociationStatistics
// =============================================================================

AssociationStatistics AssociationStatistics::compute(const std::vector<AssociationResult>& results) {
    AssociationStatistics stats;
    if (results.empty()) return stats;

    double sum = 0.0;
    stats.min_km = std::numeric_limits<double>::infinity();
    stats.max_km = 0.0;
    for (const auto& r : results) {
        stats.min_km = std::min(stats.min_km, r.distance_km);
        stats.max_km = std::max(stats.max_km, r.distance_km);
        sum += r.distance_km;
    }
    stats.count = results.size();
    stats.mean_km = sum / static_cast<double>(results.size());
    return stats;
}

} // namespace GSMP
