#ifndef SITE_ASSOCIATOR_HPP
#define SITE_ASSOCIATOR_HPP

#include "GSMP.hpp"
#include <vector>

namespace GSMP {

/**
 * @brief Nearest-neighbour association of target sites to ground-parameter points
 *
 * Targets are split into contiguous blocks, one per rank of the
 * communicator. Every rank indexes the full point set, matches its own
 * block, and the (point, distance) pairs are all-gathered so each rank ends
 * up with the complete association in target order. A single-rank
 * communicator gives the same result as a serial run.
 */
class SiteAssociator {
public:
    explicit SiteAssociator(MPI_Comm comm);

    /**
     * @brief One result per target, in target order
     * @throws NoPointsAvailableError if points is empty
     */
    std::vector<AssociationResult> associate(const std::vector<GroundParameterPoint>& points,
                                             const std::vector<TargetSite>& targets) const;

    // Half-open range [begin, end) of targets evaluated by a rank
    static void blockRange(std::size_t n, int rank, int size,
                           std::size_t& begin, std::size_t& end);

private:
    MPI_Comm comm;
    int rank, size;
};

/**
 * @brief Distance-based acceptance of associations
 *
 * A target whose nearest point is farther than the maximum distance is
 * discarded and produces a warning with the target coordinate and the
 * distance found. Discards are not errors.
 */
class AcceptancePolicy {
public:
    struct Outcome {
        std::vector<AssociationResult> accepted;    // Target order preserved
        std::vector<AssociationWarning> warnings;   // One per discarded target
    };

    /**
     * @throws ConfigurationError if max_distance_km is not positive
     */
    explicit AcceptancePolicy(double max_distance_km = DEFAULT_ASSOC_DISTANCE_KM);

    bool accepts(double distance_km) const { return distance_km <= max_distance_km_; }
    double getMaxDistance() const { return max_distance_km_; }

    Outcome apply(const std::vector<TargetSite>& targets,
                  const std::vector<AssociationResult>& results) const;

private:
    double max_distance_km_;
};

/**
 * @brief Summary of association distances (km)
 */
struct AssociationStatistics {
    std::size_t count = 0;
    double min_km = 0.0;
    double mean_km = 0.0;
    double max_km = 0.0;

    static AssociationStatistics compute(const std::vector<AssociationResult>& results);
};

} // namespace GSMP

#endif // SITE_ASSOCIATOR_HPP
