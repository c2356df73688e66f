#ifndef GSMP_HPP
#define GSMP_HPP

#include <petsc.h>

#include <cstddef>
#include <string>
#include <vector>
#include <memory>
#include <map>
#include <functional>

namespace GSMP {

// Forward declarations
class ConfigReader;
class GroundParameterLoader;
class SiteSourceBuilder;
class NearestPointLocator;
class SiteAssociator;
class SoilDepthModel;
class SiteModelWriter;
class SiteModelBuilder;

// Mean earth radius used for every great-circle distance in the pipeline
constexpr double EARTH_RADIUS_KM = 6371.0;

// Default maximum association distance (km)
constexpr double DEFAULT_ASSOC_DISTANCE_KM = 5.0;

enum class SiteSourceMode {
    DEDUPLICATED,       // One target per distinct (lon, lat)
    GRID                // One target per non-empty lattice cell
};

// =============================================================================
// Data Model
// =============================================================================

/**
 * @brief One row of a ground-parameter (e.g. Vs30) source file
 *
 * The load order (file order, then row order) is the position of the point
 * in the merged collection and is used to break distance ties.
 */
struct GroundParameterPoint {
    double lon = 0.0;               ///< Longitude (degrees)
    double lat = 0.0;               ///< Latitude (degrees)
    double value = 0.0;             ///< Primary soil parameter (Vs30, m/s)
    std::size_t source_file = 0;    ///< Index into the loaded file list
};

/**
 * @brief A location that needs site parameters
 */
struct TargetSite {
    std::string id;                 ///< Explicit id, position, or grid cell index
    double lon = 0.0;
    double lat = 0.0;
};

/**
 * @brief Raw coordinate read from an asset or site location file
 */
struct LocationRecord {
    double lon = 0.0;
    double lat = 0.0;
    std::string id;                 // Empty when the file has no id column
};

/**
 * @brief Nearest ground-parameter point found for a target
 */
struct AssociationResult {
    std::size_t target = 0;         // Index into the target list
    std::size_t point = 0;          // Index into the merged point list
    double distance_km = 0.0;
};

/**
 * @brief Emitted for every target discarded by the acceptance policy
 */
struct AssociationWarning {
    std::string site_id;
    double lon = 0.0;
    double lat = 0.0;
    double distance_km = 0.0;
};

/**
 * @brief One output row of the site model
 *
 * Optional columns are carried as values plus presence flags in
 * SiteModelColumns; a record never has fields the run did not request.
 */
struct SiteRecord {
    double lon = 0.0;
    double lat = 0.0;
    double vs30 = 0.0;
    double z1pt0 = 0.0;
    double z2pt5 = 0.0;
    bool vs30measured = false;
};

/**
 * @brief Which optional columns are present in the site model
 */
struct SiteModelColumns {
    bool z1pt0 = false;
    bool z2pt5 = false;
    bool vs30measured = false;
};

// =============================================================================
// Run Configuration
// =============================================================================

struct SiteModelConfig {
    // Inputs
    std::vector<std::string> vs30_files;        // Ground-parameter files in load order
    std::vector<std::string> measured_files;    // Subset of vs30_files holding measured values
    std::vector<std::string> exposure_files;    // Asset location files
    std::vector<std::string> site_files;        // Explicit site location files
    std::string input_crs = "EPSG:4326";        // CRS of every input coordinate

    // Site generation and association
    double grid_spacing_km = 0.0;               // 0 => deduplicated mode
    double assoc_distance_km = DEFAULT_ASSOC_DISTANCE_KM;

    // Auxiliary parameters
    bool derive_z1pt0 = false;
    bool derive_z2pt5 = false;
    bool derive_vs30measured = false;
    std::string z1pt0_model = "CHIOU_YOUNGS_2014";
    std::string z2pt5_model = "CAMPBELL_BOZORGNIA_2014";
    bool vs30measured_default = false;

    // Output
    std::string output_file = "site_model.csv";

    SiteSourceMode mode() const {
        return grid_spacing_km > 0.0 ? SiteSourceMode::GRID : SiteSourceMode::DEDUPLICATED;
    }

    SiteModelColumns columns() const {
        SiteModelColumns c;
        c.z1pt0 = derive_z1pt0;
        c.z2pt5 = derive_z2pt5;
        c.vs30measured = derive_vs30measured;
        return c;
    }
};

} // namespace GSMP

#endif // GSMP_HPP
