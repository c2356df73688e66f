#ifndef SITE_MODEL_BUILDER_HPP
#define SITE_MODEL_BUILDER_HPP

#include "GSMP.hpp"
#include "ConfigReader.hpp"
#include "SiteParameterDeriver.hpp"
#include "SoilDepthModel.hpp"
#include <exception>
#include <memory>
#include <vector>

namespace GSMP {

/**
 * @brief Drives a site model preparation run
 *
 * Steps, in order:
 *  1. loadInputs()    ground-parameter points, asset and site locations
 *  2. buildTargets()  deduplicated locations or grid cells
 *  3. associate()     nearest point per target, sharded over the communicator
 *  4. deriveRecords() acceptance policy and auxiliary parameters (rank 0)
 *  5. writeOutput()   atomic CSV write (rank 0)
 *
 * run() performs all of them. Every step reports failure as a PETSc error
 * code and does not throw SiteModelError; the error that stopped the run is
 * kept and available from getFailure().
 */
class SiteModelBuilder {
public:
    SiteModelBuilder(MPI_Comm comm);
    ~SiteModelBuilder() = default;

    // Initialization
    PetscErrorCode initializeFromConfigFile(const std::string& config_file);
    PetscErrorCode setConfig(const SiteModelConfig& config);

    // Replace the regression chosen by name in the configuration
    PetscErrorCode setZ1pt0Model(std::shared_ptr<const SoilDepthModel> model);
    PetscErrorCode setZ2pt5Model(std::shared_ptr<const SoilDepthModel> model);

    // Pipeline
    PetscErrorCode loadInputs();
    PetscErrorCode buildTargets();
    PetscErrorCode associate();
    PetscErrorCode deriveRecords();
    PetscErrorCode writeOutput();
    PetscErrorCode run();

    // Results
    const SiteModelConfig& getConfig() const { return config; }
    const std::vector<GroundParameterPoint>& getPoints() const { return points; }
    const std::vector<LocationRecord>& getLocations() const { return locations; }
    const std::vector<TargetSite>& getTargets() const { return targets; }
    const std::vector<AssociationResult>& getAssociations() const { return associations; }

    // Filled on rank 0 only
    const std::vector<SiteRecord>& getRecords() const { return records; }
    const std::vector<AssociationWarning>& getWarnings() const { return warnings; }
    SiteModelColumns getColumns() const { return deriver.getColumns(); }

    // SiteModelError behind the last failed step, null if none
    std::exception_ptr getFailure() const { return failure; }

private:
    MPI_Comm comm;
    int rank, size;

    SiteModelConfig config;
    bool configured;
    SiteParameterDeriver deriver;

    std::vector<GroundParameterPoint> points;
    std::vector<LocationRecord> locations;
    std::vector<TargetSite> targets;
    std::vector<AssociationResult> associations;
    std::vector<SiteRecord> records;
    std::vector<AssociationWarning> warnings;
    std::exception_ptr failure;

    void loadInputFiles();

    // Bring projected input coordinates to WGS84 longitude/latitude
    void transformInputCoordinates();
};

} // namespace GSMP

#endif // SITE_MODEL_BUILDER_HPP
