#include "SiteModelBuilder.hpp"
#include "CoordinateSystem.hpp"
#include "GroundParameterLoader.hpp"
#include "SiteAssociator.hpp"
#include "SiteModelErrors.hpp"
#include "SiteModelWriter.hpp"
#include "SiteSource.hpp"
#include <exception>
#include <memory>
#include <string>

namespace GSMP {

namespace {

PetscErrorCode errorCodeOf(const SiteModelError& e) {
    if (dynamic_cast<const InputFileError*>(&e)) return PETSC_ERR_FILE_OPEN;
    if (dynamic_cast<const MalformedRowError*>(&e)) return PETSC_ERR_FILE_UNEXPECTED;
    if (dynamic_cast<const OutputWriteError*>(&e)) return PETSC_ERR_FILE_WRITE;
    return PETSC_ERR_ARG_WRONG;
}

} // namespace

SiteModelBuilder::SiteModelBuilder(MPI_Comm comm_in)
    : comm(comm_in), configured(false) {
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);
}

// =============================================================================
// Initialization
// =============================================================================

PetscErrorCode SiteModelBuilder::initializeFromConfigFile(const std::string& config_file) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (rank == 0) {
        PetscPrintf(comm, "Loading configuration from: %s\n", config_file.c_str());
    }

    ConfigReader reader;
    if (!reader.loadFile(config_file)) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Failed to load configuration file");
    }

    SiteModelConfig file_config;
    if (!reader.parseSiteModelConfig(file_config)) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Configuration file has no [SITE_MODEL] section");
    }

    ierr = setConfig(file_config); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

PetscErrorCode SiteModelBuilder::setConfig(const SiteModelConfig& config_in) {
    PetscFunctionBeginUser;

    ConfigReader::ValidationResult check = ConfigReader::validateConfig(config_in);

    if (rank == 0) {
        for (const auto& w : check.warnings) {
            PetscPrintf(comm, "Warning: %s\n", w.c_str());
        }
        for (const auto& e : check.errors) {
            PetscPrintf(comm, "Error: %s\n", e.c_str());
        }
    }
    if (!check.valid) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Invalid site model configuration");
    }

    try {
        deriver = SiteParameterDeriver::fromConfig(config_in);
    } catch (const SiteModelError& e) {
        failure = std::current_exception();
        SETERRQ(comm, errorCodeOf(e), "%s", e.what());
    }
    config = config_in;
    configured = true;

    if (rank == 0) {
        PetscPrintf(comm, "Configuration:\n");
        PetscPrintf(comm, "  Vs30 files: %zu\n", config.vs30_files.size());
        PetscPrintf(comm, "  Exposure files: %zu\n", config.exposure_files.size());
        PetscPrintf(comm, "  Site files: %zu\n", config.site_files.size());
        PetscPrintf(comm, "  Input CRS: %s\n", config.input_crs.c_str());
        if (config.mode() == SiteSourceMode::GRID) {
            PetscPrintf(comm, "  Grid spacing: %g km\n", config.grid_spacing_km);
        } else {
            PetscPrintf(comm, "  Grid spacing: none (deduplicated locations)\n");
        }
        PetscPrintf(comm, "  Association distance: %g km\n", config.assoc_distance_km);
        if (config.derive_z1pt0) {
            PetscPrintf(comm, "  z1pt0 model: %s\n", config.z1pt0_model.c_str());
        }
        if (config.derive_z2pt5) {
            PetscPrintf(comm, "  z2pt5 model: %s\n", config.z2pt5_model.c_str());
        }
        PetscPrintf(comm, "  vs30measured: %s\n", config.derive_vs30measured ? "yes" : "no");
        PetscPrintf(comm, "  Output: %s\n", config.output_file.c_str());
    }

    PetscFunctionReturn(0);
}

PetscErrorCode SiteModelBuilder::setZ1pt0Model(std::shared_ptr<const SoilDepthModel> model) {
    PetscFunctionBeginUser;

    try {
        deriver.setZ1pt0Model(model);
    } catch (const ConfigurationError& e) {
        if (rank == 0) PetscPrintf(comm, "Error: %s\n", e.what());
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Depth model does not compute z1pt0");
    }
    config.derive_z1pt0 = static_cast<bool>(model);
    if (model) config.z1pt0_model = model->getName();

    PetscFunctionReturn(0);
}

PetscErrorCode SiteModelBuilder::setZ2pt5Model(std::shared_ptr<const SoilDepthModel> model) {
    PetscFunctionBeginUser;

    try {
        deriver.setZ2pt5Model(model);
    } catch (const ConfigurationError& e) {
        if (rank == 0) PetscPrintf(comm, "Error: %s\n", e.what());
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Depth model does not compute z2pt5");
    }
    config.derive_z2pt5 = static_cast<bool>(model);
    if (model) config.z2pt5_model = model->getName();

    PetscFunctionReturn(0);
}

// =============================================================================
// Pipeline
// =============================================================================

PetscErrorCode SiteModelBuilder::loadInputs() {
    PetscFunctionBeginUser;

    if (!configured) {
        SETERRQ(comm, PETSC_ERR_ORDER, "Site model builder is not configured");
    }

    try {
        loadInputFiles();
    } catch (const SiteModelError& e) {
        failure = std::current_exception();
        SETERRQ(comm, errorCodeOf(e), "%s", e.what());
    }

    PetscFunctionReturn(0);
}

void SiteModelBuilder::loadInputFiles() {
    const bool geographic = CRSDefinition(config.input_crs).isGeographicWGS84();

    GroundParameterLoader loader(geographic);
    loader.loadFiles(config.vs30_files);

    if (rank == 0) {
        PetscPrintf(comm, "Ground-parameter points:\n");
        for (std::size_t i = 0; i < loader.getFiles().size(); ++i) {
            PetscPrintf(comm, "  %s: %zu points\n", loader.getFiles()[i].c_str(),
                        loader.getPointCount(i));
        }
    }

    points = loader.releasePoints();
    if (points.empty()) {
        throw NoPointsAvailableError();
    }

    locations.clear();
    for (const auto& file : config.exposure_files) {
        std::vector<LocationRecord> recs = readLocationFile(file, geographic);
        if (rank == 0) {
            PetscPrintf(comm, "  %s: %zu asset locations\n", file.c_str(), recs.size());
        }
        locations.insert(locations.end(), recs.begin(), recs.end());
    }
    for (const auto& file : config.site_files) {
        std::vector<LocationRecord> recs = readLocationFile(file, geographic);
        if (rank == 0) {
            PetscPrintf(comm, "  %s: %zu site locations\n", file.c_str(), recs.size());
        }
        locations.insert(locations.end(), recs.begin(), recs.end());
    }

    if (!geographic) {
        transformInputCoordinates();
    }

    if (rank == 0) {
        PetscPrintf(comm, "Loaded %zu points and %zu locations\n", points.size(), locations.size());
    }
}

void SiteModelBuilder::transformInputCoordinates() {
    CoordinateTransformer transformer;
    transformer.setSourceCRS(config.input_crs);
    transformer.setTargetCRS(CRS::WGS84);

    if (!transformer.initialize()) {
        throw ConfigurationError("Cannot transform " + config.input_crs + " to " + CRS::WGS84 +
                                 ": " + transformer.getLastError());
    }

    if (rank == 0) {
        PetscPrintf(comm, "Transforming input coordinates: %s -> %s\n",
                    config.input_crs.c_str(), CRS::WGS84.c_str());
    }

    std::vector<double> x(points.size()), y(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        x[i] = points[i].lon;
        y[i] = points[i].lat;
    }
    if (!transformer.transform(x.data(), y.data(), x.size())) {
        throw ConfigurationError("Ground-parameter coordinate transform failed: " +
                                 transformer.getLastError());
    }
    for (std::size_t i = 0; i < points.size(); ++i) {
        points[i].lon = x[i];
        points[i].lat = y[i];
    }

    x.resize(locations.size());
    y.resize(locations.size());
    for (std::size_t i = 0; i < locations.size(); ++i) {
        x[i] = locations[i].lon;
        y[i] = locations[i].lat;
    }
    if (!transformer.transform(x.data(), y.data(), x.size())) {
        throw ConfigurationError("Location coordinate transform failed: " +
                                 transformer.getLastError());
    }
    for (std::size_t i = 0; i < locations.size(); ++i) {
        locations[i].lon = x[i];
        locations[i].lat = y[i];
    }
}

PetscErrorCode SiteModelBuilder::buildTargets() {
    PetscFunctionBeginUser;

    try {
        SiteSourceBuilder source;
        source.addLocations(locations);
        targets = source.build(config.grid_spacing_km);

        if (rank == 0) {
            if (config.mode() == SiteSourceMode::GRID) {
                const GridSpec grid = GridSpec::fromExtent(source.getBounds(), config.grid_spacing_km);
                PetscPrintf(comm, "Grid: %zu x %zu cells (%.6f x %.6f deg), %zu non-empty\n",
                            grid.n_lon, grid.n_lat, grid.dlon, grid.dlat, targets.size());
            } else {
                PetscPrintf(comm, "Sites: %zu locations, %zu unique\n",
                            locations.size(), targets.size());
            }
        }
    } catch (const SiteModelError& e) {
        failure = std::current_exception();
        SETERRQ(comm, errorCodeOf(e), "%s", e.what());
    }

    PetscFunctionReturn(0);
}

PetscErrorCode SiteModelBuilder::associate() {
    PetscFunctionBeginUser;

    try {
        SiteAssociator associator(comm);
        associations = associator.associate(points, targets);
    } catch (const SiteModelError& e) {
        failure = std::current_exception();
        SETERRQ(comm, errorCodeOf(e), "%s", e.what());
    }

    if (rank == 0) {
        const AssociationStatistics stats = AssociationStatistics::compute(associations);
        PetscPrintf(comm, "Association (%d rank%s): %zu sites\n", size, size == 1 ? "" : "s",
                    stats.count);
        PetscPrintf(comm, "  Distance min/mean/max: %.3f / %.3f / %.3f km\n",
                    stats.min_km, stats.mean_km, stats.max_km);
    }

    PetscFunctionReturn(0);
}

PetscErrorCode SiteModelBuilder::deriveRecords() {
    PetscFunctionBeginUser;

    records.clear();
    warnings.clear();

    // Built on every rank so a bad distance fails collectively
    std::unique_ptr<AcceptancePolicy> policy;
    try {
        policy = std::make_unique<AcceptancePolicy>(config.assoc_distance_km);
    } catch (const SiteModelError& e) {
        failure = std::current_exception();
        SETERRQ(comm, errorCodeOf(e), "%s", e.what());
    }

    if (rank != 0) PetscFunctionReturn(0);

    AcceptancePolicy::Outcome outcome = policy->apply(targets, associations);

    records.reserve(outcome.accepted.size());
    for (const auto& a : outcome.accepted) {
        records.push_back(deriver.derive(targets[a.target], points[a.point]));
    }
    warnings = std::move(outcome.warnings);

    for (const auto& w : warnings) {
        PetscPrintf(comm, "Warning: site %s (%.6f, %.6f) discarded, nearest Vs30 point is %.3f km away\n",
                    w.site_id.c_str(), w.lon, w.lat, w.distance_km);
    }
    if (!warnings.empty()) {
        PetscPrintf(comm, "Discarded %zu of %zu sites farther than %g km from any Vs30 point\n",
                    warnings.size(), targets.size(), policy->getMaxDistance());
    }

    PetscFunctionReturn(0);
}

PetscErrorCode SiteModelBuilder::writeOutput() {
    PetscFunctionBeginUser;

    int failed = 0;
    std::string reason;

    if (rank == 0) {
        try {
            SiteModelWriter writer(getColumns());
            writer.write(config.output_file, records);
            PetscPrintf(comm, "Saved %zu sites to %s\n", records.size(), config.output_file.c_str());
        } catch (const OutputWriteError& e) {
            failure = std::current_exception();
            reason = e.what();
            failed = 1;
        }
    }

    // Every rank fails together
    MPI_Bcast(&failed, 1, MPI_INT, 0, comm);
    if (failed) {
        if (rank != 0) {
            failure = std::make_exception_ptr(
                OutputWriteError(config.output_file, "write failed on rank 0"));
            reason = "write failed on rank 0";
        }
        SETERRQ(comm, PETSC_ERR_FILE_WRITE, "%s", reason.c_str());
    }

    PetscFunctionReturn(0);
}

PetscErrorCode SiteModelBuilder::run() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    failure = nullptr;

    ierr = loadInputs(); CHKERRQ(ierr);
    ierr = buildTargets(); CHKERRQ(ierr);
    ierr = associate(); CHKERRQ(ierr);
    ierr = deriveRecords(); CHKERRQ(ierr);
    ierr = writeOutput(); CHKERRQ(ierr);

    PetscFunctionReturn(0);
}

} // namespace GSMP
