#include "GSMP.hpp"
#include "SiteModelBuilder.hpp"
#include "ConfigReader.hpp"
#include <petsc.h>
#include <exception>
#include <vector>
#include <sstream>
#include <string>

static char help[] = "GSMP - Ground Site Model Preparer\n"
                    "Builds a site model (lon, lat, vs30, ...) by associating target sites\n"
                    "with the nearest point of one or more Vs30 files.\n"
                    "Usage: gsmp_prepare [options]\n\n"
                    "Options:\n"
                    "  -c <file>                Configuration file (.config)\n"
                    "  -vs30 <a,b,...>          Vs30 files (lon, lat, vs30 rows)\n"
                    "  -measured <a,...>        Vs30 files holding measured values\n"
                    "  -exposure <a,...>        Asset location files\n"
                    "  -sites <a,...>           Site location files\n"
                    "  -grid_spacing <km>       Aggregate locations on a grid (0 = off)\n"
                    "  -assoc_distance <km>     Discard sites farther than this (default 5)\n"
                    "  -z1pt0                   Add the z1pt0 column\n"
                    "  -z2pt5                   Add the z2pt5 column\n"
                    "  -vs30measured            Add the vs30measured column\n"
                    "  -input_crs <crs>         CRS of every input coordinate (default EPSG:4326)\n"
                    "  -o <file>                Output site model (default site_model.csv)\n\n"
                    "Examples:\n"
                    "  # Use configuration file (recommended)\n"
                    "  gsmp_prepare -c config/site_model.config\n\n"
                    "  # Deduplicated exposure locations with z1pt0 and z2pt5\n"
                    "  mpirun -np 4 gsmp_prepare -vs30 vs30.csv -exposure exposure.csv -z1pt0 -z2pt5\n\n"
                    "  # Generate template configuration\n"
                    "  gsmp_prepare -generate_config my_config.config\n\n";

static std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto b = item.find_first_not_of(" \t");
        const auto e = item.find_last_not_of(" \t");
        if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}

// Overrides a list from a comma-separated option, if given
static PetscErrorCode getListOption(const char* name, std::vector<std::string>& list) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    char value[PETSC_MAX_PATH_LEN] = "";
    PetscBool set = PETSC_FALSE;
    ierr = PetscOptionsGetString(nullptr, nullptr, name, value, sizeof(value), &set); CHKERRQ(ierr);
    if (set) list = splitList(value);

    PetscFunctionReturn(0);
}

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    // Initialize PETSc
    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        // Check for config file generation
        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                GSMP::ConfigReader::generateTemplate(generate_config);
                PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                PetscPrintf(comm, "Edit this file to describe your site model.\n");
            }
            ierr = PetscFinalize();
            return 0;
        }

        // Configuration file first, command line on top of it
        char config_file[PETSC_MAX_PATH_LEN] = "";
        PetscBool config_provided = PETSC_FALSE;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);

        GSMP::SiteModelConfig config;
        if (config_provided) {
            GSMP::ConfigReader reader;
            if (!reader.loadFile(config_file) || !reader.parseSiteModelConfig(config)) {
                if (rank == 0) {
                    PetscPrintf(comm, "Error: Cannot read [SITE_MODEL] from %s\n", config_file);
                }
                ierr = PetscFinalize();
                return 1;
            }
        }

        ierr = getListOption("-vs30", config.vs30_files); CHKERRQ(ierr);
        ierr = getListOption("-measured", config.measured_files); CHKERRQ(ierr);
        ierr = getListOption("-exposure", config.exposure_files); CHKERRQ(ierr);
        ierr = getListOption("-sites", config.site_files); CHKERRQ(ierr);

        PetscReal grid_spacing = config.grid_spacing_km;
        PetscReal assoc_distance = config.assoc_distance_km;
        ierr = PetscOptionsGetReal(nullptr, nullptr, "-grid_spacing", &grid_spacing, nullptr); CHKERRQ(ierr);
        ierr = PetscOptionsGetReal(nullptr, nullptr, "-assoc_distance", &assoc_distance, nullptr); CHKERRQ(ierr);
        config.grid_spacing_km = grid_spacing;
        config.assoc_distance_km = assoc_distance;

        PetscBool flag = config.derive_z1pt0 ? PETSC_TRUE : PETSC_FALSE;
        ierr = PetscOptionsGetBool(nullptr, nullptr, "-z1pt0", &flag, nullptr); CHKERRQ(ierr);
        config.derive_z1pt0 = flag;
        flag = config.derive_z2pt5 ? PETSC_TRUE : PETSC_FALSE;
        ierr = PetscOptionsGetBool(nullptr, nullptr, "-z2pt5", &flag, nullptr); CHKERRQ(ierr);
        config.derive_z2pt5 = flag;
        flag = config.derive_vs30measured ? PETSC_TRUE : PETSC_FALSE;
        ierr = PetscOptionsGetBool(nullptr, nullptr, "-vs30measured", &flag, nullptr); CHKERRQ(ierr);
        config.derive_vs30measured = flag;

        char input_crs[256] = "";
        PetscBool crs_set = PETSC_FALSE;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-input_crs", input_crs,
                                     sizeof(input_crs), &crs_set); CHKERRQ(ierr);
        if (crs_set) config.input_crs = input_crs;

        char output_file[PETSC_MAX_PATH_LEN] = "";
        PetscBool output_set = PETSC_FALSE;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_file,
                                     sizeof(output_file), &output_set); CHKERRQ(ierr);
        if (output_set) config.output_file = output_file;

        if (config.vs30_files.empty()) {
            if (rank == 0) {
                PetscPrintf(comm, "Error: Vs30 files required (-vs30 or vs30_files in -c <file>)\n");
                PetscPrintf(comm, "Run with -help for usage information\n");
                PetscPrintf(comm, "Generate template: gsmp_prepare -generate_config template.config\n");
            }
            ierr = PetscFinalize();
            return 1;
        }

        if (rank == 0) {
            PetscPrintf(comm, "\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "  GSMP - Ground Site Model Preparer\n");
            PetscPrintf(comm, "  Version 1.0.0\n");
            PetscPrintf(comm, "============================================================\n");
            PetscPrintf(comm, "\n");
            if (config_provided) {
                PetscPrintf(comm, "Config file:   %s\n", config_file);
            }
            PetscPrintf(comm, "Output file:   %s\n", config.output_file.c_str());
            PetscPrintf(comm, "\n");
        }

        try {
            GSMP::SiteModelBuilder builder(comm);

            ierr = builder.setConfig(config);
            if (ierr) {
                ierr = PetscFinalize();
                return 1;
            }

            double start_time = MPI_Wtime();
            ierr = builder.run();
            if (ierr) {
                if (builder.getFailure()) std::rethrow_exception(builder.getFailure());
                ierr = PetscFinalize();
                return 1;
            }
            double end_time = MPI_Wtime();

            if (rank == 0) {
                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "Site model completed: %zu sites, %zu discarded\n",
                            builder.getRecords().size(), builder.getWarnings().size());
                PetscPrintf(comm, "Total wall time: %.2f seconds\n", end_time - start_time);
                PetscPrintf(comm, "============================================================\n");
            }

        } catch (const std::exception& e) {
            if (rank == 0) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
            }
            ierr = PetscFinalize();
            return 1;
        }
    }

    // Finalize PETSc
    ierr = PetscFinalize();
    return 0;
}
