#include "ConfigReader.hpp"
#include "SoilDepthModel.hpp"
#include "SiteModelErrors.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace GSMP {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                   const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::logic_error&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                          bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<std::string> ConfigReader::getStringArray(const std::string& section,
                                                      const std::string& key) const {
    return split(getString(section, key), ',');
}

// =============================================================================
// Section/Key Queries
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

// =============================================================================
// Parsing
// =============================================================================

bool ConfigReader::parseSiteModelConfig(SiteModelConfig& config) const {
    if (!hasSection("SITE_MODEL")) return false;

    if (hasKey("SITE_MODEL", "vs30_files"))
        config.vs30_files = getStringArray("SITE_MODEL", "vs30_files");
    if (hasKey("SITE_MODEL", "measured_files"))
        config.measured_files = getStringArray("SITE_MODEL", "measured_files");
    if (hasKey("SITE_MODEL", "exposure_files"))
        config.exposure_files = getStringArray("SITE_MODEL", "exposure_files");
    if (hasKey("SITE_MODEL", "site_files"))
        config.site_files = getStringArray("SITE_MODEL", "site_files");

    config.input_crs = getString("SITE_MODEL", "input_crs", config.input_crs);
    config.grid_spacing_km = getDouble("SITE_MODEL", "grid_spacing", config.grid_spacing_km);
    config.assoc_distance_km = getDouble("SITE_MODEL", "assoc_distance", config.assoc_distance_km);
    config.output_file = getString("SITE_MODEL", "output", config.output_file);

    // Auxiliary parameters
    config.derive_z1pt0 = getBool("AUXILIARY", "z1pt0", config.derive_z1pt0);
    config.derive_z2pt5 = getBool("AUXILIARY", "z2pt5", config.derive_z2pt5);
    config.derive_vs30measured = getBool("AUXILIARY", "vs30measured", config.derive_vs30measured);
    config.z1pt0_model = getString("AUXILIARY", "z1pt0_model", config.z1pt0_model);
    config.z2pt5_model = getString("AUXILIARY", "z2pt5_model", config.z2pt5_model);
    config.vs30measured_default = getBool("AUXILIARY", "vs30measured_default",
                                          config.vs30measured_default);

    return true;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);

    file << "# GSMP Site Model Configuration File\n";
    file << "# Coordinates in degrees, distances in km, Vs30 in m/s\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[SITE_MODEL]\n";
    file << "# Ground-parameter files: lon, lat, vs30 per row, no header.\n";
    file << "# Points from earlier files win distance ties.\n";
    file << "vs30_files = vs30_regional.csv, vs30_local.csv\n";
    file << "measured_files =                      # Files holding measured (not inferred) Vs30\n\n";

    file << "# Locations to parametrize: lon, lat[, id] per row\n";
    file << "exposure_files = exposure.csv         # Asset locations, deduplicated\n";
    file << "site_files =                          # Explicit site coordinates\n";
    file << "input_crs = EPSG:4326                 # CRS of every input coordinate\n\n";

    file << "grid_spacing = 0                      # km; 0 keeps the exact (deduplicated) locations\n";
    file << "assoc_distance = 5                    # km; sites farther from any Vs30 point are discarded\n";
    file << "output = site_model.csv\n\n";

    file << "[AUXILIARY]\n";
    file << "z1pt0 = false\n";
    file << "z2pt5 = false\n";
    file << "vs30measured = false\n";
    file << "z1pt0_model = CHIOU_YOUNGS_2014       # CHIOU_YOUNGS_2014, CHIOU_YOUNGS_2014_JAPAN\n";
    file << "z2pt5_model = CAMPBELL_BOZORGNIA_2014 # CAMPBELL_BOZORGNIA_2014, CAMPBELL_BOZORGNIA_2014_JAPAN\n";
    file << "vs30measured_default = false\n";
}

// =============================================================================
// Validation
// =============================================================================

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    if (!hasSection("SITE_MODEL")) {
        result.errors.push_back("No [SITE_MODEL] section found");
        result.valid = false;
        return result;
    }

    if (!hasSection("AUXILIARY")) {
        result.warnings.push_back("No [AUXILIARY] section found - no auxiliary parameters derived");
    }

    SiteModelConfig config;
    parseSiteModelConfig(config);
    ValidationResult checked = validateConfig(config);

    result.errors.insert(result.errors.end(), checked.errors.begin(), checked.errors.end());
    result.warnings.insert(result.warnings.end(), checked.warnings.begin(), checked.warnings.end());
    result.valid = checked.valid;

    return result;
}

ConfigReader::ValidationResult ConfigReader::validateConfig(const SiteModelConfig& config) {
    ValidationResult result;
    result.valid = true;

    if (config.vs30_files.empty()) {
        result.errors.push_back("No ground-parameter files given (vs30_files)");
        result.valid = false;
    }

    if (config.exposure_files.empty() && config.site_files.empty()) {
        result.errors.push_back("Neither exposure_files nor site_files given");
        result.valid = false;
    }

    for (const auto& measured : config.measured_files) {
        if (std::find(config.vs30_files.begin(), config.vs30_files.end(), measured) ==
            config.vs30_files.end()) {
            result.warnings.push_back("measured file '" + measured + "' is not one of vs30_files");
        }
    }

    if (!std::isfinite(config.grid_spacing_km) || config.grid_spacing_km < 0.0) {
        result.errors.push_back("Invalid grid_spacing (must be >= 0 km)");
        result.valid = false;
    }

    if (!std::isfinite(config.assoc_distance_km) || config.assoc_distance_km <= 0.0) {
        result.errors.push_back("Invalid assoc_distance (must be > 0 km)");
        result.valid = false;
    }

    if (config.output_file.empty()) {
        result.errors.push_back("No output file given");
        result.valid = false;
    }

    if (config.derive_z1pt0) {
        try {
            if (depthParameterOf(parseSoilDepthModelType(config.z1pt0_model)) != DepthParameter::Z1PT0) {
                result.errors.push_back("z1pt0_model '" + config.z1pt0_model + "' does not compute z1pt0");
                result.valid = false;
            }
        } catch (const ConfigurationError& e) {
            result.errors.push_back(e.what());
            result.valid = false;
        }
    }

    if (config.derive_z2pt5) {
        try {
            if (depthParameterOf(parseSoilDepthModelType(config.z2pt5_model)) != DepthParameter::Z2PT5) {
                result.errors.push_back("z2pt5_model '" + config.z2pt5_model + "' does not compute z2pt5");
                result.valid = false;
            }
        } catch (const ConfigurationError& e) {
            result.errors.push_back(e.what());
            result.valid = false;
        }
    }

    if (!config.derive_vs30measured && !config.measured_files.empty()) {
        result.warnings.push_back("measured_files given but vs30measured column not requested");
    }

    return result;
}

} // namespace GSMP
