#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "GSMP.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace GSMP {

/**
 * @brief INI-style configuration reader
 *
 * Reads a site model preparation run from a text file:
 *
 * @code
 * [SITE_MODEL]
 * vs30_files = usgs_vs30.csv, local_vs30.csv
 * exposure_files = exposure.csv
 * grid_spacing = 10
 *
 * [AUXILIARY]
 * z1pt0 = true
 * @endcode
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // =========================================================================
    // Parsing Methods
    // =========================================================================

    /**
     * @brief Fill a run configuration from [SITE_MODEL] and [AUXILIARY]
     *
     * Keys absent from the file leave the corresponding field untouched, so
     * defaults set by the caller survive.
     * @return false if the [SITE_MODEL] section is missing
     */
    bool parseSiteModelConfig(SiteModelConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;
    std::vector<std::string> getStringArray(const std::string& section,
                                            const std::string& key) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;

    // =========================================================================
    // Template Generation and Validation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

    // Checks the loaded file: section presence, then the values it parses to
    ValidationResult validate() const;

    // Checks a complete run configuration (after command-line overrides)
    static ValidationResult validateConfig(const SiteModelConfig& config);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    static std::string trim(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delim);
};

} // namespace GSMP

#endif // CONFIG_READER_HPP
