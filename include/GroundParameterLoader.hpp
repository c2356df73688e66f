#ifndef GROUND_PARAMETER_LOADER_HPP
#define GROUND_PARAMETER_LOADER_HPP

#include "GSMP.hpp"
#include <string>
#include <vector>

namespace GSMP {

/**
 * @brief Reads ground-parameter (Vs30) point files into one collection
 *
 * Each file holds rows of `longitude, latitude, value` separated by commas
 * and/or whitespace, without a header. Blank lines and `#` comments are
 * skipped. Points keep their load order: file order, then row order.
 *
 * @throws InputFileError if a file cannot be opened
 * @throws MalformedRowError if a row is not exactly three numbers or holds
 *         an out-of-range coordinate
 */
class GroundParameterLoader {
public:
    /**
     * @param geographic Coordinates are degrees and must lie in
     *        [-180, 180] x [-90, 90]; false for projected input
     */
    explicit GroundParameterLoader(bool geographic = true) : geographic_(geographic) {}

    /**
     * @brief Append every row of a file to the collection
     * @return Number of points read from this file
     */
    std::size_t loadFile(const std::string& filename);

    void loadFiles(const std::vector<std::string>& filenames);

    const std::vector<GroundParameterPoint>& getPoints() const { return points_; }
    const std::vector<std::string>& getFiles() const { return files_; }

    // Number of points contributed by file i
    std::size_t getPointCount(std::size_t file) const;

    // Hand the collection over; the loader is empty afterwards
    std::vector<GroundParameterPoint> releasePoints();

private:
    bool geographic_;
    std::vector<GroundParameterPoint> points_;
    std::vector<std::string> files_;
    std::vector<std::size_t> counts_;
};

/**
 * @brief Read an asset or site location file
 *
 * Rows are `longitude, latitude[, identifier]`. A first data line whose
 * first two fields are both non-numeric is taken as a header and skipped.
 *
 * @throws InputFileError, MalformedRowError
 */
std::vector<LocationRecord> readLocationFile(const std::string& filename,
                                            bool geographic = true);

/**
 * @brief Split a row on commas and whitespace
 */
std::vector<std::string> tokenizeRow(const std::string& line);

/**
 * @brief Strict decimal parse: the whole token must be a finite number
 */
bool parseNumber(const std::string& token, double& value);

} // namespace GSMP

#endif // GROUND_PARAMETER_LOADER_HPP
