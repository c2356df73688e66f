#include "GroundParameterLoader.hpp"
#include "SiteModelErrors.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace GSMP {

namespace {

bool isSkippable(const std::string& line) {
    for (char c : line) {
        if (c == '#') return true;
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

void checkCoordinate(const std::string& file, std::size_t line, double lon, double lat) {
    if (lon < -180.0 || lon > 180.0) {
        throw MalformedRowError(file, line, "longitude out of range [-180, 180]");
    }
    if (lat < -90.0 || lat > 90.0) {
        throw MalformedRowError(file, line, "latitude out of range [-90, 90]");
    }
}

} // namespace

std::vector<std::string> tokenizeRow(const std::string& line) {
    std::vector<std::string> tokens;
    std::string current;
    bool after_comma = true;  // a leading comma opens an empty field

    for (char c : line) {
        if (c == ',') {
            // Empty field between two commas is kept so the row is rejected
            if (current.empty() && after_comma) tokens.push_back("");
            if (!current.empty()) tokens.push_back(current);
            current.clear();
            after_comma = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
                after_comma = false;
            }
        } else {
            current += c;
            after_comma = false;
        }
    }
    if (!current.empty()) tokens.push_back(current);
    else if (after_comma) tokens.push_back("");

    return tokens;
}

bool parseNumber(const std::string& token, double& value) {
    if (token.empty()) return false;

    const char* begin = token.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);

    // Underflow to a subnormal is a valid value; overflow shows up as inf
    if (end != begin + token.size()) return false;
    if (!std::isfinite(v)) return false;

    value = v;
    return true;
}

// =============================================================================
// GroundParameterLoader
// =============================================================================

std::size_t GroundParameterLoader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw InputFileError(filename);
    }

    const std::size_t file_index = files_.size();
    std::vector<GroundParameterPoint> rows;
    std::string line;
    std::size_t line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        if (isSkippable(line)) continue;

        auto tokens = tokenizeRow(line);
        if (tokens.size() != 3) {
            throw MalformedRowError(filename, line_num,
                                    "expected 3 fields (lon, lat, value), found " +
                                    std::to_string(tokens.size()));
        }

        GroundParameterPoint pt;
        if (!parseNumber(tokens[0], pt.lon) ||
            !parseNumber(tokens[1], pt.lat) ||
            !parseNumber(tokens[2], pt.value)) {
            throw MalformedRowError(filename, line_num, "non-numeric field in '" + line + "'");
        }
        if (geographic_) {
            checkCoordinate(filename, line_num, pt.lon, pt.lat);
        }

        pt.source_file = file_index;
        rows.push_back(pt);
    }

    if (file.bad()) {
        throw InputFileError(filename);
    }

    // Only commit complete files
    points_.insert(points_.end(), rows.begin(), rows.end());
    files_.push_back(filename);
    counts_.push_back(rows.size());

    return rows.size();
}

void GroundParameterLoader::loadFiles(const std::vector<std::string>& filenames) {
    for (const auto& f : filenames) {
        loadFile(f);
    }
}

std::size_t GroundParameterLoader::getPointCount(std::size_t file) const {
    return file < counts_.size() ? counts_[file] : 0;
}

std::vector<GroundParameterPoint> GroundParameterLoader::releasePoints() {
    std::vector<GroundParameterPoint> out;
    out.swap(points_);
    return out;
}

// =============================================================================
// Location files
// =============================================================================

std::vector<LocationRecord> readLocationFile(const std::string& filename, bool geographic) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw InputFileError(filename);
    }

    std::vector<LocationRecord> records;
    std::string line;
    std::size_t line_num = 0;
    bool first_data_line = true;

    while (std::getline(file, line)) {
        line_num++;
        if (isSkippable(line)) continue;

        auto tokens = tokenizeRow(line);
        LocationRecord rec;
        const bool lon_ok = !tokens.empty() && parseNumber(tokens[0], rec.lon);
        const bool lat_ok = tokens.size() >= 2 && parseNumber(tokens[1], rec.lat);
        const bool numeric = lon_ok && lat_ok;

        if (first_data_line) {
            first_data_line = false;
            // A header has no numeric coordinate; a half-numeric row is corrupt data
            if (!lon_ok && !lat_ok) continue;
        }

        if (tokens.size() < 2 || tokens.size() > 3) {
            throw MalformedRowError(filename, line_num,
                                    "expected 2 or 3 fields (lon, lat[, id]), found " +
                                    std::to_string(tokens.size()));
        }
        if (!numeric) {
            throw MalformedRowError(filename, line_num, "non-numeric coordinate in '" + line + "'");
        }
        if (geographic) {
            checkCoordinate(filename, line_num, rec.lon, rec.lat);
        }

        if (tokens.size() == 3) {
            if (tokens[2].empty()) {
                throw MalformedRowError(filename, line_num, "empty identifier");
            }
            rec.id = tokens[2];
        }
        records.push_back(rec);
    }

    if (file.bad()) {
        throw InputFileError(filename);
    }

    return records;
}

} // namespace GSMP
