#ifndef SITE_MODEL_WRITER_HPP
#define SITE_MODEL_WRITER_HPP

#include "GSMP.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace GSMP {

/**
 * @brief CSV serialization of the site model
 *
 * Columns are `lon,lat,vs30` followed by whichever of `z1pt0`, `z2pt5`,
 * `vs30measured` are enabled, in that order. Values are written with
 * max_digits10 significant digits; booleans as `true`/`false`.
 *
 * write() is all-or-nothing: rows go to a uniquely named temporary file
 * beside the destination (`<path>.XXXXXX`), which is renamed over it once
 * complete. Existing files other than the destination are never touched.
 */
class SiteModelWriter {
public:
    explicit SiteModelWriter(const SiteModelColumns& columns);

    std::string header() const;
    std::string formatRecord(const SiteRecord& rec) const;

    void writeTo(std::ostream& os, const std::vector<SiteRecord>& records) const;

    /**
     * @throws OutputWriteError if the file cannot be written; no temporary
     *         or partial file is left behind
     */
    void write(const std::string& path, const std::vector<SiteRecord>& records) const;

    // mkstemp template for the temporary files of a destination
    static std::string temporaryPattern(const std::string& path);

private:
    static std::string createTemporary(const std::string& path);

    SiteModelColumns columns_;
};

} // namespace GSMP

#endif // SITE_MODEL_WRITER_HPP
