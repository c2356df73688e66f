#include "SiteModelWriter.hpp"
#include "SiteModelErrors.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>
#include <vector>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

namespace GSMP {

namespace {

void removeQuietly(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
}

} // namespace

SiteModelWriter::SiteModelWriter(const SiteModelColumns& columns) : columns_(columns) {}

std::string SiteModelWriter::header() const {
    std::string h = "lon,lat,vs30";
    if (columns_.z1pt0) h += ",z1pt0";
    if (columns_.z2pt5) h += ",z2pt5";
    if (columns_.vs30measured) h += ",vs30measured";
    return h;
}

std::string SiteModelWriter::formatRecord(const SiteRecord& rec) const {
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10);

    ss << rec.lon << ',' << rec.lat << ',' << rec.vs30;
    if (columns_.z1pt0) ss << ',' << rec.z1pt0;
    if (columns_.z2pt5) ss << ',' << rec.z2pt5;
    if (columns_.vs30measured) ss << ',' << (rec.vs30measured ? "true" : "false");

    return ss.str();
}

void SiteModelWriter::writeTo(std::ostream& os, const std::vector<SiteRecord>& records) const {
    os << header() << '\n';
    for (const auto& rec : records) {
        os << formatRecord(rec) << '\n';
    }
}

std::string SiteModelWriter::temporaryPattern(const std::string& path) {
    return path + ".XXXXXX";
}

std::string SiteModelWriter::createTemporary(const std::string& path) {
    std::string pattern = temporaryPattern(path);
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = mkstemp(name.data());
    if (fd < 0) {
        throw OutputWriteError(path, "cannot create temporary file beside destination");
    }

    // mkstemp creates 0600; give the result the permissions a plain create would
    const mode_t mask = umask(0);
    umask(mask);
    const int chmod_rc = fchmod(fd, 0666 & ~mask);
    const int close_rc = close(fd);
    if (chmod_rc != 0 || close_rc != 0) {
        removeQuietly(name.data());
        throw OutputWriteError(path, "cannot prepare temporary file");
    }

    return std::string(name.data());
}

void SiteModelWriter::write(const std::string& path,
                            const std::vector<SiteRecord>& records) const {
    if (path.empty()) {
        throw OutputWriteError(path, "empty output path");
    }

    const std::filesystem::path target(path);
    const std::filesystem::path tmp(createTemporary(path));

    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            removeQuietly(tmp);
            throw OutputWriteError(path, "cannot create " + tmp.string());
        }

        writeTo(out, records);
        out.flush();
        if (!out) {
            out.close();
            removeQuietly(tmp);
            throw OutputWriteError(path, "write failed");
        }
        out.close();
        if (out.fail()) {
            removeQuietly(tmp);
            throw OutputWriteError(path, "close failed");
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        removeQuietly(tmp);
        throw OutputWriteError(path, ec.message());
    }
}

} // namespace GSMP
