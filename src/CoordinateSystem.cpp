#include "CoordinateSystem.hpp"
#include "GSMP.hpp"
#include <cmath>
#include <cstdlib>
#include <cctype>
#include <algorithm>

namespace GSMP {

// ============================================================================
// CRSDefinition Implementation
// ============================================================================

bool CRSDefinition::isGeographicWGS84() const {
    // Authority names are case-insensitive for PROJ
    std::string code = epsg_code;
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (code == "EPSG:4326" || code == "4326") return true;
    if (code == "OGC:CRS84") return true;

    if (proj_string.find("+proj=longlat") != std::string::npos &&
        proj_string.find("+datum=WGS84") != std::string::npos) return true;

    return false;
}

// ============================================================================
// CoordinateTransformer Implementation
// ============================================================================

CoordinateTransformer::CoordinateTransformer()
    : ctx_(proj_context_create()), transform_(nullptr), is_valid_(false) {
}

CoordinateTransformer::~CoordinateTransformer() {
    cleanup();
}

CoordinateTransformer::CoordinateTransformer(CoordinateTransformer&& other) noexcept
    : source_crs_(std::move(other.source_crs_)),
      target_crs_(std::move(other.target_crs_)),
      ctx_(other.ctx_),
      transform_(other.transform_),
      is_valid_(other.is_valid_),
      last_error_(std::move(other.last_error_)) {
    other.ctx_ = nullptr;
    other.transform_ = nullptr;
    other.is_valid_ = false;
}

CoordinateTransformer& CoordinateTransformer::operator=(CoordinateTransformer&& other) noexcept {
    if (this != &other) {
        cleanup();
        source_crs_ = std::move(other.source_crs_);
        target_crs_ = std::move(other.target_crs_);
        ctx_ = other.ctx_;
        transform_ = other.transform_;
        is_valid_ = other.is_valid_;
        last_error_ = std::move(other.last_error_);
        other.ctx_ = nullptr;
        other.transform_ = nullptr;
        other.is_valid_ = false;
    }
    return *this;
}

void CoordinateTransformer::cleanup() {
    if (transform_) {
        proj_destroy(transform_);
        transform_ = nullptr;
    }
    if (ctx_) {
        proj_context_destroy(ctx_);
        ctx_ = nullptr;
    }
    is_valid_ = false;
}

CRSDefinition CoordinateTransformer::parseCRS(const std::string& crs) {
    CRSDefinition def;
    if (crs.empty()) return def;

    if (crs[0] == '+') {
        def.proj_string = crs;
        return def;
    }

    // Bare EPSG number
    bool all_digits = true;
    for (char c : crs) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            all_digits = false;
            break;
        }
    }
    def.epsg_code = all_digits ? "EPSG:" + crs : crs;
    return def;
}

std::string CoordinateTransformer::definitionString(const CRSDefinition& crs) {
    if (!crs.epsg_code.empty()) return crs.epsg_code;
    return crs.proj_string;
}

void CoordinateTransformer::setSourceCRS(const std::string& crs) {
    source_crs_ = parseCRS(crs);
    is_valid_ = false;
}

void CoordinateTransformer::setTargetCRS(const std::string& crs) {
    target_crs_ = parseCRS(crs);
    is_valid_ = false;
}

bool CoordinateTransformer::initialize() {
    if (transform_) {
        proj_destroy(transform_);
        transform_ = nullptr;
    }
    is_valid_ = false;

    if (!ctx_) {
        last_error_ = "PROJ context not available";
        return false;
    }

    const std::string src_str = definitionString(source_crs_);
    if (src_str.empty()) {
        last_error_ = "Source CRS not specified";
        return false;
    }

    const std::string tgt_str = definitionString(target_crs_);
    if (tgt_str.empty()) {
        last_error_ = "Target CRS not specified";
        return false;
    }

    transform_ = proj_create_crs_to_crs(ctx_, src_str.c_str(), tgt_str.c_str(), nullptr);

    if (!transform_) {
        int err = proj_context_errno(ctx_);
        last_error_ = std::string("Failed to create transformation ") + src_str + " -> " +
                      tgt_str + ": " + proj_context_errno_string(ctx_, err);
        return false;
    }

    // Normalize for longitude/latitude ordering
    PJ* norm = proj_normalize_for_visualization(ctx_, transform_);
    if (norm) {
        proj_destroy(transform_);
        transform_ = norm;
    }

    last_error_.clear();
    is_valid_ = true;
    return true;
}

GeoPoint CoordinateTransformer::transform(const GeoPoint& point) const {
    if (!is_valid_ || !transform_) {
        last_error_ = "Transformation not initialized";
        return point;
    }

    PJ_COORD in = proj_coord(point.x, point.y, 0.0, 0.0);
    PJ_COORD out = proj_trans(transform_, PJ_FWD, in);

    if (proj_errno(transform_)) {
        last_error_ = proj_context_errno_string(ctx_, proj_errno(transform_));
        proj_errno_reset(transform_);
        return point;
    }
    if (!std::isfinite(out.xy.x) || !std::isfinite(out.xy.y)) {
        last_error_ = "Transformation produced non-finite coordinates";
        return point;
    }

    return GeoPoint(out.xy.x, out.xy.y);
}

bool CoordinateTransformer::transform(double* x, double* y, std::size_t n) const {
    if (!is_valid_ || !transform_) {
        last_error_ = "Transformation not initialized";
        return false;
    }
    if (n == 0) return true;

    size_t result = proj_trans_generic(
        transform_, PJ_FWD,
        x, sizeof(double), n,
        y, sizeof(double), n,
        nullptr, 0, 0,
        nullptr, 0, 0
    );

    if (result != n) {
        last_error_ = "Not all points transformed successfully";
        return false;
    }

    for (std::size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            last_error_ = "Transformation produced non-finite coordinates";
            return false;
        }
    }

    return true;
}

std::string CoordinateTransformer::getProjVersion() {
    return std::string(proj_info().version);
}

// ============================================================================
// Geodetic Utilities Implementation
// ============================================================================

namespace Geodetic {

double haversineDistance(double lon1, double lat1, double lon2, double lat2) {
    double phi1 = deg2rad(lat1);
    double phi2 = deg2rad(lat2);
    double dPhi = deg2rad(lat2 - lat1);
    double dLambda = deg2rad(lon2 - lon1);

    double a = std::sin(dPhi / 2) * std::sin(dPhi / 2) +
               std::cos(phi1) * std::cos(phi2) *
               std::sin(dLambda / 2) * std::sin(dLambda / 2);
    a = std::min(1.0, a);
    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));

    return EARTH_RADIUS_KM * c;
}

std::array<double, 3> toUnitSphere(double lon, double lat) {
    const double lambda = deg2rad(lon);
    const double phi = deg2rad(lat);
    return {std::cos(phi) * std::cos(lambda),
            std::cos(phi) * std::sin(lambda),
            std::sin(phi)};
}

double kmPerDegree() {
    return EARTH_RADIUS_KM * M_PI / 180.0;
}

} // namespace Geodetic

} // namespace GSMP
