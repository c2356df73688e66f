#include "SoilDepthModel.hpp"
#include "SiteModelErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace GSMP {

// =============================================================================
// Chiou & Youngs (2014)
// =============================================================================

double ChiouYoungs2014Z1pt0::compute(double vs30) const {
    if (!(vs30 > 0.0)) return std::numeric_limits<double>::quiet_NaN();

    if (japan_) {
        const double num = vs30 * vs30 + 412.0 * 412.0;
        const double den = 1360.0 * 1360.0 + 412.0 * 412.0;
        return std::exp(-5.23 / 2.0 * std::log(num / den));
    }

    const double num = std::pow(vs30, 4) + std::pow(571.0, 4);
    const double den = std::pow(1360.0, 4) + std::pow(571.0, 4);
    return std::exp(-7.15 / 4.0 * std::log(num / den));
}

std::string ChiouYoungs2014Z1pt0::getName() const {
    return japan_ ? "CHIOU_YOUNGS_2014_JAPAN" : "CHIOU_YOUNGS_2014";
}

// =============================================================================
// Campbell & Bozorgnia (2014)
// =============================================================================

double CampbellBozorgnia2014Z2pt5::compute(double vs30) const {
    if (!(vs30 > 0.0)) return std::numeric_limits<double>::quiet_NaN();

    if (japan_) {
        return std::exp(5.359 - 1.102 * std::log(vs30));
    }
    return std::exp(7.089 - 1.144 * std::log(vs30));
}

std::string CampbellBozorgnia2014Z2pt5::getName() const {
    return japan_ ? "CAMPBELL_BOZORGNIA_2014_JAPAN" : "CAMPBELL_BOZORGNIA_2014";
}

// =============================================================================
// Factory Function
// =============================================================================

SoilDepthModelType parseSoilDepthModelType(const std::string& type_str) {
    std::string s = type_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "CHIOU_YOUNGS_2014" || s == "CY14") {
        return SoilDepthModelType::CHIOU_YOUNGS_2014;
    } else if (s == "CHIOU_YOUNGS_2014_JAPAN" || s == "CY14_JAPAN") {
        return SoilDepthModelType::CHIOU_YOUNGS_2014_JAPAN;
    } else if (s == "CAMPBELL_BOZORGNIA_2014" || s == "CB14") {
        return SoilDepthModelType::CAMPBELL_BOZORGNIA_2014;
    } else if (s == "CAMPBELL_BOZORGNIA_2014_JAPAN" || s == "CB14_JAPAN") {
        return SoilDepthModelType::CAMPBELL_BOZORGNIA_2014_JAPAN;
    }

    throw ConfigurationError("Unknown soil depth model: " + type_str);
}

DepthParameter depthParameterOf(SoilDepthModelType type) {
    switch (type) {
        case SoilDepthModelType::CHIOU_YOUNGS_2014:
        case SoilDepthModelType::CHIOU_YOUNGS_2014_JAPAN:
            return DepthParameter::Z1PT0;
        case SoilDepthModelType::CAMPBELL_BOZORGNIA_2014:
        case SoilDepthModelType::CAMPBELL_BOZORGNIA_2014_JAPAN:
            return DepthParameter::Z2PT5;
    }
    return DepthParameter::Z1PT0;
}

std::unique_ptr<SoilDepthModel> createSoilDepthModel(const std::string& type_str) {
    switch (parseSoilDepthModelType(type_str)) {
        case SoilDepthModelType::CHIOU_YOUNGS_2014:
            return std::make_unique<ChiouYoungs2014Z1pt0>(false);
        case SoilDepthModelType::CHIOU_YOUNGS_2014_JAPAN:
            return std::make_unique<ChiouYoungs2014Z1pt0>(true);
        case SoilDepthModelType::CAMPBELL_BOZORGNIA_2014:
            return std::make_unique<CampbellBozorgnia2014Z2pt5>(false);
        case SoilDepthModelType::CAMPBELL_BOZORGNIA_2014_JAPAN:
            return std::make_unique<CampbellBozorgnia2014Z2pt5>(true);
    }
    throw ConfigurationError("Unknown soil depth model: " + type_str);
}

} // namespace GSMP
