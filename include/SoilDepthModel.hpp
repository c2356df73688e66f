#ifndef SOIL_DEPTH_MODEL_HPP
#define SOIL_DEPTH_MODEL_HPP

#include <string>
#include <memory>
#include <functional>
#include <utility>

namespace GSMP {

/**
 * @brief Secondary soil parameters derived from Vs30
 */
enum class DepthParameter {
    Z1PT0,              // Depth to Vs = 1.0 km/s (m)
    Z2PT5               // Depth to Vs = 2.5 km/s (km)
};

/**
 * @brief Published Vs30-to-depth regressions
 */
enum class SoilDepthModelType {
    CHIOU_YOUNGS_2014,              // z1pt0, global (California) model
    CHIOU_YOUNGS_2014_JAPAN,        // z1pt0, Japan
    CAMPBELL_BOZORGNIA_2014,        // z2pt5, California
    CAMPBELL_BOZORGNIA_2014_JAPAN   // z2pt5, Japan
};

/**
 * @brief Base class for Vs30-to-depth transforms
 *
 * The site model pipeline only sees this interface; any regression (or a
 * plain function, see FunctionSoilDepthModel) can be injected.
 * compute() returns NaN for non-positive Vs30.
 */
class SoilDepthModel {
public:
    explicit SoilDepthModel(DepthParameter parameter) : parameter_(parameter) {}
    virtual ~SoilDepthModel() = default;

    virtual double compute(double vs30) const = 0;
    virtual std::string getName() const = 0;

    DepthParameter getParameter() const { return parameter_; }

protected:
    DepthParameter parameter_;
};

/**
 * @brief Chiou & Youngs (2014) z1pt0 in meters
 *
 * Global: ln z1 = -7.15/4 ln((Vs30^4 + 571^4) / (1360^4 + 571^4))
 * Japan:  ln z1 = -5.23/2 ln((Vs30^2 + 412^2) / (1360^2 + 412^2))
 */
class ChiouYoungs2014Z1pt0 : public SoilDepthModel {
public:
    explicit ChiouYoungs2014Z1pt0(bool japan = false)
        : SoilDepthModel(DepthParameter::Z1PT0), japan_(japan) {}

    double compute(double vs30) const override;
    std::string getName() const override;

private:
    bool japan_;
};

/**
 * @brief Campbell & Bozorgnia (2014) z2pt5 in km
 *
 * California: ln z2.5 = 7.089 - 1.144 ln Vs30
 * Japan:      ln z2.5 = 5.359 - 1.102 ln Vs30
 */
class CampbellBozorgnia2014Z2pt5 : public SoilDepthModel {
public:
    explicit CampbellBozorgnia2014Z2pt5(bool japan = false)
        : SoilDepthModel(DepthParameter::Z2PT5), japan_(japan) {}

    double compute(double vs30) const override;
    std::string getName() const override;

private:
    bool japan_;
};

/**
 * @brief Wraps an arbitrary Vs30 -> depth function
 */
class FunctionSoilDepthModel : public SoilDepthModel {
public:
    using Transform = std::function<double(double)>;

    FunctionSoilDepthModel(DepthParameter parameter, Transform fn,
                           std::string name = "CUSTOM")
        : SoilDepthModel(parameter), fn_(std::move(fn)), name_(std::move(name)) {}

    double compute(double vs30) const override { return fn_(vs30); }
    std::string getName() const override { return name_; }

private:
    Transform fn_;
    std::string name_;
};

/**
 * @brief Parse a regression name (case-insensitive)
 * @throws ConfigurationError for unknown names
 */
SoilDepthModelType parseSoilDepthModelType(const std::string& type_str);

/**
 * @brief The parameter a regression computes
 */
DepthParameter depthParameterOf(SoilDepthModelType type);

/**
 * @brief Factory function to create a regression by name
 * @throws ConfigurationError for unknown names
 */
std::unique_ptr<SoilDepthModel> createSoilDepthModel(const std::string& type_str);

} // namespace GSMP

#endif // SOIL_DEPTH_MODEL_HPP
