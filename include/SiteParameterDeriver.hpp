#ifndef SITE_PARAMETER_DERIVER_HPP
#define SITE_PARAMETER_DERIVER_HPP

#include "GSMP.hpp"
#include "SoilDepthModel.hpp"
#include <memory>
#include <set>

namespace GSMP {

/**
 * @brief Turns an accepted association into a site model record
 *
 * The record keeps the target coordinate and the matched Vs30. z1pt0 and
 * z2pt5 are computed by the injected depth models; vs30measured is true
 * when the matched point came from a measured file, else the default.
 * A field is only filled when its column is enabled.
 */
class SiteParameterDeriver {
public:
    SiteParameterDeriver() = default;

    /**
     * @brief Build from a run configuration
     *
     * Models are created by name; measured files are resolved to their
     * position in vs30_files.
     * @throws ConfigurationError for an unknown or mismatched model name
     */
    static SiteParameterDeriver fromConfig(const SiteModelConfig& config);

    // Passing nullptr disables the column
    void setZ1pt0Model(std::shared_ptr<const SoilDepthModel> model);
    void setZ2pt5Model(std::shared_ptr<const SoilDepthModel> model);

    void enableVs30Measured(const std::set<std::size_t>& measured_files,
                            bool default_value = false);
    void disableVs30Measured();

    SiteModelColumns getColumns() const;

    SiteRecord derive(const TargetSite& target, const GroundParameterPoint& point) const;

private:
    std::shared_ptr<const SoilDepthModel> z1pt0_model_;
    std::shared_ptr<const SoilDepthModel> z2pt5_model_;
    bool vs30measured_ = false;
    bool vs30measured_default_ = false;
    std::set<std::size_t> measured_files_;
};

} // namespace GSMP

#endif // SITE_PARAMETER_DERIVER_HPP
