#include "SiteParameterDeriver.hpp"
#include "SiteModelErrors.hpp"
#include <algorithm>

namespace GSMP {

SiteParameterDeriver SiteParameterDeriver::fromConfig(const SiteModelConfig& config) {
    SiteParameterDeriver deriver;

    if (config.derive_z1pt0) {
        std::shared_ptr<const SoilDepthModel> model = createSoilDepthModel(config.z1pt0_model);
        deriver.setZ1pt0Model(model);
    }
    if (config.derive_z2pt5) {
        std::shared_ptr<const SoilDepthModel> model = createSoilDepthModel(config.z2pt5_model);
        deriver.setZ2pt5Model(model);
    }

    if (config.derive_vs30measured) {
        std::set<std::size_t> measured;
        for (std::size_t i = 0; i < config.vs30_files.size(); ++i) {
            if (std::find(config.measured_files.begin(), config.measured_files.end(),
                          config.vs30_files[i]) != config.measured_files.end()) {
                measured.insert(i);
            }
        }
        deriver.enableVs30Measured(measured, config.vs30measured_default);
    }

    return deriver;
}

void SiteParameterDeriver::setZ1pt0Model(std::shared_ptr<const SoilDepthModel> model) {
    if (model && model->getParameter() != DepthParameter::Z1PT0) {
        throw ConfigurationError("Model " + model->getName() + " does not compute z1pt0");
    }
    z1pt0_model_ = std::move(model);
}

void SiteParameterDeriver::setZ2pt5Model(std::shared_ptr<const SoilDepthModel> model) {
    if (model && model->getParameter() != DepthParameter::Z2PT5) {
        throw ConfigurationError("Model " + model->getName() + " does not compute z2pt5");
    }
    z2pt5_model_ = std::move(model);
}

void SiteParameterDeriver::enableVs30Measured(const std::set<std::size_t>& measured_files,
                                              bool default_value) {
    vs30measured_ = true;
    vs30measured_default_ = default_value;
    measured_files_ = measured_files;
}

void SiteParameterDeriver::disableVs30Measured() {
    vs30measured_ = false;
    vs30measured_default_ = false;
    measured_files_.clear();
}

SiteModelColumns SiteParameterDeriver::getColumns() const {
    SiteModelColumns columns;
    columns.z1pt0 = static_cast<bool>(z1pt0_model_);
    columns.z2pt5 = static_cast<bool>(z2pt5_model_);
    columns.vs30measured = vs30measured_;
    return columns;
}

SiteRecord SiteParameterDeriver::derive(const TargetSite& target,
                                        const GroundParameterPoint& point) const {
    SiteRecord rec;
    rec.lon = target.lon;
    rec.lat = target.lat;
    rec.vs30 = point.value;

    if (z1pt0_model_) rec.z1pt0 = z1pt0_model_->compute(point.value);
    if (z2pt5_model_) rec.z2pt5 = z2pt5_model_->compute(point.value);

    if (vs30measured_) {
        rec.vs30measured = measured_files_.count(point.source_file) > 0
            ? true
            : vs30measured_default_;
    }

    return rec;
}

} // namespace GSMP
