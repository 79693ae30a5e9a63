/**
 * @file lambert_conformal.hpp
 * @brief Lambert conformal conic transform (ellipsoidal, 1SP and 2SP).
 *
 * Formulas follow Snyder, Map Projections - A Working Manual, 15-1 to 15-11.
 * This file is part of the src/spatial subsystem.
 */

#pragma once

#include "projection.hpp"
#include "proj_params.hpp"

namespace nestinit
{

class LambertConformalTransform : public MapTransform
{
public:
    explicit LambertConformalTransform(const proj::ParamList& params);

    std::pair<double, double> forward(double lon, double lat) const override;
    std::pair<double, double> inverse(double x, double y) const override;
    const std::string& definition() const override { return definition_; }

private:
    std::string definition_;
    proj::Ellipsoid ell_;
    double lam0_;
    double k0_;
    double x0_;
    double y0_;
    double n_;
    double c_;    ///< a * k0 * F
    double rho0_;
};

} // namespace nestinit
