/**
 * @file mercator.hpp
 * @brief Ellipsoidal Mercator transform.
 *
 * This file is part of the src/spatial subsystem.
 */

#pragma once

#include "projection.hpp"
#include "proj_params.hpp"

namespace nestinit
{

class MercatorTransform : public MapTransform
{
public:
    explicit MercatorTransform(const proj::ParamList& params);

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
};

} // namespace nestinit
