/**
 * @file mercator.cpp
 * @brief Implementation for the spatial module.
 *
 * Mercator forward and inverse transforms (Snyder 7-6, 7-7, 7-9).
 * This file is part of the src/spatial subsystem.
 */

#include "mercator.hpp"

#include "errors.hpp"
#include "physical_constants.hpp"

#include <cmath>

namespace nestinit
{

namespace
{

constexpr double half_pi = 0.5 * physical_constants::pi;
constexpr double rad_to_deg = 180.0 / physical_constants::pi;
constexpr double deg_to_rad = physical_constants::pi / 180.0;

}

MercatorTransform::MercatorTransform(const proj::ParamList& params)
    : definition_(params.definition()),
      ell_(params.ellipsoid())
{
    params.require_metres();

    lam0_ = params.get_radians("lon_0", 0.0);
    x0_ = params.get_double("x_0", 0.0);
    y0_ = params.get_double("y_0", 0.0);

    if (params.has("lat_ts"))
    {
        const double phits = params.get_radians("lat_ts", 0.0);
        if (std::abs(phits) >= half_pi)
        {
            throw ConfigError("Mercator: lat_ts must be within (-90, 90)");
        }
        k0_ = proj::msfn(std::sin(phits), std::cos(phits), ell_.es);
    }
    else
    {
        k0_ = params.has("k_0") ? params.get_double("k_0", 1.0) : params.get_double("k", 1.0);
    }

    if (k0_ <= 0.0)
    {
        throw ConfigError("Mercator: scale factor must be positive");
    }
}

std::pair<double, double> MercatorTransform::forward(double lon, double lat) const
{
    const double phi = lat * deg_to_rad;
    if (std::abs(phi) >= half_pi)
    {
        throw ConfigError("Mercator: poles are not projectable");
    }

    const double lam = proj::normalize_longitude(lon * deg_to_rad - lam0_);
    const double ak0 = ell_.a * k0_;
    return {ak0 * lam + x0_, -ak0 * std::log(proj::tsfn(phi, std::sin(phi), ell_.e)) + y0_};
}

std::pair<double, double> MercatorTransform::inverse(double x, double y) const
{
    const double ak0 = ell_.a * k0_;
    const double phi = proj::phi_from_ts(std::exp(-(y - y0_) / ak0), ell_.e);
    const double lam = (x - x0_) / ak0;
    return {proj::normalize_longitude(lam + lam0_) * rad_to_deg, phi * rad_to_deg};
}

} // namespace nestinit
