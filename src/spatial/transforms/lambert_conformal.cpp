/**
 * @file lambert_conformal.cpp
 * @brief Implementation for the spatial module.
 *
 * Lambert conformal conic forward and inverse transforms.
 * This file is part of the src/spatial subsystem.
 */

#include "lambert_conformal.hpp"

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
constexpr double parallel_epsilon = 1.0e-10;

}

LambertConformalTransform::LambertConformalTransform(const proj::ParamList& params)
    : definition_(params.definition()),
      ell_(params.ellipsoid())
{
    params.require_metres();

    const double phi0 = params.get_radians("lat_0", 0.0);
    const double phi1 = params.has("lat_1") ? params.get_radians("lat_1", 0.0) : phi0;
    const double phi2 = params.has("lat_2") ? params.get_radians("lat_2", 0.0) : phi1;

    lam0_ = params.get_radians("lon_0", 0.0);
    k0_ = params.has("k_0") ? params.get_double("k_0", 1.0) : params.get_double("k", 1.0);
    x0_ = params.get_double("x_0", 0.0);
    y0_ = params.get_double("y_0", 0.0);

    if (std::abs(phi1 + phi2) < parallel_epsilon)
    {
        throw ConfigError("Lambert conformal conic: standard parallels symmetric about the equator");
    }
    if (std::abs(phi1) >= half_pi || std::abs(phi2) >= half_pi || std::abs(phi0) > half_pi)
    {
        throw ConfigError("Lambert conformal conic: latitude parameters out of range");
    }
    if (k0_ <= 0.0)
    {
        throw ConfigError("Lambert conformal conic: scale factor must be positive");
    }

    const double sin1 = std::sin(phi1);
    const double m1 = proj::msfn(sin1, std::cos(phi1), ell_.es);
    const double t1 = proj::tsfn(phi1, sin1, ell_.e);

    if (std::abs(phi1 - phi2) >= parallel_epsilon)
    {
        const double sin2 = std::sin(phi2);
        const double m2 = proj::msfn(sin2, std::cos(phi2), ell_.es);
        const double t2 = proj::tsfn(phi2, sin2, ell_.e);
        n_ = std::log(m1 / m2) / std::log(t1 / t2);
    }
    else
    {
        n_ = sin1;
    }

    c_ = ell_.a * k0_ * m1 / (n_ * std::pow(t1, n_));

    if (std::abs(std::abs(phi0) - half_pi) < parallel_epsilon)
    {
        rho0_ = 0.0;
    }
    else
    {
        rho0_ = c_ * std::pow(proj::tsfn(phi0, std::sin(phi0), ell_.e), n_);
    }
}

std::pair<double, double> LambertConformalTransform::forward(double lon, double lat) const
{
    const double phi = lat * deg_to_rad;
    const double lam = proj::normalize_longitude(lon * deg_to_rad - lam0_);

    double rho = 0.0;
    if (std::abs(std::abs(phi) - half_pi) < parallel_epsilon)
    {
        if (phi * n_ <= 0.0)
        {
            throw ConfigError("Lambert conformal conic: pole opposite to the cone apex is not projectable");
        }
    }
    else
    {
        rho = c_ * std::pow(proj::tsfn(phi, std::sin(phi), ell_.e), n_);
    }

    const double theta = n_ * lam;
    return {rho * std::sin(theta) + x0_, rho0_ - rho * std::cos(theta) + y0_};
}

std::pair<double, double> LambertConformalTransform::inverse(double x, double y) const
{
    double xp = x - x0_;
    double yp = rho0_ - (y - y0_);
    double rho = std::hypot(xp, yp);

    if (n_ < 0.0)
    {
        rho = -rho;
        xp = -xp;
        yp = -yp;
    }

    double phi = 0.0;
    double lam = 0.0;
    if (rho != 0.0)
    {
        const double ts = std::pow(rho / c_, 1.0 / n_);
        phi = proj::phi_from_ts(ts, ell_.e);
        lam = std::atan2(xp, yp) / n_;
    }
    else
    {
        phi = n_ > 0.0 ? half_pi : -half_pi;
    }

    return {proj::normalize_longitude(lam + lam0_) * rad_to_deg, phi * rad_to_deg};
}

} // namespace nestinit
