/**
 * @file proj_params.cpp
 * @brief Implementation for the spatial module.
 *
 * Parameter-string parsing and ellipsoid helpers for the map transforms.
 * This file is part of the src/spatial subsystem.
 */

#include "proj_params.hpp"

#include "errors.hpp"
#include "physical_constants.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <sstream>

namespace nestinit
{
namespace proj
{

namespace
{

constexpr double half_pi = 0.5 * physical_constants::pi;
constexpr double deg_to_rad = physical_constants::pi / 180.0;
constexpr int max_phi_iterations = 15;
constexpr double phi_tolerance = 1.0e-12;

Ellipsoid ellipsoid_from_flattening(double a, double rf)
{
    Ellipsoid ell;
    ell.a = a;
    const double f = 1.0 / rf;
    ell.es = 2.0 * f - f * f;
    ell.e = std::sqrt(ell.es);
    return ell;
}

}

ParamList::ParamList(const std::string& definition) : definition_(definition)
{
    std::istringstream stream(definition);
    std::string token;
    while (stream >> token)
    {
        if (token.empty() || token[0] != '+')
        {
            throw ConfigError("Malformed projection parameter '" + token + "' in '" + definition + "'");
        }
        token.erase(0, 1);

        const std::size_t eq = token.find('=');
        if (eq == std::string::npos)
        {
            values_[strutil::lower_copy(token)] = "";
        }
        else
        {
            values_[strutil::lower_copy(token.substr(0, eq))] = token.substr(eq + 1);
        }
    }

    if (!has("proj"))
    {
        throw ConfigError("Projection definition without +proj: '" + definition + "'");
    }
}

bool ParamList::has(const std::string& key) const
{
    return values_.count(key) != 0;
}

std::string ParamList::get_string(const std::string& key) const
{
    const auto it = values_.find(key);
    return it == values_.end() ? std::string() : it->second;
}

double ParamList::get_double(const std::string& key, double fallback) const
{
    const auto it = values_.find(key);
    if (it == values_.end())
    {
        return fallback;
    }

    std::size_t consumed = 0;
    double value = 0.0;
    try
    {
        value = std::stod(it->second, &consumed);
    }
    catch (const std::exception&)
    {
        consumed = 0;
    }

    if (consumed == 0 || consumed != it->second.size() || !std::isfinite(value))
    {
        throw ConfigError("Invalid numeric projection parameter +" + key + "=" + it->second);
    }
    return value;
}

double ParamList::get_radians(const std::string& key, double fallback_deg) const
{
    return get_double(key, fallback_deg) * deg_to_rad;
}

Ellipsoid ParamList::ellipsoid() const
{
    if (has("r"))
    {
        Ellipsoid ell;
        ell.a = get_double("r", 0.0);
        if (ell.a <= 0.0)
        {
            throw ConfigError("Projection sphere radius must be positive");
        }
        return ell;
    }

    if (has("a"))
    {
        const double a = get_double("a", 0.0);
        if (a <= 0.0)
        {
            throw ConfigError("Projection semi-major axis must be positive");
        }
        if (has("b"))
        {
            const double b = get_double("b", a);
            if (b <= 0.0 || b > a)
            {
                throw ConfigError("Projection semi-minor axis must be in (0, a]");
            }
            Ellipsoid ell;
            ell.a = a;
            ell.es = 1.0 - (b * b) / (a * a);
            ell.e = std::sqrt(ell.es);
            return ell;
        }
        if (has("rf"))
        {
            return ellipsoid_from_flattening(a, get_double("rf", 0.0));
        }
        Ellipsoid ell;
        ell.a = a;
        return ell;
    }

    std::string name = strutil::lower_copy(get_string("ellps"));
    if (name.empty())
    {
        name = strutil::lower_copy(get_string("datum"));
    }

    if (name.empty() || name == "wgs84")
    {
        return ellipsoid_from_flattening(6378137.0, 298.257223563);
    }
    if (name == "grs80" || name == "etrs89")
    {
        return ellipsoid_from_flattening(6378137.0, 298.257222101);
    }
    if (name == "sphere")
    {
        Ellipsoid ell;
        ell.a = 6370997.0;
        return ell;
    }

    throw ConfigError("Unsupported ellipsoid '" + name + "' in '" + definition_ + "'");
}

void ParamList::require_metres() const
{
    const std::string units = strutil::lower_copy(get_string("units"));
    if (!units.empty() && units != "m")
    {
        throw ConfigError("Only metre units are supported, got +units=" + units);
    }
    if (has("to_meter") && get_double("to_meter", 1.0) != 1.0)
    {
        throw ConfigError("Only metre units are supported, got +to_meter");
    }
}

double msfn(double sinphi, double cosphi, double es)
{
    return cosphi / std::sqrt(1.0 - es * sinphi * sinphi);
}

double tsfn(double phi, double sinphi, double e)
{
    const double con = e * sinphi;
    return std::tan(0.5 * (half_pi - phi)) / std::pow((1.0 - con) / (1.0 + con), 0.5 * e);
}

double phi_from_ts(double ts, double e)
{
    const double half_e = 0.5 * e;
    double phi = half_pi - 2.0 * std::atan(ts);

    for (int i = 0; i < max_phi_iterations; ++i)
    {
        const double con = e * std::sin(phi);
        const double dphi =
            half_pi - 2.0 * std::atan(ts * std::pow((1.0 - con) / (1.0 + con), half_e)) - phi;
        phi += dphi;
        if (std::abs(dphi) <= phi_tolerance)
        {
            return phi;
        }
    }

    std::ostringstream oss;
    oss << "Inverse latitude iteration did not converge (ts=" << ts << ")";
    throw NumericalError(oss.str());
}

double normalize_longitude(double lam)
{
    const double two_pi = 2.0 * physical_constants::pi;
    while (lam > physical_constants::pi) lam -= two_pi;
    while (lam < -physical_constants::pi) lam += two_pi;
    return lam;
}

} // namespace proj
} // namespace nestinit
