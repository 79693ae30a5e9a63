/**
 * @file proj_params.hpp
 * @brief Parameter-string parsing shared by the map transforms.
 *
 * Splits a `+key=value` definition into a lookup table and resolves the
 * reference ellipsoid. Also holds the conformal-latitude helpers used by
 * both the Lambert conformal conic and Mercator transforms.
 */

#pragma once

#include <map>
#include <string>

namespace nestinit
{
namespace proj
{

struct Ellipsoid
{
    double a = 6378137.0;
    double es = 0.0; ///< Squared eccentricity.
    double e = 0.0;
};

class ParamList
{
public:
    explicit ParamList(const std::string& definition);

    bool has(const std::string& key) const;
    std::string get_string(const std::string& key) const;

    /**
     * @brief Returns a numeric parameter, or `fallback` when absent.
     */
    double get_double(const std::string& key, double fallback) const;

    /**
     * @brief Returns an angular parameter converted to radians.
     */
    double get_radians(const std::string& key, double fallback_deg) const;

    Ellipsoid ellipsoid() const;

    /**
     * @brief Throws unless the linear unit is metres.
     */
    void require_metres() const;

    const std::string& definition() const { return definition_; }

private:
    std::string definition_;
    std::map<std::string, std::string> values_;
};

/**
 * @brief `cos(phi) / sqrt(1 - es sin^2(phi))`.
 */
double msfn(double sinphi, double cosphi, double es);

/**
 * @brief Isometric-latitude function `t(phi)` of Snyder (15-9).
 */
double tsfn(double phi, double sinphi, double e);

/**
 * @brief Inverts `tsfn` by fixed-point iteration; throws `NumericalError`
 *        when it does not converge.
 */
double phi_from_ts(double ts, double e);

double normalize_longitude(double lam);

} // namespace proj
} // namespace nestinit
