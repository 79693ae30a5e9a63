#pragma once

#include <map>
#include <string>
#include <vector>

/**
 * @file source_data.hpp
 * @brief Coarse reanalysis fields handed to the nesting pipeline.
 *
 * All 4-D arrays are `(time, level, lat, lon)` row-major, in physical units.
 * Longitude and latitude are 2-D `(lat, lon)` arrays that must describe a
 * rectilinear grid; individual entries may be NaN (masked) as long as every
 * row and column keeps at least one finite value. The vertical coordinate is
 * given per grid point and time, either as height (m) or pressure (Pa).
 */

namespace nestinit
{

enum class VerticalCoordinate
{
    height,
    pressure
};

VerticalCoordinate parse_vertical_coordinate(const std::string& value);
const char* to_string(VerticalCoordinate coordinate);

struct SourceData
{
    int ntime = 0;
    int nlev = 0;
    int nlat = 0;
    int nlon = 0;

    std::vector<double> lon;   ///< (lat, lon), degrees.
    std::vector<double> lat;   ///< (lat, lon), degrees.
    std::vector<double> time;  ///< Seconds since the start of the run.

    VerticalCoordinate vertical = VerticalCoordinate::height;
    std::vector<double> zcoord; ///< (time, level, lat, lon)

    std::map<std::string, std::vector<double>> fields;

    std::size_t plane_size() const { return static_cast<std::size_t>(nlat) * nlon; }
    std::size_t volume_size() const { return plane_size() * nlev; }

    bool has_field(const std::string& name) const { return fields.count(name) > 0; }

    /**
     * @brief Returns the field `name` at time index `t`, `(level, lat, lon)`.
     * @throws DataError when the field is missing.
     */
    const double* field_at(const std::string& name, int t) const;

    /**
     * @brief Returns the vertical coordinate at time index `t`.
     */
    const double* zcoord_at(int t) const;

    /**
     * @brief Checks dimensions, array sizes and the time axis.
     * @throws DataError on any inconsistency.
     */
    void validate() const;
};

} // namespace nestinit
