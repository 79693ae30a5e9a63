/**
 * @file source_data.cpp
 * @brief Implementation for the openbc module.
 *
 * Consistency checks on the reanalysis input.
 * This file is part of the src/openbc subsystem.
 */

#include "source_data.hpp"

#include "errors.hpp"
#include "interpolation.hpp"
#include "string_utils.hpp"

#include <cmath>

namespace nestinit
{

VerticalCoordinate parse_vertical_coordinate(const std::string& value)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));
    if (normalized == "height" || normalized == "z")
        return VerticalCoordinate::height;
    if (normalized == "pressure" || normalized == "p")
        return VerticalCoordinate::pressure;

    throw ConfigError("Unknown vertical coordinate '" + value + "'. Valid values: height, pressure");
}

const char* to_string(VerticalCoordinate coordinate)
{
    return coordinate == VerticalCoordinate::pressure ? "pressure" : "height";
}

const double* SourceData::field_at(const std::string& name, int t) const
{
    const auto it = fields.find(name);
    if (it == fields.end())
    {
        throw DataError("Source field '" + name + "' is missing");
    }
    if (t < 0 || t >= ntime)
    {
        throw DataError("Source field '" + name + "': time index " + std::to_string(t) + " out of range");
    }
    return it->second.data() + static_cast<std::size_t>(t) * volume_size();
}

const double* SourceData::zcoord_at(int t) const
{
    if (t < 0 || t >= ntime)
    {
        throw DataError("Source vertical coordinate: time index " + std::to_string(t) + " out of range");
    }
    return zcoord.data() + static_cast<std::size_t>(t) * volume_size();
}

void SourceData::validate() const
{
    if (ntime <= 0 || nlev <= 0 || nlat < 2 || nlon < 2)
    {
        throw DataError("Source data dimensions (time=" + std::to_string(ntime) + ", level=" +
                        std::to_string(nlev) + ", lat=" + std::to_string(nlat) + ", lon=" +
                        std::to_string(nlon) + ") are invalid; at least 2x2 horizontal points are required");
    }

    if (lon.size() != plane_size() || lat.size() != plane_size())
    {
        throw DataError("Source lon/lat arrays do not have shape (" + std::to_string(nlat) + ", " +
                        std::to_string(nlon) + ")");
    }

    if (static_cast<int>(time.size()) != ntime)
    {
        throw DataError("Source time axis has " + std::to_string(time.size()) + " entries, expected " +
                        std::to_string(ntime));
    }
    for (int t = 1; t < ntime; ++t)
    {
        if (!(time[t] > time[t-1]))
        {
            throw DataError("Source time axis is not strictly increasing at index " + std::to_string(t));
        }
    }

    const std::size_t expected = volume_size() * static_cast<std::size_t>(ntime);
    if (zcoord.size() != expected)
    {
        throw DataError(std::string("Source ") + to_string(vertical) + " coordinate has " +
                        std::to_string(zcoord.size()) + " values, expected " + std::to_string(expected));
    }

    for (int t = 0; t < ntime; ++t)
    {
        check_monotonic_columns(zcoord_at(t), nlev, nlat, nlon,
                                std::string("Source ") + to_string(vertical) + " coordinate at time index " +
                                std::to_string(t));
    }

    for (const auto& [name, values] : fields)
    {
        if (values.size() != expected)
        {
            throw DataError("Source field '" + name + "' has " + std::to_string(values.size()) +
                            " values, expected " + std::to_string(expected) +
                            " (time, level, lat, lon)");
        }
    }
}

} // namespace nestinit
