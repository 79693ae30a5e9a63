/**
 * @file interpolation.cpp
 * @brief Implementation for the openbc module.
 *
 * Axis recovery, bilinear factors and column-wise vertical interpolation.
 * This file is part of the src/openbc subsystem.
 */

#include "interpolation.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace nestinit
{

namespace
{

constexpr double axis_tolerance_deg = 1.0e-6;

/**
 * @brief Checks that all finite values of a line are equal and returns one.
 */
double constant_along(const std::vector<double>& values, std::size_t start, std::size_t stride,
                      int count, const char* what, int line)
{
    double ref = std::nan("");
    for (int n = 0; n < count; ++n)
    {
        const double v = values[start + static_cast<std::size_t>(n) * stride];
        if (!std::isfinite(v))
            continue;
        if (!std::isfinite(ref))
        {
            ref = v;
        }
        else if (std::abs(v - ref) > axis_tolerance_deg)
        {
            std::ostringstream ss;
            ss << "Source grid is not rectilinear: " << what << " varies along " << what
               << " line " << line << " (" << ref << " vs " << v << ")";
            throw DataError(ss.str());
        }
    }
    if (!std::isfinite(ref))
    {
        throw DataError(std::string("Source grid: ") + what + " line " + std::to_string(line) +
                        " is fully masked");
    }
    return ref;
}

void check_monotonic(const std::vector<double>& axis, const char* what)
{
    const bool ascending = axis.back() > axis.front();
    for (std::size_t n = 1; n < axis.size(); ++n)
    {
        const bool ok = ascending ? axis[n] > axis[n-1] : axis[n] < axis[n-1];
        if (!ok)
        {
            throw DataError(std::string("Source ") + what + " axis is not strictly monotonic at index " +
                            std::to_string(n));
        }
    }
}

/**
 * @brief Finds the cell of a monotonic axis containing `value`.
 * @return False when the value is outside the axis.
 */
bool locate(const std::vector<double>& axis, double value, int& index, double& frac)
{
    const int n = static_cast<int>(axis.size());
    const bool ascending = axis.back() > axis.front();
    const double lo = ascending ? axis.front() : axis.back();
    const double hi = ascending ? axis.back() : axis.front();
    const double eps = 1.0e-10 * (hi - lo);

    if (value < lo - eps || value > hi + eps)
        return false;

    int a = 0;
    int b = n - 1;
    while (b - a > 1)
    {
        const int m = (a + b) / 2;
        const bool right = ascending ? axis[m] <= value : axis[m] >= value;
        if (right)
            a = m;
        else
            b = m;
    }

    index = a;
    frac = (value - axis[a]) / (axis[a+1] - axis[a]);
    frac = std::min(1.0, std::max(0.0, frac));
    return true;
}

bool locate_longitude(const std::vector<double>& axis, double lon, int& index, double& frac)
{
    if (locate(axis, lon, index, frac))
        return true;
    if (locate(axis, lon + 360.0, index, frac))
        return true;
    return locate(axis, lon - 360.0, index, frac);
}

}

RectilinearAxes extract_rectilinear_axes(const SourceData& source)
{
    const int nlat = source.nlat;
    const int nlon = source.nlon;

    if (nlat < 2 || nlon < 2 ||
        source.lon.size() != source.plane_size() || source.lat.size() != source.plane_size())
    {
        throw DataError("Source lon/lat arrays are empty or have the wrong shape");
    }

    RectilinearAxes axes;
    axes.lon.resize(nlon);
    axes.lat.resize(nlat);

    for (int i = 0; i < nlon; ++i)
        axes.lon[i] = constant_along(source.lon, i, nlon, nlat, "longitude", i);

    for (int j = 0; j < nlat; ++j)
        axes.lat[j] = constant_along(source.lat, static_cast<std::size_t>(j) * nlon, 1, nlon, "latitude", j);

    check_monotonic(axes.lon, "longitude");
    check_monotonic(axes.lat, "latitude");

    return axes;
}

HorizontalWeights compute_horizontal_weights(const RectilinearAxes& axes,
                                             const std::vector<double>& lon_target,
                                             const std::vector<double>& lat_target)
{
    if (lon_target.size() != lat_target.size())
    {
        throw DataError("Target lon/lat arrays differ in size");
    }

    const std::size_t n = lon_target.size();
    HorizontalWeights w;
    w.il.resize(n);
    w.jl.resize(n);
    w.fx.resize(n);
    w.fy.resize(n);

    for (std::size_t p = 0; p < n; ++p)
    {
        const bool in_lon = locate_longitude(axes.lon, lon_target[p], w.il[p], w.fx[p]);
        const bool in_lat = locate(axes.lat, lat_target[p], w.jl[p], w.fy[p]);

        if (!in_lon || !in_lat)
        {
            std::ostringstream ss;
            ss << "Target point (" << lon_target[p] << ", " << lat_target[p]
               << ") lies outside the source grid (lon " << axes.lon.front() << " .. " << axes.lon.back()
               << ", lat " << axes.lat.front() << " .. " << axes.lat.back() << ")";
            throw DataError(ss.str());
        }
    }

    return w;
}

double interpolate_linear_clamped(const double* coord, const double* values, int n, double target)
{
    if (n == 1)
        return values[0];

    const bool ascending = coord[n-1] > coord[0];
    const int first = ascending ? 0 : n-1;
    const int last = ascending ? n-1 : 0;

    if (target <= coord[first])
        return values[first];
    if (target >= coord[last])
        return values[last];

    int a = 0;
    int b = n - 1;
    while (b - a > 1)
    {
        const int m = (a + b) / 2;
        const bool right = ascending ? coord[m] <= target : coord[m] >= target;
        if (right)
            a = m;
        else
            b = m;
    }

    const double f = (target - coord[a]) / (coord[b] - coord[a]);
    return values[a] + f * (values[b] - values[a]);
}

void check_monotonic_columns(const double* coord, int nlev, int nlat, int nlon, const std::string& context)
{
    if (nlev < 2)
        return;

    const std::size_t plane = static_cast<std::size_t>(nlat) * nlon;
    const bool ascending = coord[plane] > coord[0];

    for (int j = 0; j < nlat; ++j)
        for (int i = 0; i < nlon; ++i)
        {
            const std::size_t ij = static_cast<std::size_t>(j) * nlon + i;
            for (int k = 1; k < nlev; ++k)
            {
                const double below = coord[(k-1) * plane + ij];
                const double above = coord[k * plane + ij];
                const bool ok = ascending ? above > below : above < below;
                if (!ok)
                {
                    std::ostringstream ss;
                    ss << context << ": vertical coordinate of column (lat " << j << ", lon " << i
                       << ") is not strictly " << (ascending ? "increasing" : "decreasing")
                       << " at level " << k << " (" << below << " then " << above << ")";
                    throw DataError(ss.str());
                }
            }
        }
}

template<typename TF>
void interpolate_to_grid(Field3D<TF>& out,
                         const double* source_field,
                         const double* source_coord,
                         int nlev, int nlat, int nlon,
                         const HorizontalWeights& weights,
                         const std::vector<double>& target_coord)
{
    const int ny = out.size_y();
    const int nx = out.size_x();
    const int nz = out.size_z();

    if (static_cast<std::size_t>(ny) * nx != weights.size())
    {
        throw DataError("Interpolation target has " + std::to_string(ny * nx) +
                        " points, weights were computed for " + std::to_string(weights.size()));
    }
    if (static_cast<int>(target_coord.size()) != nz)
    {
        throw DataError("Interpolation target has " + std::to_string(nz) + " levels, " +
                        std::to_string(target_coord.size()) + " target coordinates given");
    }

    check_monotonic_columns(source_coord, nlev, nlat, nlon, "Interpolation source");

    const std::size_t plane = static_cast<std::size_t>(nlat) * nlon;

    #pragma omp parallel for schedule(static)
    for (int j = 0; j < ny; ++j)
    {
        std::vector<double> col_value(nlev);
        std::vector<double> col_coord(nlev);

        for (int i = 0; i < nx; ++i)
        {
            const std::size_t p = static_cast<std::size_t>(j) * nx + i;
            const std::size_t ij00 = static_cast<std::size_t>(weights.jl[p]) * nlon + weights.il[p];
            const std::size_t ij10 = ij00 + 1;
            const std::size_t ij01 = ij00 + nlon;
            const std::size_t ij11 = ij01 + 1;

            const double fx = weights.fx[p];
            const double fy = weights.fy[p];
            const double w00 = (1.0 - fx) * (1.0 - fy);
            const double w10 = fx * (1.0 - fy);
            const double w01 = (1.0 - fx) * fy;
            const double w11 = fx * fy;

            for (int k = 0; k < nlev; ++k)
            {
                const double* f = source_field + k * plane;
                const double* c = source_coord + k * plane;
                col_value[k] = w00*f[ij00] + w10*f[ij10] + w01*f[ij01] + w11*f[ij11];
                col_coord[k] = w00*c[ij00] + w10*c[ij10] + w01*c[ij01] + w11*c[ij11];
            }

            for (int k = 0; k < nz; ++k)
            {
                out(k, j, i) = static_cast<TF>(
                        interpolate_linear_clamped(col_coord.data(), col_value.data(), nlev, target_coord[k]));
            }
        }
    }
}

template void interpolate_to_grid<float>(Field3D<float>&, const double*, const double*, int, int, int,
                                         const HorizontalWeights&, const std::vector<double>&);
template void interpolate_to_grid<double>(Field3D<double>&, const double*, const double*, int, int, int,
                                          const HorizontalWeights&, const std::vector<double>&);

} // namespace nestinit
