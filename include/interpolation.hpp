#pragma once

#include "field3d.hpp"
#include "source_data.hpp"

#include <string>
#include <vector>

/**
 * @file interpolation.hpp
 * @brief Rectilinear lon/lat source grid to curvilinear LES grid interpolation.
 *
 * Horizontal bilinear weights are computed once per staggered point family
 * (scalar, u, v) and reused for every field, level and time. The vertical
 * step is linear per column in the source vertical coordinate, clamped to
 * the nearest source value outside the source range.
 */

namespace nestinit
{

/**
 * @brief 1-D coordinate axes recovered from 2-D source lon/lat arrays.
 */
struct RectilinearAxes
{
    std::vector<double> lon; ///< One value per source column.
    std::vector<double> lat; ///< One value per source row.
};

/**
 * @brief Recovers the 1-D axes of a rectilinear source grid.
 *
 * NaN entries are skipped. Every column must have a constant longitude and
 * every row a constant latitude (within 1e-6 degrees), and both axes must be
 * strictly monotonic, ascending or descending.
 * @throws DataError otherwise.
 */
RectilinearAxes extract_rectilinear_axes(const SourceData& source);

/**
 * @brief Bilinear interpolation factors for a set of target points.
 *
 * For target point `n` the four source points are `(jl, il)`, `(jl, il+1)`,
 * `(jl+1, il)` and `(jl+1, il+1)`; `fx` and `fy` are the weights of the
 * `+1` neighbours.
 */
struct HorizontalWeights
{
    std::vector<int> il;
    std::vector<int> jl;
    std::vector<double> fx;
    std::vector<double> fy;

    std::size_t size() const { return il.size(); }
};

/**
 * @brief Computes bilinear factors for target points given in lon/lat.
 * @throws DataError when a target point lies outside the source grid.
 */
HorizontalWeights compute_horizontal_weights(const RectilinearAxes& axes,
                                             const std::vector<double>& lon_target,
                                             const std::vector<double>& lat_target);

/**
 * @brief Linear interpolation in a monotonic coordinate, clamped at the ends.
 *
 * `coord` may be increasing or decreasing but must be strictly monotonic;
 * callers check this once per column with `check_monotonic_columns`.
 */
double interpolate_linear_clamped(const double* coord, const double* values, int n, double target);

/**
 * @brief Checks that every column of a `(level, lat, lon)` coordinate volume
 *        is strictly monotonic, all in the same direction.
 *
 * A profile is a volume with `nlat = nlon = 1`.
 * @throws DataError naming `context` and the first offending column.
 */
void check_monotonic_columns(const double* coord, int nlev, int nlat, int nlon, const std::string& context);

/**
 * @brief Interpolates one source volume onto the target grid.
 *
 * @param out Target field `(level, y, x)`; `out.size_y() * out.size_x()`
 *        must equal the number of weights.
 * @param source_field Source volume `(level, lat, lon)`.
 * @param source_coord Source vertical coordinate, same shape.
 * @param nlev Number of source levels.
 * @param nlon Number of source columns.
 * @param weights Horizontal weights of the target point family.
 * @param target_coord Vertical coordinate of the target levels, in the same
 *        unit as `source_coord` (heights or pressures).
 * @throws DataError on shape mismatches or non-monotonic source columns.
 */
template<typename TF>
void interpolate_to_grid(Field3D<TF>& out,
                         const double* source_field,
                         const double* source_coord,
                         int nlev, int nlat, int nlon,
                         const HorizontalWeights& weights,
                         const std::vector<double>& target_coord);

} // namespace nestinit
