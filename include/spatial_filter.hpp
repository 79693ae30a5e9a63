#pragma once

#include "field3d.hpp"

#include <vector>

/**
 * @file spatial_filter.hpp
 * @brief Separable Gaussian smoothing of horizontal planes.
 */

namespace nestinit
{

/**
 * @brief Converts a physical filter width to grid cells, `ceil(sigma_h / dx)`.
 */
int filter_width_in_cells(double sigma_h, double dx);

/**
 * @brief Normalized 1-D Gaussian kernel truncated at 4 sigma.
 */
std::vector<double> gaussian_kernel(int sigma_n);

/**
 * @brief Applies a Gaussian filter with width `sigma_n` cells to every level.
 *
 * The filter is separable (x, then y). Boundaries are reflected about the
 * outer cell edge (`d c b a | a b c d | d c b a`). `sigma_n <= 0` is a no-op.
 */
template<typename TF>
void gaussian_filter(Field3D<TF>& field, int sigma_n);

} // namespace nestinit
