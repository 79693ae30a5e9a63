#pragma once

#include "field3d.hpp"

#include <string>
#include <vector>

/**
 * @file divergence.hpp
 * @brief Density-weighted divergence and its removal from horizontal momentum.
 *
 * The stencil is the host model's second-order finite-volume mass balance:
 *
 *     div = rho[k] * ((u[i+1] - u[i]) / dx + (v[j+1] - v[j]) / dy)
 *         + (rhoh[k+1] * w[k+1] - rhoh[k] * w[k]) / dz[k]
 *
 * with `u` on x-faces, `v` on y-faces and `w` on half levels; face index
 * `i` is the west face of cell `i`. Fields are `(level, y, x)`; `w` has one
 * level more than `u` and `v`.
 */

namespace nestinit
{

/**
 * @brief Half-open cell index range `[istart, iend) x [jstart, jend)`.
 */
struct GridRegion
{
    int istart = 0;
    int iend = 0;
    int jstart = 0;
    int jend = 0;

    int ncells() const { return (iend - istart) * (jend - jstart); }
};

struct CorrectionSettings
{
    double tolerance = 1.0e-12; ///< Relative residual of the potential solve.
    int max_iter = 20000;
};

struct CorrectionResult
{
    int max_iterations = 0;
    double max_relative_residual = 0.0;
};

struct DivergenceCheck
{
    double max_abs = 0.0;
    int i = 0;
    int j = 0;
    int k = 0;
};

/**
 * @brief Scales `w` by `min(zh / zmax, 1)`, forcing zero at the surface.
 */
template<typename TF>
void blend_w_to_zero(Field3D<TF>& w, const std::vector<TF>& zh, double zmax);

/**
 * @brief Removes the divergence of the momentum field by correcting `u` and `v`.
 *
 * Per level, the velocity potential `phi` solving `rho * lap(phi) = -div` on
 * cells `[0, ncx) x [0, ncy)`, with `phi = 0` one cell outside, is found with
 * conjugate gradients. Its gradient is added to `u` (faces `0..ncx`) and `v`
 * (faces `0..ncy`), after which the divergence vanishes in every cell of the
 * region. `w` is not modified, so the domain-mean vertical velocity stays
 * that of the source.
 *
 * @param context Prefix for error messages (field and time).
 * @throws NumericalError when a level does not converge or the input
 *         holds non-finite values.
 */
template<typename TF>
CorrectionResult correct_div_uv(Field3D<TF>& u, Field3D<TF>& v, const Field3D<TF>& w,
                                const std::vector<TF>& rho, const std::vector<TF>& rhoh,
                                const std::vector<TF>& dz, double dx, double dy,
                                int ncx, int ncy,
                                const CorrectionSettings& settings,
                                const std::string& context);

/**
 * @brief Maximum absolute divergence inside `region` and where it occurs.
 *
 * A non-finite divergence is reported as the maximum.
 */
template<typename TF>
DivergenceCheck check_divergence(const Field3D<TF>& u, const Field3D<TF>& v, const Field3D<TF>& w,
                                 const std::vector<TF>& rho, const std::vector<TF>& rhoh,
                                 const std::vector<TF>& dz, double dx, double dy,
                                 const GridRegion& region);

/**
 * @brief Mean of `w` over `region` at every half level.
 */
template<typename TF>
std::vector<double> mean_w(const Field3D<TF>& w, const GridRegion& region);

/**
 * @brief Mean vertical velocity implied by the horizontal wind.
 *
 * Integrates the region-mean mass balance upward, starting from the mean of
 * `w` at the surface half level.
 */
template<typename TF>
std::vector<double> implied_mean_w(const Field3D<TF>& u, const Field3D<TF>& v, const Field3D<TF>& w,
                                   const std::vector<TF>& rho, const std::vector<TF>& rhoh,
                                   const std::vector<TF>& dz, double dx, double dy,
                                   const GridRegion& region);

} // namespace nestinit
