/**
 * @file divergence.cpp
 * @brief Implementation for the openbc module.
 *
 * Surface blending of w, the per-level velocity-potential solve and the
 * divergence diagnostics.
 * This file is part of the src/openbc subsystem.
 */

#include "divergence.hpp"

#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace nestinit
{

namespace
{

template<typename TF>
inline double cell_divergence(const Field3D<TF>& u, const Field3D<TF>& v, const Field3D<TF>& w,
                              const std::vector<TF>& rho, const std::vector<TF>& rhoh,
                              const std::vector<TF>& dz, double dxi, double dyi,
                              int i, int j, int k)
{
    const double div_h = (static_cast<double>(u(k, j, i+1)) - u(k, j, i)) * dxi
                       + (static_cast<double>(v(k, j+1, i)) - v(k, j, i)) * dyi;
    const double div_v = (static_cast<double>(rhoh[k+1]) * w(k+1, j, i)
                        - static_cast<double>(rhoh[k]) * w(k, j, i)) / dz[k];
    return rho[k] * div_h + div_v;
}

template<typename TF>
void check_momentum_shapes(const Field3D<TF>& u, const Field3D<TF>& v, const Field3D<TF>& w,
                           const std::vector<TF>& rho, const std::vector<TF>& rhoh,
                           const std::vector<TF>& dz, int iend, int jend)
{
    const int ktot = u.size_z();
    if (v.size_z() != ktot || w.size_z() != ktot + 1)
    {
        throw DataError("Momentum fields have inconsistent level counts (u " + std::to_string(ktot) +
                        ", v " + std::to_string(v.size_z()) + ", w " + std::to_string(w.size_z()) + ")");
    }
    if (static_cast<int>(rho.size()) < ktot || static_cast<int>(dz.size()) < ktot ||
        static_cast<int>(rhoh.size()) < ktot + 1)
    {
        throw DataError("Base-state profiles are shorter than the momentum fields");
    }
    if (u.size_x() < iend + 1 || v.size_y() < jend + 1 ||
        u.size_y() < jend || v.size_x() < iend || w.size_y() < jend || w.size_x() < iend)
    {
        throw DataError("Momentum fields are too small for the requested region");
    }
}

/**
 * @brief `y = -lap(x)` with homogeneous Dirichlet values outside the region.
 */
void apply_neg_laplacian(const std::vector<double>& x, std::vector<double>& y,
                         int ncx, int ncy, double dxi2, double dyi2)
{
    for (int j = 0; j < ncy; ++j)
    {
        for (int i = 0; i < ncx; ++i)
        {
            const std::size_t n = static_cast<std::size_t>(j) * ncx + i;
            const double xc = x[n];
            const double xw = i > 0       ? x[n - 1]   : 0.0;
            const double xe = i < ncx - 1 ? x[n + 1]   : 0.0;
            const double xs = j > 0       ? x[n - ncx] : 0.0;
            const double xn = j < ncy - 1 ? x[n + ncx] : 0.0;
            y[n] = (2.0 * xc - xw - xe) * dxi2 + (2.0 * xc - xs - xn) * dyi2;
        }
    }
}

double dot(const std::vector<double>& a, const std::vector<double>& b)
{
    double sum = 0.0;
    for (std::size_t n = 0; n < a.size(); ++n)
        sum += a[n] * b[n];
    return sum;
}

}

template<typename TF>
void blend_w_to_zero(Field3D<TF>& w, const std::vector<TF>& zh, double zmax)
{
    if (!(zmax > 0.0))
        return;

    if (static_cast<int>(zh.size()) < w.size_z())
    {
        throw DataError("blend_w_to_zero: fewer half levels than w levels");
    }

    for (int k = 0; k < w.size_z(); ++k)
    {
        const double f = std::min(static_cast<double>(zh[k]) / zmax, 1.0);
        if (f >= 1.0)
            break;

        TF* plane = w.level(k);
        for (std::size_t n = 0; n < w.plane_size(); ++n)
            plane[n] = static_cast<TF>(f * plane[n]);
    }
}

template<typename TF>
CorrectionResult correct_div_uv(Field3D<TF>& u, Field3D<TF>& v, const Field3D<TF>& w,
                                const std::vector<TF>& rho, const std::vector<TF>& rhoh,
                                const std::vector<TF>& dz, double dx, double dy,
                                int ncx, int ncy,
                                const CorrectionSettings& settings,
                                const std::string& context)
{
    check_momentum_shapes(u, v, w, rho, rhoh, dz, ncx, ncy);
    if (ncx <= 0 || ncy <= 0)
    {
        throw DataError(context + ": empty correction region");
    }

    const int ktot = u.size_z();
    const double dxi = 1.0 / dx;
    const double dyi = 1.0 / dy;
    const double dxi2 = dxi * dxi;
    const double dyi2 = dyi * dyi;
    const std::size_t ncells = static_cast<std::size_t>(ncx) * ncy;

    std::vector<double> phi(ncells);
    std::vector<double> r(ncells);
    std::vector<double> p(ncells);
    std::vector<double> ap(ncells);

    CorrectionResult result;

    for (int k = 0; k < ktot; ++k)
    {
        // Right-hand side `div / rho`, so that -lap(phi) = b.
        for (int j = 0; j < ncy; ++j)
            for (int i = 0; i < ncx; ++i)
                r[static_cast<std::size_t>(j) * ncx + i] =
                        cell_divergence(u, v, w, rho, rhoh, dz, dxi, dyi, i, j, k) / rho[k];

        std::fill(phi.begin(), phi.end(), 0.0);

        double rr = dot(r, r);
        const double bnorm = std::sqrt(rr);
        if (!std::isfinite(bnorm))
        {
            std::ostringstream ss;
            ss << context << ": non-finite divergence at level " << k
               << " before the correction; the momentum fields contain NaN or Inf";
            throw NumericalError(ss.str());
        }
        if (bnorm == 0.0)
            continue;

        p = r;
        int iter = 0;
        double rel_res = 1.0;
        while (rel_res > settings.tolerance)
        {
            if (iter == settings.max_iter)
            {
                std::ostringstream ss;
                ss << context << ": divergence correction did not converge at level " << k
                   << " after " << iter << " iterations (relative residual " << rel_res
                   << ", tolerance " << settings.tolerance << ")";
                throw NumericalError(ss.str());
            }

            apply_neg_laplacian(p, ap, ncx, ncy, dxi2, dyi2);
            const double alpha = rr / dot(p, ap);
            for (std::size_t n = 0; n < ncells; ++n)
            {
                phi[n] += alpha * p[n];
                r[n] -= alpha * ap[n];
            }

            const double rr_new = dot(r, r);
            rel_res = std::sqrt(rr_new) / bnorm;
            if (!std::isfinite(rel_res))
            {
                std::ostringstream ss;
                ss << context << ": divergence correction broke down at level " << k
                   << " after " << iter + 1 << " iterations (non-finite residual)";
                throw NumericalError(ss.str());
            }
            const double beta = rr_new / rr;
            for (std::size_t n = 0; n < ncells; ++n)
                p[n] = r[n] + beta * p[n];
            rr = rr_new;
            ++iter;
        }

        result.max_iterations = std::max(result.max_iterations, iter);
        result.max_relative_residual = std::max(result.max_relative_residual, rel_res);

        // Potential gradient on the faces; phi is zero outside the region.
        auto phi_at = [&](int i, int j)
        {
            if (i < 0 || i >= ncx || j < 0 || j >= ncy)
                return 0.0;
            return phi[static_cast<std::size_t>(j) * ncx + i];
        };

        for (int j = 0; j < ncy; ++j)
            for (int i = 0; i <= ncx; ++i)
                u(k, j, i) = static_cast<TF>(u(k, j, i) + (phi_at(i, j) - phi_at(i-1, j)) * dxi);

        for (int j = 0; j <= ncy; ++j)
            for (int i = 0; i < ncx; ++i)
                v(k, j, i) = static_cast<TF>(v(k, j, i) + (phi_at(i, j) - phi_at(i, j-1)) * dyi);
    }

    if (log_debug_enabled())
    {
        std::cout << "[DIVERGENCE] " << context << ": " << ktot << " levels, max "
                  << result.max_iterations << " CG iterations, max relative residual "
                  << result.max_relative_residual << std::endl;
    }

    return result;
}

template<typename TF>
DivergenceCheck check_divergence(const Field3D<TF>& u, const Field3D<TF>& v, const Field3D<TF>& w,
                                 const std::vector<TF>& rho, const std::vector<TF>& rhoh,
                                 const std::vector<TF>& dz, double dx, double dy,
                                 const GridRegion& region)
{
    check_momentum_shapes(u, v, w, rho, rhoh, dz, region.iend, region.jend);

    const double dxi = 1.0 / dx;
    const double dyi = 1.0 / dy;

    DivergenceCheck check;
    check.i = region.istart;
    check.j = region.jstart;

    for (int k = 0; k < u.size_z(); ++k)
        for (int j = region.jstart; j < region.jend; ++j)
            for (int i = region.istart; i < region.iend; ++i)
            {
                const double div = std::abs(cell_divergence(u, v, w, rho, rhoh, dz, dxi, dyi, i, j, k));
                // The first non-finite value is kept as the maximum.
                if (std::isfinite(check.max_abs) && !(div <= check.max_abs))
                {
                    check.max_abs = div;
                    check.i = i;
                    check.j = j;
                    check.k = k;
                }
            }

    return check;
}

template<typename TF>
std::vector<double> mean_w(const Field3D<TF>& w, const GridRegion& region)
{
    std::vector<double> mean(w.size_z(), 0.0);
    const double n = static_cast<double>(region.ncells());

    for (int k = 0; k < w.size_z(); ++k)
    {
        double sum = 0.0;
        for (int j = region.jstart; j < region.jend; ++j)
            for (int i = region.istart; i < region.iend; ++i)
                sum += w(k, j, i);
        mean[k] = sum / n;
    }
    return mean;
}

template<typename TF>
std::vector<double> implied_mean_w(const Field3D<TF>& u, const Field3D<TF>& v, const Field3D<TF>& w,
                                   const std::vector<TF>& rho, const std::vector<TF>& rhoh,
                                   const std::vector<TF>& dz, double dx, double dy,
                                   const GridRegion& region)
{
    check_momentum_shapes(u, v, w, rho, rhoh, dz, region.iend, region.jend);

    const int ktot = u.size_z();
    const double dxi = 1.0 / dx;
    const double dyi = 1.0 / dy;
    const double n = static_cast<double>(region.ncells());

    std::vector<double> wmean(ktot + 1, 0.0);
    wmean[0] = mean_w(w, region)[0];

    for (int k = 0; k < ktot; ++k)
    {
        double sum = 0.0;
        for (int j = region.jstart; j < region.jend; ++j)
            for (int i = region.istart; i < region.iend; ++i)
                sum += (static_cast<double>(u(k, j, i+1)) - u(k, j, i)) * dxi
                     + (static_cast<double>(v(k, j+1, i)) - v(k, j, i)) * dyi;

        const double div_h = sum / n;
        wmean[k+1] = (rhoh[k] * wmean[k] - dz[k] * rho[k] * div_h) / rhoh[k+1];
    }
    return wmean;
}

template void blend_w_to_zero<float>(Field3D<float>&, const std::vector<float>&, double);
template CorrectionResult correct_div_uv<float>(Field3D<float>&, Field3D<float>&, const Field3D<float>&,
                                             const std::vector<float>&, const std::vector<float>&,
                                             const std::vector<float>&, double, double, int, int,
                                             const CorrectionSettings&, const std::string&);
template DivergenceCheck check_divergence<float>(const Field3D<float>&, const Field3D<float>&, const Field3D<float>&,
                                              const std::vector<float>&, const std::vector<float>&,
                                              const std::vector<float>&, double, double, const GridRegion&);
template std::vector<double> mean_w<float>(const Field3D<float>&, const GridRegion&);
template std::vector<double> implied_mean_w<float>(const Field3D<float>&, const Field3D<float>&, const Field3D<float>&,
                                                const std::vector<float>&, const std::vector<float>&,
                                                const std::vector<float>&, double, double, const GridRegion&);

template void blend_w_to_zero<double>(Field3D<double>&, const std::vector<double>&, double);
template CorrectionResult correct_div_uv<double>(Field3D<double>&, Field3D<double>&, const Field3D<double>&,
                                             const std::vector<double>&, const std::vector<double>&,
                                             const std::vector<double>&, double, double, int, int,
                                             const CorrectionSettings&, const std::string&);
template DivergenceCheck check_divergence<double>(const Field3D<double>&, const Field3D<double>&, const Field3D<double>&,
                                              const std::vector<double>&, const std::vector<double>&,
                                              const std::vector<double>&, double, double, const GridRegion&);
template std::vector<double> mean_w<double>(const Field3D<double>&, const GridRegion&);
template std::vector<double> implied_mean_w<double>(const Field3D<double>&, const Field3D<double>&, const Field3D<double>&,
                                                const std::vector<double>&, const std::vector<double>&,
                                                const std::vector<double>&, double, double, const GridRegion&);

} // namespace nestinit
