/**
 * @file spatial_filter.cpp
 * @brief Implementation for the openbc module.
 *
 * Gaussian kernel construction and the per-level separable filter.
 * This file is part of the src/openbc subsystem.
 */

#include "spatial_filter.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>

namespace nestinit
{

namespace
{

constexpr double truncate_sigmas = 4.0;

/**
 * @brief Maps an out-of-range index back into [0, n) by half-sample reflection.
 */
inline int reflect_index(int m, int n)
{
    const int period = 2 * n;
    m %= period;
    if (m < 0)
        m += period;
    return m < n ? m : period - 1 - m;
}

void filter_line(const double* in, double* out, int n, const std::vector<double>& kernel, int radius)
{
    for (int p = 0; p < n; ++p)
    {
        double sum = 0.0;
        for (int q = -radius; q <= radius; ++q)
        {
            const int m = p + q;
            const int src = (m >= 0 && m < n) ? m : reflect_index(m, n);
            sum += kernel[q + radius] * in[src];
        }
        out[p] = sum;
    }
}

}

int filter_width_in_cells(double sigma_h, double dx)
{
    if (!(dx > 0.0))
    {
        throw ConfigError("Filter: grid spacing must be positive");
    }
    if (sigma_h < 0.0 || !std::isfinite(sigma_h))
    {
        throw ConfigError("Filter: sigma_h must be a non-negative length");
    }
    return static_cast<int>(std::ceil(sigma_h / dx));
}

std::vector<double> gaussian_kernel(int sigma_n)
{
    if (sigma_n <= 0)
        return {1.0};

    const double sigma = static_cast<double>(sigma_n);
    const int radius = static_cast<int>(truncate_sigmas * sigma + 0.5);

    std::vector<double> kernel(2 * radius + 1);
    double sum = 0.0;
    for (int q = -radius; q <= radius; ++q)
    {
        const double w = std::exp(-0.5 * q * q / (sigma * sigma));
        kernel[q + radius] = w;
        sum += w;
    }
    for (double& w : kernel)
        w /= sum;

    return kernel;
}

template<typename TF>
void gaussian_filter(Field3D<TF>& field, int sigma_n)
{
    if (sigma_n <= 0 || field.empty())
        return;

    const std::vector<double> kernel = gaussian_kernel(sigma_n);
    const int radius = static_cast<int>(kernel.size() / 2);

    const int nz = field.size_z();
    const int ny = field.size_y();
    const int nx = field.size_x();

    #pragma omp parallel for schedule(static)
    for (int k = 0; k < nz; ++k)
    {
        std::vector<double> in(std::max(nx, ny));
        std::vector<double> out(std::max(nx, ny));
        TF* plane = field.level(k);

        // x-direction.
        for (int j = 0; j < ny; ++j)
        {
            TF* row = plane + static_cast<std::size_t>(j) * nx;
            for (int i = 0; i < nx; ++i)
                in[i] = row[i];
            filter_line(in.data(), out.data(), nx, kernel, radius);
            for (int i = 0; i < nx; ++i)
                row[i] = static_cast<TF>(out[i]);
        }

        // y-direction.
        for (int i = 0; i < nx; ++i)
        {
            for (int j = 0; j < ny; ++j)
                in[j] = plane[static_cast<std::size_t>(j) * nx + i];
            filter_line(in.data(), out.data(), ny, kernel, radius);
            for (int j = 0; j < ny; ++j)
                plane[static_cast<std::size_t>(j) * nx + i] = static_cast<TF>(out[j]);
        }
    }
}

template void gaussian_filter<float>(Field3D<float>&, int);
template void gaussian_filter<double>(Field3D<double>&, int);

} // namespace nestinit
