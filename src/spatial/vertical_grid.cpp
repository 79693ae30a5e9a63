/**
 * @file vertical_grid.cpp
 * @brief Implementation for the spatial module.
 *
 * Reconstructs half levels and spacings from full-level heights.
 * This file is part of the src/spatial subsystem.
 */

#include "vertical_grid.hpp"

#include "errors.hpp"

#include <cmath>
#include <string>

namespace nestinit
{

template<typename TF>
VerticalGrid<TF>::VerticalGrid(const std::vector<TF>& z, TF zsize, bool with_ghost_levels)
    : ktot_(static_cast<int>(z.size())),
      kgc_(with_ghost_levels ? 1 : 0),
      zsize_(zsize)
{
    if (z.empty())
    {
        throw ConfigError("Vertical grid has no levels");
    }
    if (!(zsize > TF(0)) || !std::isfinite(zsize))
    {
        throw ConfigError("Vertical grid: zsize must be positive, got " + std::to_string(zsize));
    }
    if (!(z.front() > TF(0)))
    {
        throw ConfigError("Vertical grid: first level z=" + std::to_string(z.front()) +
                          " is not above the surface");
    }
    if (!(z.back() < zsize))
    {
        throw ConfigError("Vertical grid: last level z=" + std::to_string(z.back()) +
                          " is not below zsize=" + std::to_string(zsize));
    }
    for (int k = 1; k < ktot_; ++k)
    {
        if (!(z[k] > z[k-1]))
        {
            throw ConfigError("Vertical grid: heights are not strictly increasing at level " +
                              std::to_string(k) + " (z=" + std::to_string(z[k-1]) + ", " +
                              std::to_string(z[k]) + ")");
        }
    }

    z_.assign(ktot_ + 2*kgc_, TF(0));
    for (int k = 0; k < ktot_; ++k)
        z_[k + kgc_] = z[k];

    build();
}

template<typename TF>
void VerticalGrid<TF>::build()
{
    const int ks = kgc_;
    const int ke = kgc_ + ktot_;
    const int ncells = ktot_ + 2*kgc_;

    // Mirrored full levels one below the surface and one above the top.
    const TF z_bot = -z_[ks];
    const TF z_top = TF(2)*zsize_ - z_[ke-1];

    zh_.assign(ncells + 1, TF(0));
    dz_.assign(ncells, TF(0));
    dzh_.assign(ncells + 1, TF(0));

    zh_[ks] = TF(0);
    for (int k = ks+1; k < ke; ++k)
        zh_[k] = TF(0.5)*(z_[k-1] + z_[k]);
    zh_[ke] = zsize_;

    for (int k = ks; k < ke; ++k)
        dz_[k] = zh_[k+1] - zh_[k];

    dzh_[ks] = z_[ks] - z_bot;
    for (int k = ks+1; k < ke; ++k)
        dzh_[k] = z_[k] - z_[k-1];
    dzh_[ke] = z_top - z_[ke-1];

    if (kgc_ > 0)
    {
        z_[ks-1] = z_bot;
        z_[ke] = z_top;

        zh_[ks-1] = -zh_[ks+1];
        zh_[ke+1] = TF(2)*zsize_ - zh_[ke-1];

        dz_[ks-1] = dz_[ks];
        dz_[ke] = dz_[ke-1];

        dzh_[ks-1] = dzh_[ks+1];
        dzh_[ke+1] = dzh_[ke-1];
    }

    dzi_.resize(dz_.size());
    for (std::size_t k = 0; k < dz_.size(); ++k)
        dzi_[k] = TF(1) / dz_[k];

    dzhi_.resize(dzh_.size());
    for (std::size_t k = 0; k < dzh_.size(); ++k)
        dzhi_[k] = TF(1) / dzh_[k];
}

template<typename TF>
std::vector<TF> VerticalGrid<TF>::z_physical() const
{
    return std::vector<TF>(z_.begin() + kgc_, z_.begin() + kgc_ + ktot_);
}

template<typename TF>
VerticalGrid<TF> VerticalGrid<TF>::without_ghost_levels() const
{
    return VerticalGrid<TF>(z_physical(), zsize_, false);
}

template<typename TF>
VerticalGrid<TF> VerticalGrid<TF>::with_ghost_levels() const
{
    return VerticalGrid<TF>(z_physical(), zsize_, true);
}

template class VerticalGrid<float>;
template class VerticalGrid<double>;

} // namespace nestinit
