#pragma once

#include <vector>

/**
 * @file vertical_grid.hpp
 * @brief Full and half levels of one column on the host model's staggered grid.
 *
 * Half levels are reconstructed from the full levels with the second-order
 * layout of the host model: `zh[0] = 0`, `zh[k] = (z[k-1] + z[k]) / 2`,
 * `zh[ktot] = zsize`. Optionally one ghost level is kept below the surface
 * and one above the top, mirrored about `zh = 0` and `zh = zsize`.
 *
 * Index `kstart()` is the first physical level. Full-level arrays hold
 * `kend() - kstart()` physical entries starting at `kstart()`, half-level
 * arrays one more.
 */

namespace nestinit
{

template<typename TF>
class VerticalGrid
{
public:
    /**
     * @brief Builds the grid from full-level heights.
     * @param z Strictly increasing full-level heights inside (0, zsize).
     * @param zsize Domain top.
     * @param with_ghost_levels Keep one mirrored ghost level below and above.
     * @throws ConfigError when the heights are not monotonic or out of range.
     */
    VerticalGrid(const std::vector<TF>& z, TF zsize, bool with_ghost_levels = false);

    /**
     * @brief Returns a copy of this grid with the ghost levels removed.
     */
    VerticalGrid without_ghost_levels() const;

    /**
     * @brief Returns a copy of this grid with ghost levels added.
     */
    VerticalGrid with_ghost_levels() const;

    int ktot() const { return ktot_; }
    int kstart() const { return kgc_; }
    int kend() const { return kgc_ + ktot_; }
    bool has_ghost_levels() const { return kgc_ > 0; }

    TF zsize() const { return zsize_; }

    const std::vector<TF>& z() const { return z_; }
    const std::vector<TF>& zh() const { return zh_; }
    const std::vector<TF>& dz() const { return dz_; }
    const std::vector<TF>& dzh() const { return dzh_; }
    const std::vector<TF>& dzi() const { return dzi_; }
    const std::vector<TF>& dzhi() const { return dzhi_; }

    /**
     * @brief Full-level heights of the physical levels only.
     */
    std::vector<TF> z_physical() const;

private:
    void build();

    int ktot_;
    int kgc_;
    TF zsize_;

    std::vector<TF> z_;
    std::vector<TF> zh_;
    std::vector<TF> dz_;
    std::vector<TF> dzh_;
    std::vector<TF> dzi_;
    std::vector<TF> dzhi_;
};

} // namespace nestinit
