#pragma once

#include "vertical_grid.hpp"

#include <vector>

/**
 * @file base_state.hpp
 * @brief Hydrostatic reference pressure and density profiles.
 *
 * Reproduces the host model's base-state solver: integration strictly from
 * the surface upward, alternating full and half levels, with saturation
 * adjustment at every level in the moist variant. Profiles are stored for
 * the physical levels only (no ghost levels), `ktot` full and `ktot+1` half
 * levels. The object is read-only after construction; recompute it when the
 * inputs change.
 */

namespace nestinit
{

template<typename TF>
class BaseState
{
public:
    /**
     * @brief Dry base state.
     * @param grid Vertical grid (ghost levels are ignored).
     * @param thl Potential temperature at the full levels (K).
     * @param pbot Surface pressure (Pa).
     * @throws ConfigError on size mismatch or non-positive pressure.
     */
    static BaseState dry(const VerticalGrid<TF>& grid, const std::vector<TF>& thl, TF pbot);

    /**
     * @brief Moist base state with saturation adjustment.
     * @param grid Vertical grid (ghost levels are ignored).
     * @param thl Liquid-water potential temperature at the full levels (K).
     * @param qt Total water specific humidity at the full levels (kg kg-1).
     * @param pbot Surface pressure (Pa).
     * @throws NumericalError when a saturation adjustment does not converge.
     */
    static BaseState moist(const VerticalGrid<TF>& grid, const std::vector<TF>& thl,
                           const std::vector<TF>& qt, TF pbot);

    int ktot() const { return static_cast<int>(p_.size()); }
    bool is_moist() const { return moist_; }
    TF pbot() const { return ph_.front(); }

    const std::vector<TF>& p() const { return p_; }
    const std::vector<TF>& rho() const { return rho_; }
    const std::vector<TF>& exner() const { return exner_; }
    const std::vector<TF>& thv() const { return thv_; }

    const std::vector<TF>& ph() const { return ph_; }
    const std::vector<TF>& rhoh() const { return rhoh_; }
    const std::vector<TF>& exnerh() const { return exnerh_; }
    const std::vector<TF>& thvh() const { return thvh_; }

private:
    BaseState() = default;

    void solve(const VerticalGrid<TF>& grid, const std::vector<TF>& thl,
               const std::vector<TF>& qt, TF pbot);

    bool moist_ = false;

    std::vector<TF> p_;
    std::vector<TF> rho_;
    std::vector<TF> exner_;
    std::vector<TF> thv_;

    std::vector<TF> ph_;
    std::vector<TF> rhoh_;
    std::vector<TF> exnerh_;
    std::vector<TF> thvh_;
};

} // namespace nestinit
