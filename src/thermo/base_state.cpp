/**
 * @file base_state.cpp
 * @brief Implementation for the thermo module.
 *
 * Bottom-up hydrostatic integration of the reference pressure and density,
 * following the host model's moist thermodynamics.
 * This file is part of the src/thermo subsystem.
 */

#include "base_state.hpp"

#include "errors.hpp"
#include "logging.hpp"
#include "physical_constants.hpp"
#include "thermo.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

namespace nestinit
{

namespace
{

template<typename TF>
inline TF interp2(const TF a, const TF b)
{
    return TF(0.5) * (a + b);
}

template<typename TF>
void check_profile(const std::vector<TF>& values, int ktot, const char* name)
{
    if (static_cast<int>(values.size()) != ktot)
    {
        throw ConfigError(std::string("Base state: ") + name + " has " + std::to_string(values.size()) +
                          " levels, vertical grid has " + std::to_string(ktot));
    }
    for (const TF value : values)
    {
        if (!std::isfinite(value))
        {
            throw ConfigError(std::string("Base state: ") + name + " contains non-finite values");
        }
    }
}

}

template<typename TF>
BaseState<TF> BaseState<TF>::dry(const VerticalGrid<TF>& grid, const std::vector<TF>& thl, TF pbot)
{
    BaseState<TF> state;
    state.moist_ = false;
    state.solve(grid, thl, std::vector<TF>(thl.size(), TF(0)), pbot);
    return state;
}

template<typename TF>
BaseState<TF> BaseState<TF>::moist(const VerticalGrid<TF>& grid, const std::vector<TF>& thl,
                                   const std::vector<TF>& qt, TF pbot)
{
    BaseState<TF> state;
    state.moist_ = true;
    state.solve(grid, thl, qt, pbot);
    return state;
}

template<typename TF>
void BaseState<TF>::solve(const VerticalGrid<TF>& grid_in, const std::vector<TF>& thl,
                          const std::vector<TF>& qt, TF pbot)
{
    const VerticalGrid<TF> grid = grid_in.has_ghost_levels() ? grid_in.without_ghost_levels() : grid_in;
    const int n = grid.ktot();

    if (n < 2)
    {
        throw ConfigError("Base state needs at least two vertical levels");
    }
    check_profile(thl, n, "thl");
    check_profile(qt, n, "qt");
    if (!(pbot > TF(0)) || !std::isfinite(pbot))
    {
        throw ConfigError("Base state: surface pressure must be positive");
    }

    const std::vector<TF>& z = grid.z();
    const std::vector<TF>& zh = grid.zh();
    const std::vector<TF>& dz = grid.dz();
    const std::vector<TF>& dzh = grid.dzh();

    // Liquid water from the saturation adjustment, zero for the dry state.
    auto liquid_water = [&](TF thl_k, TF qt_k, TF p_k, TF exn_k, int k, TF height, const char* where)
    {
        if (!moist_)
            return TF(0);

        const Sat_adjust_result<TF> sa = thermo::sat_adjust(thl_k, qt_k, p_k, exn_k);
        if (!sa.converged())
        {
            std::ostringstream ss;
            ss << "Saturation adjustment did not converge in " << sa.iterations
               << " iterations at " << where << " level " << k << " (z=" << height
               << " m, p=" << p_k << " Pa, thl=" << thl_k << " K, qt=" << qt_k << ")";
            throw NumericalError(ss.str());
        }
        return sa.ql;
    };

    // Surface and top values by linear extrapolation of the profile.
    const TF thl_bot = thl[0] - z[0]*(thl[1] - thl[0]) / dzh[1];
    const TF qt_bot  = qt[0]  - z[0]*(qt[1]  - qt[0])  / dzh[1];
    const TF thl_top = thl[n-1] + (zh[n] - z[n-1])*(thl[n-1] - thl[n-2]) / dzh[n-1];
    const TF qt_top  = qt[n-1]  + (zh[n] - z[n-1])*(qt[n-1]  - qt[n-2])  / dzh[n-1];

    std::vector<TF> thlh(n+1);
    std::vector<TF> qth(n+1);
    thlh[0] = thl_bot;
    qth[0] = qt_bot;
    for (int k = 1; k < n; ++k)
    {
        thlh[k] = interp2(thl[k-1], thl[k]);
        qth[k] = interp2(qt[k-1], qt[k]);
    }
    thlh[n] = thl_top;
    qth[n] = qt_top;

    p_.assign(n, TF(0));
    rho_.assign(n, TF(0));
    exner_.assign(n, TF(0));
    thv_.assign(n, TF(0));
    ph_.assign(n+1, TF(0));
    rhoh_.assign(n+1, TF(0));
    exnerh_.assign(n+1, TF(0));
    thvh_.assign(n+1, TF(0));

    // Surface half level.
    ph_[0] = pbot;
    exnerh_[0] = thermo::exner(pbot);
    TF ql = liquid_water(thlh[0], qth[0], ph_[0], exnerh_[0], 0, zh[0], "half");
    thvh_[0] = thermo::virtual_temperature(exnerh_[0], thlh[0], qth[0], ql);
    rhoh_[0] = ph_[0] / (Rd<TF>*exnerh_[0]*thvh_[0]);

    // First full level.
    p_[0] = ph_[0] * std::exp(-grav<TF>*z[0] / (Rd<TF>*exnerh_[0]*thvh_[0]));

    for (int k = 1; k < n+1; ++k)
    {
        // 1. Full level k-1.
        exner_[k-1] = thermo::exner(p_[k-1]);
        ql = liquid_water(thl[k-1], qt[k-1], p_[k-1], exner_[k-1], k-1, z[k-1], "full");
        thv_[k-1] = thermo::virtual_temperature(exner_[k-1], thl[k-1], qt[k-1], ql);
        rho_[k-1] = p_[k-1] / (Rd<TF>*exner_[k-1]*thv_[k-1]);

        // 2. Half level k pressure.
        ph_[k] = ph_[k-1] * std::exp(-grav<TF>*dz[k-1] / (Rd<TF>*exner_[k-1]*thv_[k-1]));
        exnerh_[k] = thermo::exner(ph_[k]);

        // 3. Half level k from interpolated conserved variables.
        ql = liquid_water(thlh[k], qth[k], ph_[k], exnerh_[k], k, zh[k], "half");
        thvh_[k] = thermo::virtual_temperature(exnerh_[k], thlh[k], qth[k], ql);
        rhoh_[k] = ph_[k] / (Rd<TF>*exnerh_[k]*thvh_[k]);

        // 4. Full level k pressure.
        if (k < n)
            p_[k] = p_[k-1] * std::exp(-grav<TF>*dzh[k] / (Rd<TF>*exnerh_[k]*thvh_[k]));
    }

    if (log_debug_enabled())
    {
        std::cout << "[BASESTATE] " << (moist_ ? "moist" : "dry") << ", " << n << " levels, p "
                  << ph_[0] << " -> " << ph_[n] << " Pa, rho " << rhoh_[0] << " -> " << rhoh_[n]
                  << " kg m-3" << std::endl;
    }
}

template class BaseState<float>;
template class BaseState<double>;

} // namespace nestinit
