#pragma once

#include "physical_constants.hpp"

#include <algorithm>
#include <cmath>

/**
 * @file thermo.hpp
 * @brief Moist thermodynamic functions of the host model.
 *
 * Saturation vapour pressure over liquid water, saturation specific
 * humidity and the saturation adjustment that splits total water into vapour
 * and liquid at a given pressure and Exner function. The functions are
 * templated on the floating-point type so the base state can be computed in
 * the precision of the host model's own solver.
 */

namespace nestinit
{

/**
 * @brief Outcome of a bounded iterative solve.
 */
enum class SolveStatus
{
    converged,
    iteration_limit
};

template<typename TF>
struct Sat_adjust_result
{
    TF ql;
    TF t;
    TF qs;
    int iterations;
    SolveStatus status;

    bool converged() const { return status == SolveStatus::converged; }
};

namespace thermo
{

inline constexpr int sat_adjust_max_iter = 100;
inline constexpr double sat_adjust_tolerance = 1.e-5;

template<typename TF>
inline TF exner(const TF p)
{
    return std::pow(p / p0<TF>, Rd<TF> / cp<TF>);
}

/**
 * @brief Saturation vapour pressure over liquid water (Pa).
 *
 * Eighth-order polynomial in `T - T0`, clamped below at -75 K.
 */
template<typename TF>
inline TF esat_liq(const TF t)
{
    constexpr TF c00 = TF(+0.6105851e+03);
    constexpr TF c10 = TF(+0.4440316e+02);
    constexpr TF c20 = TF(+0.1430341e+01);
    constexpr TF c30 = TF(+0.2641412e-01);
    constexpr TF c40 = TF(+0.2995057e-03);
    constexpr TF c50 = TF(+0.2031998e-05);
    constexpr TF c60 = TF(+0.6936113e-08);
    constexpr TF c70 = TF(+0.2564861e-11);
    constexpr TF c80 = TF(-0.3704404e-13);

    const TF x = std::max(TF(-75.), t - T0<TF>);
    return c00+x*(c10+x*(c20+x*(c30+x*(c40+x*(c50+x*(c60+x*(c70+x*c80)))))));
}

/**
 * @brief Temperature derivative of `esat_liq` (Pa K-1).
 */
template<typename TF>
inline TF desatdT_liq(const TF t)
{
    constexpr TF c10 = TF(+0.4440316e+02);
    constexpr TF c20 = TF(+0.1430341e+01);
    constexpr TF c30 = TF(+0.2641412e-01);
    constexpr TF c40 = TF(+0.2995057e-03);
    constexpr TF c50 = TF(+0.2031998e-05);
    constexpr TF c60 = TF(+0.6936113e-08);
    constexpr TF c70 = TF(+0.2564861e-11);
    constexpr TF c80 = TF(-0.3704404e-13);

    if (t - T0<TF> < TF(-75.))
        return TF(0);

    const TF x = t - T0<TF>;
    return c10+x*(TF(2)*c20+x*(TF(3)*c30+x*(TF(4)*c40+x*(TF(5)*c50+x*(TF(6)*c60+x*(TF(7)*c70+x*TF(8)*c80))))));
}

template<typename TF>
inline TF qsat_liq(const TF p, const TF t)
{
    const TF es = esat_liq(t);
    return ep<TF>*es / (p - (TF(1)-ep<TF>)*es);
}

template<typename TF>
inline TF dqsatdT_liq(const TF p, const TF t)
{
    const TF es = esat_liq(t);
    const TF den = p - (TF(1)-ep<TF>)*es;
    return ep<TF>*p*desatdT_liq(t) / (den*den);
}

/**
 * @brief Virtual potential temperature from liquid-water potential
 *        temperature, total water and liquid water.
 */
template<typename TF>
inline TF virtual_temperature(const TF exn, const TF thl, const TF qt, const TF ql)
{
    const TF th = thl + Lv<TF>*ql / (cp<TF>*exn);
    return th * (TF(1) - (TF(1) - Rv<TF>/Rd<TF>)*qt - Rv<TF>/Rd<TF>*ql);
}

/**
 * @brief Splits total water into vapour and liquid at equilibrium.
 *
 * Newton iteration on the absolute temperature, stopped when the relative
 * change drops below `sat_adjust_tolerance` or after `sat_adjust_max_iter`
 * iterations. The caller decides what to do with an unconverged result.
 *
 * @param thl Liquid-water potential temperature (K).
 * @param qt Total water specific humidity (kg kg-1).
 * @param p Pressure (Pa).
 * @param exn Exner function at `p`.
 */
template<typename TF>
inline Sat_adjust_result<TF> sat_adjust(const TF thl, const TF qt, const TF p, const TF exn)
{
    int niter = 0;
    const TF tl = thl * exn;
    TF qs = qsat_liq(p, tl);

    // Unsaturated: all water is vapour.
    if (qt - qs <= TF(0))
        return {TF(0), tl, qs, niter, SolveStatus::converged};

    TF tnr = tl;
    TF tnr_old = TF(1.e9);
    while (std::abs(tnr - tnr_old) / tnr_old > TF(sat_adjust_tolerance))
    {
        if (niter == sat_adjust_max_iter)
            return {std::max(TF(0), qt - qs), tnr, qs, niter, SolveStatus::iteration_limit};

        tnr_old = tnr;
        qs = qsat_liq(p, tnr);
        const TF f = tnr - tl - Lv<TF>/cp<TF>*(qt - qs);
        const TF f_prime = TF(1) + Lv<TF>/cp<TF>*dqsatdT_liq(p, tnr);
        tnr -= f / f_prime;
        ++niter;
    }

    qs = qsat_liq(p, tnr);
    return {std::max(TF(0), qt - qs), tnr, qs, niter, SolveStatus::converged};
}

} // namespace thermo
} // namespace nestinit
