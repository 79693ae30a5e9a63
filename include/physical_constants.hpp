#pragma once

/**
 * @file physical_constants.hpp
 * @brief Thermodynamic constants shared by the base state and the pipeline.
 *
 * Values are those of the host LES model, so that base-state profiles
 * computed here reproduce the model's own hydrostatic solver.
 */

namespace nestinit
{
namespace physical_constants
{
inline constexpr double gravity_ms2 = 9.81;
inline constexpr double gas_constant_dry_air_jkgk = 287.04;
inline constexpr double gas_constant_water_vapor_jkgk = 461.5;
inline constexpr double specific_heat_cp_jkgk = 1005.0;
inline constexpr double latent_heat_vaporization_jkg = 2.501e6;
inline constexpr double reference_pressure_pa = 1.0e5;
inline constexpr double freezing_temperature_k = 273.15;
inline constexpr double pi = 3.14159265358979323846;

inline constexpr double rd_over_rv = gas_constant_dry_air_jkgk / gas_constant_water_vapor_jkgk;
inline constexpr double rv_over_rd = gas_constant_water_vapor_jkgk / gas_constant_dry_air_jkgk;
} // namespace physical_constants

template<typename TF> inline constexpr TF grav = static_cast<TF>(physical_constants::gravity_ms2);
template<typename TF> inline constexpr TF Rd = static_cast<TF>(physical_constants::gas_constant_dry_air_jkgk);
template<typename TF> inline constexpr TF Rv = static_cast<TF>(physical_constants::gas_constant_water_vapor_jkgk);
template<typename TF> inline constexpr TF cp = static_cast<TF>(physical_constants::specific_heat_cp_jkgk);
template<typename TF> inline constexpr TF Lv = static_cast<TF>(physical_constants::latent_heat_vaporization_jkg);
template<typename TF> inline constexpr TF p0 = static_cast<TF>(physical_constants::reference_pressure_pa);
template<typename TF> inline constexpr TF T0 = static_cast<TF>(physical_constants::freezing_temperature_k);
template<typename TF> inline constexpr TF ep = static_cast<TF>(physical_constants::rd_over_rv);
} // namespace nestinit
