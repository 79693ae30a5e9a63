#pragma once

#include "divergence.hpp"
#include "field3d.hpp"

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file perturbation.hpp
 * @brief Block-wise random perturbations of scalar initial fields.
 *
 * Blocks of `block_size` cells in x, y and z receive one uniform random
 * value in `[-amplitude, amplitude]`. The random stream is derived from the
 * seed and the field name, so every field gets its own reproducible pattern
 * independent of the order in which fields are processed.
 */

namespace nestinit
{

struct PerturbationSettings
{
    int block_size = 2;
    double amplitude = 0.0;
    double max_height = 0.0;
    std::uint64_t seed = 1;
};

/**
 * @brief Adds block perturbations to the cells of `region` below `max_height`.
 * @param z Full-level heights of the field.
 * @throws ConfigError for a non-positive block size or negative amplitude.
 */
template<typename TF>
void add_block_perturbations(Field3D<TF>& field,
                             const std::vector<TF>& z,
                             const GridRegion& region,
                             const PerturbationSettings& settings,
                             const std::string& field_name);

/**
 * @brief Clips negative values to zero.
 */
template<typename TF>
void clip_at_zero(Field3D<TF>& field);

} // namespace nestinit
