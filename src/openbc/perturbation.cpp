/**
 * @file perturbation.cpp
 * @brief Implementation for the openbc module.
 *
 * Reproducible block perturbations and clipping.
 * This file is part of the src/openbc subsystem.
 */

#include "perturbation.hpp"

#include "errors.hpp"

#include <algorithm>
#include <random>

namespace nestinit
{

namespace
{

std::uint64_t mix_field_key(std::uint64_t stream_key, const std::string& field_name)
{
    std::uint64_t field_key = stream_key;
    for (char c : field_name)
    {
        field_key = field_key * 31ULL + static_cast<std::uint64_t>(c);
    }
    return field_key;
}

std::uint64_t make_stream_seed(std::uint64_t base_seed, std::uint64_t stream_key)
{
    std::uint64_t combined = base_seed;
    combined = combined * 6364136223846793005ULL + stream_key;
    return combined;
}

}

template<typename TF>
void add_block_perturbations(Field3D<TF>& field,
                             const std::vector<TF>& z,
                             const GridRegion& region,
                             const PerturbationSettings& settings,
                             const std::string& field_name)
{
    if (settings.block_size <= 0)
    {
        throw ConfigError("perturb_size must be a positive number of grid cells");
    }
    if (settings.amplitude < 0.0)
    {
        throw ConfigError("Perturbation amplitude of '" + field_name + "' must be non-negative");
    }
    if (settings.amplitude == 0.0 || settings.max_height <= 0.0)
        return;

    // Levels below the maximum height.
    int kmax = 0;
    while (kmax < field.size_z() && kmax < static_cast<int>(z.size()) && z[kmax] < settings.max_height)
        ++kmax;
    if (kmax == 0)
        return;

    const int bs = settings.block_size;
    const int nbi = (region.iend - region.istart + bs - 1) / bs;
    const int nbj = (region.jend - region.jstart + bs - 1) / bs;
    const int nbk = (kmax + bs - 1) / bs;

    std::mt19937_64 generator(make_stream_seed(settings.seed, mix_field_key(0ULL, field_name)));
    std::uniform_real_distribution<double> dist(-settings.amplitude, settings.amplitude);

    std::vector<double> blocks(static_cast<std::size_t>(nbk) * nbj * nbi);
    for (double& value : blocks)
        value = dist(generator);

    for (int k = 0; k < kmax; ++k)
    {
        const int bk = k / bs;
        for (int j = region.jstart; j < region.jend; ++j)
        {
            const int bj = (j - region.jstart) / bs;
            for (int i = region.istart; i < region.iend; ++i)
            {
                const int bi = (i - region.istart) / bs;
                const double value = blocks[(static_cast<std::size_t>(bk) * nbj + bj) * nbi + bi];
                field(k, j, i) = static_cast<TF>(field(k, j, i) + value);
            }
        }
    }
}

template<typename TF>
void clip_at_zero(Field3D<TF>& field)
{
    TF* values = field.data();
    for (std::size_t n = 0; n < field.size(); ++n)
        values[n] = std::max(TF(0), values[n]);
}

template void add_block_perturbations<float>(Field3D<float>&, const std::vector<float>&,
                                             const GridRegion&, const PerturbationSettings&,
                                             const std::string&);
template void add_block_perturbations<double>(Field3D<double>&, const std::vector<double>&,
                                              const GridRegion&, const PerturbationSettings&,
                                              const std::string&);
template void clip_at_zero<float>(Field3D<float>&);
template void clip_at_zero<double>(Field3D<double>&);

} // namespace nestinit
