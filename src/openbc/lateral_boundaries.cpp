/**
 * @file lateral_boundaries.cpp
 * @brief Implementation for the openbc module.
 *
 * Face windows and extraction of lateral boundary data.
 * This file is part of the src/openbc subsystem.
 */

#include "lateral_boundaries.hpp"

#include "errors.hpp"

namespace nestinit
{

const char* to_string(LbcLocation location)
{
    switch (location)
    {
        case LbcLocation::west:
            return "west";
        case LbcLocation::east:
            return "east";
        case LbcLocation::south:
            return "south";
        case LbcLocation::north:
        default:
            return "north";
    }
}

LbcWindow lbc_window(const Domain& domain, LbcLocation location, const std::string& name)
{
    const int g = domain.n_ghost();
    const int s = domain.n_sponge();

    // West `u` and south `v` include the velocity on the first physical face.
    const int igc_pad = (name == "u") ? g + 1 : g;
    const int jgc_pad = (name == "v") ? g + 1 : g;

    LbcWindow window;
    switch (location)
    {
        case LbcLocation::west:
            window = {0, igc_pad + s, 0, domain.jtot() + 2*g};
            break;
        case LbcLocation::east:
            window = {domain.iend_pad() - s, g + s, 0, domain.jtot() + 2*g};
            break;
        case LbcLocation::south:
            window = {0, domain.itot() + 2*g, 0, jgc_pad + s};
            break;
        case LbcLocation::north:
            window = {0, domain.itot() + 2*g, domain.jend_pad() - s, g + s};
            break;
    }
    return window;
}

template<typename TF>
std::vector<TF> extract_lbc(const Field3D<TF>& field, const LbcWindow& window, int nlev)
{
    if (nlev > field.size_z() ||
        window.istart + window.ni > field.size_x() ||
        window.jstart + window.nj > field.size_y() ||
        window.istart < 0 || window.jstart < 0)
    {
        throw DataError("Lateral boundary window exceeds the padded field");
    }

    std::vector<TF> face(window.plane_size() * nlev);
    std::size_t n = 0;
    for (int k = 0; k < nlev; ++k)
        for (int j = window.jstart; j < window.jstart + window.nj; ++j)
            for (int i = window.istart; i < window.istart + window.ni; ++i)
                face[n++] = field(k, j, i);

    return face;
}

template std::vector<float> extract_lbc<float>(const Field3D<float>&, const LbcWindow&, int);
template std::vector<double> extract_lbc<double>(const Field3D<double>&, const LbcWindow&, int);

} // namespace nestinit
