#pragma once

#include "domain.hpp"
#include "field3d.hpp"

#include <string>
#include <vector>

/**
 * @file lateral_boundaries.hpp
 * @brief Lateral boundary faces cut from padded fields.
 *
 * Each face holds the ghost cells plus the sponge layer next to one domain
 * edge, laid out `(level, y, x)` exactly as the host model reads its
 * `lbc_<name>_<loc>` files. `u` on the west face and `v` on the south face
 * carry one extra column/row: the velocity on the first physical face.
 */

namespace nestinit
{

enum class LbcLocation
{
    west,
    east,
    south,
    north
};

inline constexpr LbcLocation lbc_locations[] = {
    LbcLocation::west, LbcLocation::east, LbcLocation::south, LbcLocation::north};

const char* to_string(LbcLocation location);

/**
 * @brief Index window of one face inside the padded field.
 */
struct LbcWindow
{
    int istart = 0;
    int ni = 0;
    int jstart = 0;
    int nj = 0;

    std::size_t plane_size() const { return static_cast<std::size_t>(ni) * nj; }
};

/**
 * @brief Returns the face window of field `name` at `location`.
 */
LbcWindow lbc_window(const Domain& domain, LbcLocation location, const std::string& name);

/**
 * @brief Copies the first `nlev` levels of a face into a contiguous array.
 * @throws DataError when the field is smaller than the padded grid.
 */
template<typename TF>
std::vector<TF> extract_lbc(const Field3D<TF>& field, const LbcWindow& window, int nlev);

} // namespace nestinit
