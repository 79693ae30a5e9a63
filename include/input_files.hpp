#pragma once

#include "runtime_config.hpp"
#include "source_data.hpp"

#include <string>
#include <vector>

/**
 * @file input_files.hpp
 * @brief Readers for the driver's input files.
 *
 * Text files hold whitespace separated numbers, one level per row, with
 * `#` comments. Source arrays are raw float64 in the layout of
 * `SourceData`.
 */

namespace nestinit
{

/**
 * @brief Initial profile of the base state on its own heights.
 */
struct ProfileTable
{
    std::vector<double> z;
    std::vector<double> thl;
    std::vector<double> qt;  ///< Empty when the file has two columns.

    bool has_qt() const { return !qt.empty(); }
};

/**
 * @brief Reads a `z thl [qt]` table.
 * @throws DataError on malformed rows or heights that do not increase.
 */
ProfileTable read_profile_table(const std::string& path);

/**
 * @brief Reads all numbers of a text file, ignoring comments.
 * @throws DataError on a non-numeric token.
 */
std::vector<double> read_text_values(const std::string& path);

/**
 * @brief Linear interpolation of a profile to `z`, constant beyond its ends.
 */
template<typename TF>
std::vector<TF> interpolate_profile(const std::vector<double>& z_src,
                                    const std::vector<double>& values,
                                    const std::vector<TF>& z);

/**
 * @brief Equidistant full levels `(k + 1/2) zsize / ktot`.
 */
template<typename TF>
std::vector<TF> equidistant_levels(int ktot, TF zsize);

/**
 * @brief Loads the coordinates, vertical coordinate and fields of a source.
 * @throws DataError when a file is missing or has the wrong size.
 */
SourceData load_source_data(const SourceConfig& config);

} // namespace nestinit
