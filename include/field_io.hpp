#pragma once

#include "field3d.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @file field_io.hpp
 * @brief Raw binary field files in the host model's restart convention.
 *
 * Files carry no header: values in native byte order and the target
 * precision, row-major with the level as the slowest index. The name ends
 * in the output time in whole seconds, zero-padded to seven digits.
 */

namespace nestinit
{

/**
 * @brief Builds `<dir>/<name>[_<suffix>].<iotime:07d>`.
 */
std::filesystem::path field_filename(const std::filesystem::path& dir,
                                     const std::string& name,
                                     const std::string& suffix,
                                     int iotime);

/**
 * @brief Writes `count` values to `path`, replacing an existing file.
 * @throws std::runtime_error on I/O failure.
 */
template<typename TF>
void write_binary(const std::filesystem::path& path, const TF* data, std::size_t count);

/**
 * @brief Writes the first `nlev` levels of the sub-window
 *        `[jstart, jstart+nj) x [istart, istart+ni)`.
 */
template<typename TF>
void write_field_window(const std::filesystem::path& path, const Field3D<TF>& field,
                        int nlev, int jstart, int nj, int istart, int ni);

/**
 * @brief Reads exactly `count` values of type `TF` from `path`.
 * @throws DataError when the file is missing or has a different size.
 */
template<typename TF>
std::vector<TF> read_binary(const std::filesystem::path& path, std::size_t count);

/**
 * @brief Reads a whole file of values of type `TF`.
 * @throws DataError when the size is not a multiple of `sizeof(TF)`.
 */
template<typename TF>
std::vector<TF> read_binary_all(const std::filesystem::path& path);

} // namespace nestinit
