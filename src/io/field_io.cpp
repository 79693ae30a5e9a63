/**
 * @file field_io.cpp
 * @brief Implementation for the io module.
 *
 * Headerless binary reads and writes of field data.
 * This file is part of the src/io subsystem.
 */

#include "field_io.hpp"

#include "errors.hpp"

#include <cstdio>
#include <fstream>

namespace nestinit
{

std::filesystem::path field_filename(const std::filesystem::path& dir,
                                     const std::string& name,
                                     const std::string& suffix,
                                     int iotime)
{
    char time_tag[16];
    std::snprintf(time_tag, sizeof(time_tag), "%07d", iotime);

    std::string filename = name;
    if (!suffix.empty())
        filename += "_" + suffix;
    filename += ".";
    filename += time_tag;

    return dir / filename;
}

template<typename TF>
void write_binary(const std::filesystem::path& path, const TF* data, std::size_t count)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw DataError("Failed to open output file: " + path.string());
    }

    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(count * sizeof(TF)));
    out.close();

    if (!out)
    {
        throw DataError("Failed to write output file: " + path.string());
    }
}

template<typename TF>
void write_field_window(const std::filesystem::path& path, const Field3D<TF>& field,
                        int nlev, int jstart, int nj, int istart, int ni)
{
    if (nlev > field.size_z() || jstart < 0 || istart < 0 ||
        jstart + nj > field.size_y() || istart + ni > field.size_x())
    {
        throw DataError("Output window exceeds the field for " + path.string());
    }

    std::vector<TF> buffer(static_cast<std::size_t>(nlev) * nj * ni);
    std::size_t n = 0;
    for (int k = 0; k < nlev; ++k)
        for (int j = jstart; j < jstart + nj; ++j)
            for (int i = istart; i < istart + ni; ++i)
                buffer[n++] = field(k, j, i);

    write_binary(path, buffer.data(), buffer.size());
}

template<typename TF>
std::vector<TF> read_binary(const std::filesystem::path& path, std::size_t count)
{
    std::vector<TF> values = read_binary_all<TF>(path);
    if (values.size() != count)
    {
        throw DataError("File " + path.string() + " holds " + std::to_string(values.size()) +
                        " values, expected " + std::to_string(count));
    }
    return values;
}

template<typename TF>
std::vector<TF> read_binary_all(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in)
    {
        throw DataError("Cannot open input file: " + path.string());
    }

    const std::streamsize bytes = in.tellg();
    if (bytes < 0 || bytes % static_cast<std::streamsize>(sizeof(TF)) != 0)
    {
        throw DataError("Size of " + path.string() + " is not a multiple of " +
                        std::to_string(sizeof(TF)) + " bytes");
    }

    std::vector<TF> values(static_cast<std::size_t>(bytes) / sizeof(TF));
    in.seekg(0, std::ios::beg);
    in.read(reinterpret_cast<char*>(values.data()), bytes);
    if (!in)
    {
        throw DataError("Failed to read input file: " + path.string());
    }
    return values;
}

template void write_binary<float>(const std::filesystem::path&, const float*, std::size_t);
template void write_binary<double>(const std::filesystem::path&, const double*, std::size_t);
template void write_field_window<float>(const std::filesystem::path&, const Field3D<float>&, int, int, int, int, int);
template void write_field_window<double>(const std::filesystem::path&, const Field3D<double>&, int, int, int, int, int);
template std::vector<float> read_binary<float>(const std::filesystem::path&, std::size_t);
template std::vector<double> read_binary<double>(const std::filesystem::path&, std::size_t);
template std::vector<float> read_binary_all<float>(const std::filesystem::path&);
template std::vector<double> read_binary_all<double>(const std::filesystem::path&);

} // namespace nestinit
