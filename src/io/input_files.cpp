/**
 * @file input_files.cpp
 * @brief Implementation for the io module.
 *
 * Profile tables, level files and raw source arrays for the driver.
 * This file is part of the src/io subsystem.
 */

#include "input_files.hpp"

#include "errors.hpp"
#include "field_io.hpp"
#include "interpolation.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace nestinit
{

namespace
{

bool parse_double_token(const std::string& token, double& out)
{
    try
    {
        size_t consumed = 0;
        out = std::stod(token, &consumed);
        return consumed == token.size() && std::isfinite(out);
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Splits a line on whitespace after removing a trailing comment.
 */
std::vector<std::string> split_row(std::string line)
{
    const size_t comment_pos = line.find('#');
    if (comment_pos != std::string::npos)
        line = line.substr(0, comment_pos);

    std::vector<std::string> tokens;
    std::istringstream in(line);
    std::string token;
    while (in >> token)
        tokens.push_back(token);
    return tokens;
}

std::ifstream open_text(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw DataError("Cannot open input file: " + path);
    }
    return in;
}

std::vector<double> read_array(const std::string& path, std::size_t count, const std::string& what)
{
    if (log_debug_enabled())
    {
        std::cout << "[INPUT] Reading " << what << " from " << path << std::endl;
    }
    return read_binary<double>(path, count);
}

}

ProfileTable read_profile_table(const std::string& path)
{
    std::ifstream in = open_text(path);

    ProfileTable table;
    std::size_t ncols = 0;
    std::string line;
    int line_number = 0;
    while (std::getline(in, line))
    {
        ++line_number;
        const std::vector<std::string> tokens = split_row(line);
        if (tokens.empty())
            continue;

        if (ncols == 0)
            ncols = tokens.size();

        if ((tokens.size() != 2 && tokens.size() != 3) || tokens.size() != ncols)
        {
            throw DataError("Malformed profile row " + std::to_string(line_number) + " in " + path +
                            ": expected columns 'z thl [qt]' on every row");
        }

        double values[3] = {0.0, 0.0, 0.0};
        for (std::size_t c = 0; c < tokens.size(); ++c)
        {
            if (!parse_double_token(tokens[c], values[c]))
            {
                throw DataError("Invalid number '" + tokens[c] + "' on row " + std::to_string(line_number) +
                                " of " + path);
            }
        }

        if (!table.z.empty() && !(values[0] > table.z.back()))
        {
            throw DataError("Profile heights in " + path + " must be strictly increasing");
        }

        table.z.push_back(values[0]);
        table.thl.push_back(values[1]);
        if (ncols == 3)
            table.qt.push_back(values[2]);
    }

    if (table.z.empty())
    {
        throw DataError("Profile file " + path + " holds no rows");
    }
    return table;
}

std::vector<double> read_text_values(const std::string& path)
{
    std::ifstream in = open_text(path);

    std::vector<double> values;
    std::string line;
    while (std::getline(in, line))
    {
        for (const std::string& token : split_row(line))
        {
            double parsed = 0.0;
            if (!parse_double_token(token, parsed))
            {
                throw DataError("Invalid number '" + token + "' in " + path);
            }
            values.push_back(parsed);
        }
    }
    return values;
}

template<typename TF>
std::vector<TF> interpolate_profile(const std::vector<double>& z_src,
                                    const std::vector<double>& values,
                                    const std::vector<TF>& z)
{
    if (z_src.empty() || z_src.size() != values.size())
    {
        throw DataError("Profile heights and values differ in length");
    }
    check_monotonic_columns(z_src.data(), static_cast<int>(z_src.size()), 1, 1, "Profile");

    std::vector<TF> out(z.size());
    for (std::size_t k = 0; k < z.size(); ++k)
    {
        out[k] = static_cast<TF>(interpolate_linear_clamped(
            z_src.data(), values.data(), static_cast<int>(z_src.size()), static_cast<double>(z[k])));
    }
    return out;
}

template<typename TF>
std::vector<TF> equidistant_levels(int ktot, TF zsize)
{
    if (ktot <= 0 || !(zsize > TF(0)))
    {
        throw ConfigError("Equidistant levels need ktot > 0 and zsize > 0");
    }

    const TF dz = zsize / ktot;
    std::vector<TF> z(ktot);
    for (int k = 0; k < ktot; ++k)
        z[k] = (k + TF(0.5)) * dz;
    return z;
}

SourceData load_source_data(const SourceConfig& config)
{
    SourceData source;
    source.nlon = config.nlon;
    source.nlat = config.nlat;
    source.nlev = config.nlev;
    source.ntime = static_cast<int>(config.time.size());
    source.time = config.time;
    source.vertical = config.vertical;

    const std::size_t plane = source.plane_size();
    const std::size_t all_times = source.volume_size() * source.ntime;

    source.lon = read_array(config.lon_file, plane, "longitudes");
    source.lat = read_array(config.lat_file, plane, "latitudes");
    source.zcoord = read_array(config.z_file, all_times, std::string("vertical coordinate (") +
                               to_string(config.vertical) + ")");

    for (const std::string& name : config.fields)
    {
        std::string path = config.field_file_pattern;
        const std::string tag = "{name}";
        for (size_t pos = path.find(tag); pos != std::string::npos; pos = path.find(tag, pos + name.size()))
            path.replace(pos, tag.size(), name);

        source.fields[name] = read_array(path, all_times, "field " + name);
    }

    source.validate();

    if (log_normal_enabled())
    {
        std::cout << "[INPUT] Source grid " << source.nlon << " x " << source.nlat << " x " << source.nlev
                  << ", " << source.ntime << " times, " << source.fields.size() << " fields, "
                  << to_string(source.vertical) << " coordinate" << std::endl;
    }
    return source;
}

template std::vector<float> interpolate_profile<float>(const std::vector<double>&, const std::vector<double>&,
                                                       const std::vector<float>&);
template std::vector<double> interpolate_profile<double>(const std::vector<double>&, const std::vector<double>&,
                                                         const std::vector<double>&);
template std::vector<float> equidistant_levels<float>(int, float);
template std::vector<double> equidistant_levels<double>(int, double);

} // namespace nestinit
