#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file string_utils.hpp
 * @brief Lightweight string helpers shared by runtime parsing utilities.
 *
 * Provides case normalization, trimming, boolean parsing and list
 * splitting. Functions are header-inline because they are small and reused
 * in configuration, projection-string and driver code paths.
 */

namespace nestinit
{
namespace strutil
{

/**
 * @brief Returns a lowercase copy of the input string.
 * @param value Source string view.
 * @return Lowercased string.
 */
inline std::string lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Returns a copy without leading and trailing whitespace.
 */
inline std::string trim_copy(std::string_view value)
{
    std::string out(value);
    out.erase(out.begin(), std::find_if(out.begin(), out.end(), [](unsigned char ch)
    {
        return !std::isspace(ch);
    }));
    out.erase(std::find_if(out.rbegin(), out.rend(), [](unsigned char ch)
    {
        return !std::isspace(ch);
    }).base(), out.end());
    return out;
}

/**
 * @brief Parses common truthy boolean spellings.
 * @param value Input string view.
 * @return True for 1/true/yes/on (case-insensitive), false otherwise.
 */
inline bool parse_bool(std::string_view value)
{
    const std::string normalized = lower_copy(trim_copy(value));
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

/**
 * @brief Splits on a delimiter, trimming items and dropping empty ones.
 */
inline std::vector<std::string> split_trimmed(std::string_view value, char delimiter)
{
    std::vector<std::string> out;
    std::stringstream ss{std::string(value)};
    std::string item;
    while (std::getline(ss, item, delimiter))
    {
        item = trim_copy(item);
        if (!item.empty())
        {
            out.push_back(item);
        }
    }
    return out;
}

} // namespace strutil
} // namespace nestinit
