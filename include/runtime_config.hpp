#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain.hpp"
#include "logging.hpp"
#include "nesting_pipeline.hpp"
#include "source_data.hpp"

/**
 * @file runtime_config.hpp
 * @brief Run configuration of the `nestinit` driver and parsing helpers.
 *
 * The configuration is one YAML-like file with the sections `logging`,
 * `domains`, `vertical_grid`, `base_state`, `source` and `pipeline`. Nested
 * keys are flattened to dotted names by `parse_yaml_simple`. Relative file
 * names are resolved against the directory of the configuration file.
 */

namespace nestinit
{

/**
 * @brief One domain of the nest and the name of its parent.
 */
struct DomainEntry
{
    DomainConfig config;
    std::string parent;  ///< Empty for a root domain.
};

struct VerticalGridConfig
{
    std::string z_file;  ///< Text file with full-level heights; overrides ktot.
    int ktot = 0;        ///< Equidistant levels when no z_file is given.
    double zsize = 0.0;
};

struct BaseStateConfig
{
    std::string profile_file;  ///< Columns `z thl [qt]`.
    double pbot = 1.0e5;
    bool moist = true;
};

/**
 * @brief Layout of the raw float64 source arrays on disk.
 */
struct SourceConfig
{
    int nlon = 0;
    int nlat = 0;
    int nlev = 0;

    std::string lon_file;      ///< (lat, lon)
    std::string lat_file;      ///< (lat, lon)
    std::string z_file;        ///< (time, level, lat, lon)
    VerticalCoordinate vertical = VerticalCoordinate::height;

    std::vector<double> time;
    std::vector<std::string> fields;
    std::string field_file_pattern = "{name}.bin";  ///< `{name}` is replaced by the field name.
};

struct NestinitConfig
{
    LogProfile log_profile = LogProfile::normal;
    std::string dtype = "float64";

    std::vector<DomainEntry> domains;
    std::string target_domain;

    VerticalGridConfig vertical_grid;
    BaseStateConfig base_state;
    SourceConfig source;
    PipelineOptions pipeline;
};

/**
 * @brief Parses common truthy boolean spellings.
 * @param value Input string.
 * @return Parsed boolean value.
 */
bool parse_bool_value(const std::string& value);

/**
 * @brief Parses an integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse.
 */
bool try_parse_int_value(const std::string& value, int& out);

/**
 * @brief Parses a non-negative integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse and non-negative result.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out);

/**
 * @brief Parses a strictly positive integer value.
 */
bool try_parse_positive_int_value(const std::string& value, int& out);

/**
 * @brief Parses an unsigned 64-bit integer value.
 * @param value Input string.
 * @param out Parsed unsigned output.
 * @return True on successful parse.
 */
bool try_parse_uint64_value(const std::string& value, std::uint64_t& out);

/**
 * @brief Parses a finite floating-point value.
 * @param value Input string.
 * @param out Parsed double output.
 * @return True on successful parse.
 */
bool try_parse_double_value(const std::string& value, double& out);

/**
 * @brief Removes matching single or double quotes around a value.
 */
std::string strip_wrapping_quotes(std::string value);

/**
 * @brief Parses a simple key-value YAML file.
 * @param filename Input file path.
 * @return Parsed key-value map with dotted keys.
 * @throws ConfigError when the file cannot be opened.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename);

/**
 * @brief Splits `[a, b, c]` or `a, b, c` into trimmed items.
 */
std::vector<std::string> parse_string_list(const std::string& value);

/**
 * @brief Parses a list of finite numbers.
 * @throws ConfigError on a non-numeric item.
 */
std::vector<double> parse_double_list(const std::string& key, const std::string& value);

/**
 * @brief Builds the run configuration from already parsed keys.
 * @param config Dotted key-value map.
 * @param base_dir Directory that relative file names are resolved against.
 * @throws ConfigError on missing or invalid values.
 */
NestinitConfig build_config(const std::unordered_map<std::string, std::string>& config,
                            const std::string& base_dir);

/**
 * @brief Loads the run configuration from disk.
 *
 * `logging.profile` is applied to `global_log_profile` right away so the
 * rest of the load already logs at the requested level.
 * @throws ConfigError on missing or invalid values.
 */
NestinitConfig load_config(const std::string& config_path);

} // namespace nestinit
