/**
 * @file runtime_config.cpp
 * @brief Run configuration of the nestinit driver.
 *
 * Provides the YAML-like key/value reader, typed value parsing and the
 * translation of dotted keys into the domain, grid, base-state, source and
 * pipeline settings of one run.
 * This file belongs to the primary src/core execution layer.
 */

#include "runtime_config.hpp"

#include <algorithm>
#include <cmath>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>

#include "errors.hpp"
#include "string_utils.hpp"

namespace nestinit
{

LogProfile global_log_profile = LogProfile::normal;

/**
 * @brief Removes matching single or double quotes around a string value.
 */
std::string strip_wrapping_quotes(std::string value)
{
    if (value.size() >= 2)
    {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
        {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

/**
 * @brief Parses boolean-like configuration values.
 */
bool parse_bool_value(const std::string& value)
{
    return strutil::parse_bool(value);
}

/**
 * @brief Parses an integer value.
 */
bool try_parse_int_value(const std::string& value, int& out)
{
    try
    {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() ||
            parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses a non-negative integer value.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed))
    {
        return false;
    }
    if (parsed < 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses a strictly positive integer value.
 */
bool try_parse_positive_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed))
    {
        return false;
    }
    if (parsed <= 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses an unsigned 64-bit integer value.
 */
bool try_parse_uint64_value(const std::string& value, std::uint64_t& out)
{
    if (!value.empty() && value.front() == '-')
    {
        return false;
    }

    try
    {
        size_t consumed = 0;
        const unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses a finite floating-point value.
 */
bool try_parse_double_value(const std::string& value, double& out)
{
    try
    {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed))
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Returns string label for runtime logging profile.
 */
const char* log_profile_name(LogProfile profile)
{
    switch (profile)
    {
        case LogProfile::quiet:
            return "quiet";
        case LogProfile::debug:
            return "debug";
        case LogProfile::normal:
        default:
            return "normal";
    }
}

/**
 * @brief Parses runtime logging profile from text.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = strutil::lower_copy(value);
    if (normalized == "quiet")
    {
        if (valid) *valid = true;
        return LogProfile::quiet;
    }
    if (normalized == "normal")
    {
        if (valid) *valid = true;
        return LogProfile::normal;
    }
    if (normalized == "debug")
    {
        if (valid) *valid = true;
        return LogProfile::debug;
    }

    if (valid) *valid = false;
    return LogProfile::normal;
}

/**
 * @brief Parses a simple YAML file into dotted keys.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename)
{
    std::unordered_map<std::string, std::string> config;
    std::ifstream file(filename);
    if (!file.is_open())
    {
        throw ConfigError("Could not open config file: " + filename);
    }

    std::string line;
    std::vector<std::string> section_stack;

    while (std::getline(file, line))
    {
        size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos)
        {
            line = line.substr(0, comment_pos);
        }

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;

        size_t indent_level = indent / 2;

        line = strutil::trim_copy(line);
        if (line.empty()) continue;

        if (line.back() == ':')
        {
            std::string section_name = line.substr(0, line.size() - 1);

            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            if (section_stack.size() == indent_level)
            {
                section_stack.push_back(section_name);
            }
            else
            {
                section_stack[indent_level] = section_name;
            }

            continue;
        }

        size_t colon_pos = line.find(':');

        if (colon_pos != std::string::npos)
        {
            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            const std::string key = strutil::trim_copy(line.substr(0, colon_pos));
            const std::string value = strip_wrapping_quotes(strutil::trim_copy(line.substr(colon_pos + 1)));

            std::string full_key;
            for (const auto& section : section_stack)
            {
                if (!full_key.empty()) full_key += ".";
                full_key += section;
            }
            if (!full_key.empty()) full_key += ".";
            full_key += key;
            config[full_key] = value;
        }
    }

    return config;
}

/**
 * @brief Parses a bracketed or comma separated list of names.
 */
std::vector<std::string> parse_string_list(const std::string& value)
{
    std::string cleaned = value;
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '['), cleaned.end());
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), ']'), cleaned.end());
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '"'), cleaned.end());
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '\''), cleaned.end());

    return strutil::split_trimmed(cleaned, ',');
}

std::vector<double> parse_double_list(const std::string& key, const std::string& value)
{
    std::vector<double> out;
    for (const std::string& item : parse_string_list(value))
    {
        double parsed = 0.0;
        if (!try_parse_double_value(item, parsed))
        {
            throw ConfigError("Invalid " + key + " entry '" + item + "'; expected a number");
        }
        out.push_back(parsed);
    }
    return out;
}

namespace
{

using KeyMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Emits a standardized warning for invalid configuration values.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected)
{
    std::cerr << "Warning: Invalid " << key << " '" << value
              << "'; expected " << expected
              << ". Keeping previous/default value." << std::endl;
}

[[noreturn]] void throw_invalid_config_value(const std::string& key,
                                             const std::string& value,
                                             const char* expected)
{
    throw ConfigError("Invalid " + key + " '" + value + "'; expected " + expected);
}

const std::string* find_value(const KeyMap& config, const std::string& key)
{
    const auto it = config.find(key);
    return it == config.end() ? nullptr : &it->second;
}

const std::string& require_value(const KeyMap& config, const std::string& key)
{
    const std::string* value = find_value(config, key);
    if (!value || value->empty())
    {
        throw ConfigError("Missing required config key '" + key + "'");
    }
    return *value;
}

void read_double(const KeyMap& config, const std::string& key, double& out, bool required = false)
{
    const std::string* value = required ? &require_value(config, key) : find_value(config, key);
    if (!value)
        return;
    if (!try_parse_double_value(*value, out))
        throw_invalid_config_value(key, *value, "a finite number");
}

void read_positive_int(const KeyMap& config, const std::string& key, int& out, bool required = false)
{
    const std::string* value = required ? &require_value(config, key) : find_value(config, key);
    if (!value)
        return;
    if (!try_parse_positive_int_value(*value, out))
        throw_invalid_config_value(key, *value, "a positive integer");
}

void read_non_negative_int(const KeyMap& config, const std::string& key, int& out)
{
    const std::string* value = find_value(config, key);
    if (!value)
        return;
    if (!try_parse_non_negative_int_value(*value, out))
        throw_invalid_config_value(key, *value, "a non-negative integer");
}

void read_string(const KeyMap& config, const std::string& key, std::string& out)
{
    if (const std::string* value = find_value(config, key))
        out = *value;
}

void read_bool(const KeyMap& config, const std::string& key, bool& out)
{
    if (const std::string* value = find_value(config, key))
        out = parse_bool_value(*value);
}

std::string resolve_path(const std::string& base_dir, const std::string& path)
{
    if (path.empty() || base_dir.empty())
        return path;

    const std::filesystem::path p(path);
    if (p.is_absolute())
        return path;
    return (std::filesystem::path(base_dir) / p).lexically_normal().string();
}

DomainEntry read_domain(const KeyMap& config, const std::string& name)
{
    const std::string prefix = "domains." + name + ".";

    DomainEntry entry;
    DomainConfig& dc = entry.config;
    dc.name = name;

    read_double(config, prefix + "xsize", dc.xsize, true);
    read_double(config, prefix + "ysize", dc.ysize, true);
    read_positive_int(config, prefix + "itot", dc.itot, true);
    read_positive_int(config, prefix + "jtot", dc.jtot, true);
    read_non_negative_int(config, prefix + "n_ghost", dc.n_ghost);
    read_non_negative_int(config, prefix + "n_sponge", dc.n_sponge);

    read_string(config, prefix + "parent", entry.parent);
    read_bool(config, prefix + "center_in_parent", dc.center_in_parent);
    read_double(config, prefix + "xstart_in_parent", dc.xstart_in_parent);
    read_double(config, prefix + "ystart_in_parent", dc.ystart_in_parent);

    const bool has_lon = find_value(config, prefix + "lon") != nullptr;
    const bool has_lat = find_value(config, prefix + "lat") != nullptr;
    if (has_lon != has_lat)
    {
        throw ConfigError("Domain '" + name + "' needs both lon and lat for its anchor");
    }
    if (has_lon)
    {
        dc.has_anchor = true;
        read_double(config, prefix + "lon", dc.lon, true);
        read_double(config, prefix + "lat", dc.lat, true);
    }
    if (const std::string* anchor = find_value(config, prefix + "anchor"))
    {
        dc.anchor = parse_anchor(*anchor);
    }
    read_string(config, prefix + "proj_str", dc.proj_str);

    return entry;
}

void read_domains(const KeyMap& config, NestinitConfig& out)
{
    const std::vector<std::string> order = parse_string_list(require_value(config, "domains.order"));
    if (order.empty())
    {
        throw ConfigError("domains.order must name at least one domain");
    }

    std::set<std::string> seen;
    for (const std::string& name : order)
    {
        if (!seen.insert(name).second)
        {
            throw ConfigError("Domain '" + name + "' appears twice in domains.order");
        }

        DomainEntry entry = read_domain(config, name);
        if (!entry.parent.empty() && seen.count(entry.parent) == 0)
        {
            throw ConfigError("Parent '" + entry.parent + "' of domain '" + name +
                              "' must be listed before it in domains.order");
        }
        if (entry.parent == name)
        {
            throw ConfigError("Domain '" + name + "' cannot be its own parent");
        }
        out.domains.push_back(std::move(entry));
    }

    out.target_domain = order.back();
    read_string(config, "domains.target", out.target_domain);
    if (seen.count(out.target_domain) == 0)
    {
        throw ConfigError("domains.target '" + out.target_domain + "' is not a configured domain");
    }
}

void read_pipeline(const KeyMap& config, const std::string& base_dir, PipelineOptions& p)
{
    read_double(config, "pipeline.sigma_h", p.sigma_h);
    read_positive_int(config, "pipeline.perturb_size", p.perturb_size);
    read_double(config, "pipeline.perturb_max_height", p.perturb_max_height);

    if (const std::string* seed = find_value(config, "pipeline.perturb_seed"))
    {
        if (!try_parse_uint64_value(*seed, p.perturb_seed))
            throw_invalid_config_value("pipeline.perturb_seed", *seed, "an unsigned integer");
    }

    const std::string amplitude_prefix = "pipeline.perturb_amplitude.";
    for (const auto& kv : config)
    {
        if (kv.first.rfind(amplitude_prefix, 0) != 0)
            continue;

        const std::string field = kv.first.substr(amplitude_prefix.size());
        double amplitude = 0.0;
        if (field.empty() || !try_parse_double_value(kv.second, amplitude))
            throw_invalid_config_value(kv.first, kv.second, "a finite number");
        p.perturb_amplitude[field] = amplitude;
    }

    if (const std::string* clip = find_value(config, "pipeline.clip_at_zero"))
    {
        p.clip_at_zero = parse_string_list(*clip);
    }

    read_bool(config, "pipeline.save_individual_lbcs", p.save_individual_lbcs);
    read_string(config, "pipeline.name_suffix", p.name_suffix);
    read_string(config, "pipeline.output_dir", p.output_dir);
    p.output_dir = resolve_path(base_dir, p.output_dir);
    read_positive_int(config, "pipeline.ntasks", p.ntasks);
    read_double(config, "pipeline.w_blend_height", p.w_blend_height);
    read_double(config, "pipeline.correction_tolerance", p.correction.tolerance);
    read_positive_int(config, "pipeline.correction_max_iter", p.correction.max_iter);

    p.validate();
}

void read_source(const KeyMap& config, const std::string& base_dir, SourceConfig& s)
{
    read_positive_int(config, "source.nlon", s.nlon, true);
    read_positive_int(config, "source.nlat", s.nlat, true);
    read_positive_int(config, "source.nlev", s.nlev, true);

    s.lon_file = resolve_path(base_dir, require_value(config, "source.lon_file"));
    s.lat_file = resolve_path(base_dir, require_value(config, "source.lat_file"));
    s.z_file = resolve_path(base_dir, require_value(config, "source.z_file"));

    if (const std::string* vertical = find_value(config, "source.vertical_coordinate"))
    {
        s.vertical = parse_vertical_coordinate(*vertical);
    }

    s.time = parse_double_list("source.time", require_value(config, "source.time"));
    if (s.time.empty())
    {
        throw ConfigError("source.time must list at least one time");
    }

    s.fields = parse_string_list(require_value(config, "source.fields"));
    if (s.fields.empty())
    {
        throw ConfigError("source.fields must list at least one field");
    }

    read_string(config, "source.field_file_pattern", s.field_file_pattern);
    if (s.field_file_pattern.find("{name}") == std::string::npos)
    {
        throw ConfigError("source.field_file_pattern '" + s.field_file_pattern + "' must contain {name}");
    }
    s.field_file_pattern = resolve_path(base_dir, s.field_file_pattern);
}

}

NestinitConfig build_config(const KeyMap& config, const std::string& base_dir)
{
    NestinitConfig out;

    if (const std::string* profile = find_value(config, "logging.profile"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(*profile, &valid);
        if (valid)
            out.log_profile = parsed;
        else
            warn_invalid_config_value("logging.profile", *profile, "quiet, normal or debug");
    }

    if (const std::string* dtype = find_value(config, "dtype"))
    {
        const std::string normalized = strutil::lower_copy(*dtype);
        if (normalized == "float32" || normalized == "single")
            out.dtype = "float32";
        else if (normalized == "float64" || normalized == "double")
            out.dtype = "float64";
        else
            throw_invalid_config_value("dtype", *dtype, "float32 or float64");
    }

    read_domains(config, out);

    // Vertical grid.
    read_string(config, "vertical_grid.z_file", out.vertical_grid.z_file);
    out.vertical_grid.z_file = resolve_path(base_dir, out.vertical_grid.z_file);
    read_double(config, "vertical_grid.zsize", out.vertical_grid.zsize, true);
    if (out.vertical_grid.z_file.empty())
    {
        read_positive_int(config, "vertical_grid.ktot", out.vertical_grid.ktot, true);
    }
    if (out.vertical_grid.zsize <= 0.0)
    {
        throw ConfigError("vertical_grid.zsize must be positive");
    }

    // Base state.
    out.base_state.profile_file = resolve_path(base_dir, require_value(config, "base_state.profile_file"));
    read_double(config, "base_state.pbot", out.base_state.pbot);
    read_bool(config, "base_state.moist", out.base_state.moist);
    if (out.base_state.pbot <= 0.0)
    {
        throw ConfigError("base_state.pbot must be positive");
    }

    read_source(config, base_dir, out.source);
    read_pipeline(config, base_dir, out.pipeline);

    return out;
}

/**
 * @brief Loads the configuration from a YAML file.
 */
NestinitConfig load_config(const std::string& config_path)
{
    const bool quiet_override = (global_log_profile == LogProfile::quiet);

    const KeyMap config = parse_yaml_simple(config_path);
    const std::string base_dir = std::filesystem::path(config_path).parent_path().string();

    NestinitConfig out = build_config(config, base_dir);
    if (config.count("logging.profile"))
    {
        global_log_profile = out.log_profile;
    }

    if (!quiet_override && log_normal_enabled())
    {
        std::cout << "[CONFIG] Loaded " << config_path << " with " << config.size() << " keys, "
                  << out.domains.size() << " domains, target '" << out.target_domain
                  << "', dtype " << out.dtype << std::endl;
    }

    return out;
}

} // namespace nestinit
