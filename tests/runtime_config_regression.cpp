#include "errors.hpp"
#include "field_io.hpp"
#include "input_files.hpp"
#include "logging.hpp"
#include "runtime_config.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

using namespace nestinit;
namespace fs = std::filesystem;

namespace
{
using KeyMap = std::unordered_map<std::string, std::string>;

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[runtime-config-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

bool throws_config_error(const std::function<void()>& fn)
{
    try
    {
        fn();
    }
    catch (const ConfigError&)
    {
        return true;
    }
    return false;
}

bool throws_data_error(const std::function<void()>& fn)
{
    try
    {
        fn();
    }
    catch (const DataError&)
    {
        return true;
    }
    return false;
}

void write_text(const fs::path& path, const std::string& text)
{
    std::ofstream out(path);
    out << text;
}

const char* config_text = R"(# Two nested domains over the Netherlands
logging:
  profile: quiet

dtype: float32

domains:
  order: [outer, inner]
  target: inner
  outer:
    xsize: 12800
    ysize: 12800
    itot: 64
    jtot: 64
    n_ghost: 3
    n_sponge: 5
    lon: 4.9
    lat: 52.0
    anchor: sw
    proj_str: "+proj=lcc +lat_1=52.5 +lat_2=51.5 +lat_0=52 +lon_0=4.9 +ellps=WGS84"
  inner:
    parent: outer
    xsize: 3200    # 32 outer cells
    ysize: 3200
    itot: 64
    jtot: 64
    center_in_parent: true

vertical_grid:
  ktot: 32
  zsize: 3200

base_state:
  profile_file: profile.txt
  pbot: 101300
  moist: false

source:
  nlon: 3
  nlat: 2
  nlev: 2
  lon_file: lon.bin
  lat_file: lat.bin
  z_file: z.bin
  vertical_coordinate: height
  time: [0, 3600]
  fields: [thl, qt]
  field_file_pattern: "fields/{name}.bin"

pipeline:
  sigma_h: 250
  perturb_size: 4
  perturb_max_height: 300
  perturb_seed: 42
  perturb_amplitude:
    thl: 0.1
    qt: 1e-4
  clip_at_zero: [qt]
  save_individual_lbcs: yes
  name_suffix: 'ens1'
  output_dir: out
  ntasks: 2
)";

/**
 * @brief Minimal key map that builds into a valid configuration.
 */
KeyMap minimal_config()
{
    return KeyMap{
        {"domains.order", "[les]"},
        {"domains.les.xsize", "3200"},
        {"domains.les.ysize", "3200"},
        {"domains.les.itot", "32"},
        {"domains.les.jtot", "32"},
        {"domains.les.lon", "4.9"},
        {"domains.les.lat", "52"},
        {"domains.les.proj_str", "+proj=merc +lon_0=4.9 +ellps=WGS84"},
        {"vertical_grid.ktot", "16"},
        {"vertical_grid.zsize", "1600"},
        {"base_state.profile_file", "/data/profile.txt"},
        {"source.nlon", "4"},
        {"source.nlat", "4"},
        {"source.nlev", "3"},
        {"source.lon_file", "lon.bin"},
        {"source.lat_file", "lat.bin"},
        {"source.z_file", "z.bin"},
        {"source.time", "[0]"},
        {"source.fields", "[thl]"},
    };
}

int test_value_parsing()
{
    int failures = 0;

    int i = 0;
    failures += expect_true(try_parse_int_value("12", i) && i == 12, "integer");
    failures += expect_true(!try_parse_int_value("12.5", i) && !try_parse_int_value("", i), "non-integers rejected");
    failures += expect_true(!try_parse_non_negative_int_value("-3", i) && try_parse_non_negative_int_value("0", i),
                            "non-negative integers");
    failures += expect_true(!try_parse_positive_int_value("0", i), "zero is not positive");

    std::uint64_t seed = 0;
    failures += expect_true(try_parse_uint64_value("18446744073709551615", seed) && seed == UINT64_MAX,
                            "largest 64-bit seed");
    failures += expect_true(!try_parse_uint64_value("-1", seed), "negative seed rejected");

    double d = 0.0;
    failures += expect_true(try_parse_double_value("1e-4", d) && d == 1.0e-4, "exponent notation");
    failures += expect_true(!try_parse_double_value("inf", d) && !try_parse_double_value("nan", d) &&
                            !try_parse_double_value("3.5abc", d), "non-finite and trailing text rejected");

    failures += expect_true(parse_bool_value("yes") && parse_bool_value("True") && !parse_bool_value("off"),
                            "boolean spellings");
    failures += expect_true(strip_wrapping_quotes("'a b'") == "a b" && strip_wrapping_quotes("\"x'") == "\"x'",
                            "only matching quotes are removed");

    const std::vector<std::string> names = parse_string_list("[thl, 'qt', \"qr\" ,]");
    failures += expect_true(names == std::vector<std::string>{"thl", "qt", "qr"}, "bracketed name list");
    failures += expect_true(parse_string_list("[]").empty(), "empty list");
    failures += expect_true(parse_double_list("t", "[0, 1800.5, 3600]") == std::vector<double>{0.0, 1800.5, 3600.0},
                            "number list");
    failures += expect_true(throws_config_error([] { parse_double_list("t", "[0, soon]"); }),
                            "non-numeric list entry must be rejected");

    bool valid = false;
    failures += expect_true(parse_log_profile("DEBUG", &valid) == LogProfile::debug && valid, "log profile parsing");
    failures += expect_true(parse_log_profile("chatty", &valid) == LogProfile::normal && !valid,
                            "unknown log profile falls back to normal");
    failures += expect_true(std::string(log_profile_name(LogProfile::quiet)) == "quiet", "log profile names");

    return failures;
}

int test_load_config(const fs::path& dir)
{
    int failures = 0;

    fs::create_directories(dir / "fields");
    const fs::path config_path = dir / "nestinit.yaml";
    write_text(config_path, config_text);

    const KeyMap keys = parse_yaml_simple(config_path.string());
    failures += expect_true(keys.at("domains.outer.xsize") == "12800" && keys.at("domains.inner.xsize") == "3200",
                            "nested sections and trailing comments");
    failures += expect_true(keys.at("pipeline.perturb_amplitude.qt") == "1e-4", "third nesting level");
    failures += expect_true(keys.at("pipeline.clip_at_zero") == "[qt]" && keys.at("source.nlon") == "3",
                            "section closes when indentation drops");
    failures += expect_true(keys.at("pipeline.name_suffix") == "ens1", "single quotes are stripped");

    const LogProfile saved = global_log_profile;
    const NestinitConfig config = load_config(config_path.string());
    failures += expect_true(global_log_profile == LogProfile::quiet, "logging.profile applied on load");
    global_log_profile = saved;

    failures += expect_true(config.dtype == "float32", "dtype");
    failures += expect_true(config.domains.size() == 2 && config.target_domain == "inner", "domains and target");

    const DomainConfig& outer = config.domains[0].config;
    failures += expect_true(outer.name == "outer" && outer.itot == 64 && outer.has_anchor &&
                            outer.anchor == Anchor::southwest && outer.proj_str.rfind("+proj=lcc", 0) == 0,
                            "outer domain settings");
    const DomainEntry& inner = config.domains[1];
    failures += expect_true(inner.parent == "outer" && inner.config.center_in_parent && !inner.config.has_anchor &&
                            inner.config.n_ghost == 3 && inner.config.n_sponge == 5,
                            "inner domain settings with defaults");

    failures += expect_true(config.vertical_grid.ktot == 32 && config.vertical_grid.zsize == 3200.0 &&
                            config.vertical_grid.z_file.empty(), "equidistant vertical grid");
    failures += expect_true(!config.base_state.moist && config.base_state.pbot == 101300.0, "base state settings");
    failures += expect_true(fs::path(config.base_state.profile_file) == (dir / "profile.txt").lexically_normal(),
                            "relative paths resolve against the config directory");

    const SourceConfig& source = config.source;
    failures += expect_true(source.time == std::vector<double>{0.0, 3600.0} &&
                            source.fields == std::vector<std::string>{"thl", "qt"},
                            "source times and fields");
    failures += expect_true(fs::path(source.field_file_pattern) == (dir / "fields" / "{name}.bin").lexically_normal(),
                            "field file pattern resolved");

    const PipelineOptions& p = config.pipeline;
    failures += expect_true(p.sigma_h == 250.0 && p.perturb_size == 4 && p.perturb_seed == 42 && p.ntasks == 2,
                            "pipeline numbers");
    failures += expect_true(p.perturb_amplitude.size() == 2 && p.perturb_amplitude.at("qt") == 1.0e-4,
                            "perturbation amplitudes per field");
    failures += expect_true(p.clip_at_zero == std::vector<std::string>{"qt"} && p.save_individual_lbcs &&
                            p.name_suffix == "ens1", "clip list and output flags");
    failures += expect_true(p.w_blend_height == 500.0 && p.correction.max_iter == 20000,
                            "defaults of unset pipeline keys");

    // Source arrays described by the configuration.
    const std::vector<double> lon = {4.0, 5.0, 6.0, 4.0, 5.0, 6.0};
    const std::vector<double> lat = {51.0, 51.0, 51.0, 53.0, 53.0, 53.0};
    std::vector<double> z(2 * 2 * 6);
    std::vector<double> thl(z.size());
    std::vector<double> qt(z.size());
    for (std::size_t n = 0; n < z.size(); ++n)
    {
        z[n] = (n / 6) % 2 == 0 ? 10.0 : 5000.0;
        thl[n] = 290.0 + 0.01 * n;
        qt[n] = 1.0e-3 * n;
    }
    write_binary(dir / "lon.bin", lon.data(), lon.size());
    write_binary(dir / "lat.bin", lat.data(), lat.size());
    write_binary(dir / "z.bin", z.data(), z.size());
    write_binary(dir / "fields" / "thl.bin", thl.data(), thl.size());
    write_binary(dir / "fields" / "qt.bin", qt.data(), qt.size());

    const SourceData data = load_source_data(source);
    failures += expect_true(data.ntime == 2 && data.nlev == 2 && data.plane_size() == 6, "source dimensions");
    failures += expect_true(data.fields.size() == 2 && data.field_at("qt", 1)[3] == qt[15],
                            "field values per time");
    failures += expect_true(data.zcoord_at(1)[7] == 5000.0 && data.lat[4] == 53.0, "coordinates");

    write_binary(dir / "fields" / "qt.bin", qt.data(), qt.size() - 1);
    failures += expect_true(throws_data_error([&] { load_source_data(source); }),
                            "field file of the wrong size must be rejected");

    failures += expect_true(throws_config_error([&] { parse_yaml_simple((dir / "missing.yaml").string()); }),
                            "missing config file must raise ConfigError");

    return failures;
}

int test_invalid_configs()
{
    int failures = 0;

    bool ok = true;
    try
    {
        const NestinitConfig config = build_config(minimal_config(), "");
        ok = config.target_domain == "les" && config.dtype == "float64" &&
             config.source.vertical == VerticalCoordinate::height &&
             config.source.field_file_pattern == "{name}.bin" && config.pipeline.output_dir == ".";
    }
    catch (const std::exception& e)
    {
        std::cerr << e.what() << std::endl;
        ok = false;
    }
    failures += expect_true(ok, "minimal configuration with defaults");

    const auto modified = [](const std::string& key, const std::string& value)
    {
        KeyMap config = minimal_config();
        if (value.empty())
            config.erase(key);
        else
            config[key] = value;
        return config;
    };

    failures += expect_true(throws_config_error([&] { build_config(modified("domains.les.itot", ""), ""); }),
                            "missing itot must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("domains.les.itot", "-4"), ""); }),
                            "negative itot must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("domains.les.lat", ""), ""); }),
                            "anchor without latitude must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("dtype", "int8"), ""); }),
                            "unknown dtype must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("domains.target", "nope"), ""); }),
                            "unknown target domain must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("domains.les.anchor", "middle"), ""); }),
                            "unknown anchor must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("source.vertical_coordinate", "sigma"), ""); }),
                            "unknown vertical coordinate must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("source.time", "[]"), ""); }),
                            "empty time list must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("source.field_file_pattern", "thl.bin"), ""); }),
                            "field file pattern without {name} must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("pipeline.perturb_amplitude.u", "0.5"), ""); }),
                            "perturbing momentum must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("pipeline.clip_at_zero", "[w]"), ""); }),
                            "clipping momentum must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("pipeline.perturb_seed", "-7"), ""); }),
                            "negative seed must be rejected");
    failures += expect_true(throws_config_error([&] { build_config(modified("pipeline.ntasks", "0"), ""); }),
                            "zero tasks must be rejected");

    KeyMap two_domains = minimal_config();
    two_domains["domains.order"] = "[child, les]";
    two_domains["domains.child.xsize"] = "800";
    two_domains["domains.child.ysize"] = "800";
    two_domains["domains.child.itot"] = "16";
    two_domains["domains.child.jtot"] = "16";
    two_domains["domains.child.parent"] = "les";
    failures += expect_true(throws_config_error([&] { build_config(two_domains, ""); }),
                            "parent listed after its child must be rejected");

    two_domains["domains.order"] = "[les, child]";
    failures += expect_true(build_config(two_domains, "").target_domain == "child",
                            "last listed domain is the default target");

    const KeyMap bad_profile = modified("logging.profile", "chatty");
    failures += expect_true(build_config(bad_profile, "").log_profile == LogProfile::normal,
                            "invalid log profile only warns");

    return failures;
}

int test_profile_files(const fs::path& dir)
{
    int failures = 0;

    fs::create_directories(dir);
    write_text(dir / "moist.txt", "# z thl qt\n\n10  290.0 0.010\n500 292.0 0.008  # inversion below\n2000 300.0 0.002\n");
    write_text(dir / "dry.txt", "0 290\n1000 295\n");
    write_text(dir / "mixed.txt", "0 290 0.01\n1000 295\n");
    write_text(dir / "unsorted.txt", "0 290\n1000 295\n1000 296\n");
    write_text(dir / "levels.txt", "25 75\n125\n# top\n200\n");

    const ProfileTable moist = read_profile_table((dir / "moist.txt").string());
    failures += expect_true(moist.has_qt() && moist.z.size() == 3 && moist.qt[1] == 0.008, "three column profile");

    const ProfileTable dry = read_profile_table((dir / "dry.txt").string());
    failures += expect_true(!dry.has_qt() && dry.thl[1] == 295.0, "two column profile");

    failures += expect_true(throws_data_error([&] { read_profile_table((dir / "mixed.txt").string()); }),
                            "rows with different column counts must be rejected");
    failures += expect_true(throws_data_error([&] { read_profile_table((dir / "unsorted.txt").string()); }),
                            "repeated heights must be rejected");
    failures += expect_true(throws_data_error([&] { read_profile_table((dir / "none.txt").string()); }),
                            "missing profile must be rejected");

    failures += expect_true(read_text_values((dir / "levels.txt").string()) == std::vector<double>{25.0, 75.0, 125.0, 200.0},
                            "level file with several values per row and comments");

    const std::vector<float> thl = interpolate_profile<float>(dry.z, dry.thl, {-50.0f, 500.0f, 1500.0f});
    failures += expect_true(thl[0] == 290.0f && std::abs(thl[1] - 292.5f) < 1.0e-5f && thl[2] == 295.0f,
                            "profile interpolated linearly and clamped at both ends");

    return failures;
}
}

int main()
{
    const fs::path root = fs::temp_directory_path() / "nestinit_config_regression";
    fs::remove_all(root);

    int failures = 0;
    try
    {
        failures += test_value_parsing();
        failures += test_load_config(root / "run");
        failures += test_invalid_configs();
        failures += test_profile_files(root / "profiles");
    }
    catch (const std::exception& e)
    {
        std::cerr << "[runtime-config-regression] FAIL: unexpected exception: " << e.what() << std::endl;
        ++failures;
    }

    fs::remove_all(root);

    if (failures > 0)
    {
        std::cerr << "[runtime-config-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[runtime-config-regression] all checks passed" << std::endl;
    return 0;
}
