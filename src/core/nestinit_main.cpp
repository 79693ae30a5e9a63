/**
 * @file nestinit_main.cpp
 * @brief Command line driver of the nesting preprocessor.
 *
 * Loads the run configuration, builds the domain nest, the vertical grid
 * and the base state, reads the reanalysis arrays and writes initial and
 * lateral boundary fields for the target domain.
 * This file belongs to the primary src/core execution layer.
 */

#include "base_state.hpp"
#include "domain.hpp"
#include "input_files.hpp"
#include "logging.hpp"
#include "nesting_pipeline.hpp"
#include "runtime_config.hpp"
#include "vertical_grid.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace nestinit;

namespace
{

void print_usage(const char* program)
{
    std::cerr << "Usage: " << program << " [--log-profile=quiet|normal|debug] <config.yaml>" << std::endl;
}

DomainNest build_nest(const NestinitConfig& config)
{
    DomainNest nest;
    for (const DomainEntry& entry : config.domains)
    {
        const int parent_id = entry.parent.empty() ? -1 : nest.find(entry.parent);
        const int id = nest.add_domain(entry.config, parent_id);
        if (parent_id >= 0)
            nest.set_child(parent_id, id);
    }
    return nest;
}

template<typename TF>
VerticalGrid<TF> build_vertical_grid(const VerticalGridConfig& config)
{
    std::vector<TF> z;
    if (!config.z_file.empty())
    {
        for (const double value : read_text_values(config.z_file))
            z.push_back(static_cast<TF>(value));
    }
    else
    {
        z = equidistant_levels<TF>(config.ktot, static_cast<TF>(config.zsize));
    }
    return VerticalGrid<TF>(z, static_cast<TF>(config.zsize));
}

template<typename TF>
BaseState<TF> build_base_state(const BaseStateConfig& config, const VerticalGrid<TF>& grid)
{
    const ProfileTable profile = read_profile_table(config.profile_file);
    const std::vector<TF> thl = interpolate_profile(profile.z, profile.thl, grid.z());
    const TF pbot = static_cast<TF>(config.pbot);

    if (config.moist)
    {
        if (!profile.has_qt())
        {
            std::cerr << "Warning: base_state.moist is set but " << config.profile_file
                      << " has no qt column; using qt = 0" << std::endl;
        }
        const std::vector<TF> qt = profile.has_qt()
            ? interpolate_profile(profile.z, profile.qt, grid.z())
            : std::vector<TF>(grid.z().size(), TF(0));
        return BaseState<TF>::moist(grid, thl, qt, pbot);
    }
    return BaseState<TF>::dry(grid, thl, pbot);
}

template<typename TF>
int run(const NestinitConfig& config, const DomainNest& nest, const SourceData& source)
{
    const Domain& target = nest.domain(nest.find(config.target_domain));

    const VerticalGrid<TF> grid = build_vertical_grid<TF>(config.vertical_grid);
    const BaseState<TF> base_state = build_base_state(config.base_state, grid);

    if (log_normal_enabled())
    {
        std::cout << "[BASESTATE] " << (base_state.is_moist() ? "Moist" : "Dry") << " base state on "
                  << base_state.ktot() << " levels, p from " << base_state.ph().front() << " to "
                  << base_state.ph().back() << " Pa" << std::endl;
    }

    const NestingPipeline<TF> pipeline(target, grid, base_state, source, config.pipeline);
    const PipelineSummary summary = pipeline.run();

    if (log_normal_enabled())
    {
        std::cout << "[PIPELINE] Done: " << summary.scalar_items << " scalar items, "
                  << summary.momentum_items << " momentum items, "
                  << summary.files_written << " files" << std::endl;
    }
    return 0;
}

}

/**
 * @brief Program entry point.
 * @param argc CLI argument count.
 * @param argv CLI argument vector.
 * @return Zero on success, non-zero on configuration, data or numerical failure.
 */
int main(int argc, char** argv)
{
    bool log_profile_from_cli = false;
    LogProfile cli_log_profile = LogProfile::normal;
    std::string config_path;

    if (const char* env_log_profile = std::getenv("NESTINIT_LOG_PROFILE"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(env_log_profile, &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            std::cerr << "Warning: Invalid NESTINIT_LOG_PROFILE '" << env_log_profile
                      << "'. Valid values: quiet, normal, debug." << std::endl;
        }
    }

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg.rfind("--log-profile=", 0) == 0)
        {
            bool valid = false;
            cli_log_profile = parse_log_profile(arg.substr(14), &valid);
            if (!valid)
            {
                std::cerr << "Invalid --log-profile value. Use quiet, normal, or debug." << std::endl;
                return 1;
            }
            log_profile_from_cli = true;
        }
        else if (arg == "--log-profile" && i + 1 < argc)
        {
            bool valid = false;
            cli_log_profile = parse_log_profile(argv[++i], &valid);
            if (!valid)
            {
                std::cerr << "Invalid --log-profile value. Use quiet, normal, or debug." << std::endl;
                return 1;
            }
            log_profile_from_cli = true;
        }
        else if (!arg.empty() && arg[0] != '-' && config_path.empty())
        {
            config_path = arg;
        }
        else
        {
            std::cerr << "Unknown argument '" << arg << "'" << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty())
    {
        print_usage(argv[0]);
        return 1;
    }

    if (log_profile_from_cli)
    {
        global_log_profile = cli_log_profile;
    }

    try
    {
        const NestinitConfig config = load_config(config_path);
        if (log_profile_from_cli)
        {
            global_log_profile = cli_log_profile;
        }

        if (log_normal_enabled())
        {
            std::cout << "[RUN SETTINGS] log_profile=" << log_profile_name(global_log_profile)
                      << ", dtype=" << config.dtype
                      << ", ntasks=" << config.pipeline.ntasks;
#ifdef _OPENMP
            std::cout << ", omp_max_threads=" << omp_get_max_threads();
#endif
            std::cout << std::endl;
        }

        const DomainNest nest = build_nest(config);
        const SourceData source = load_source_data(config.source);

        if (config.dtype == "float32")
            return run<float>(config, nest, source);
        return run<double>(config, nest, source);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
