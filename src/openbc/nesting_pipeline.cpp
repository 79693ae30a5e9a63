/**
 * @file nesting_pipeline.cpp
 * @brief Implementation for the openbc module.
 *
 * Work-item scheduling, per-item processing and output of initial and
 * lateral boundary fields.
 * This file is part of the src/openbc subsystem.
 */

#include "nesting_pipeline.hpp"

#include "errors.hpp"
#include "field_io.hpp"
#include "lateral_boundaries.hpp"
#include "logging.hpp"
#include "perturbation.hpp"
#include "spatial_filter.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>

namespace nestinit
{

namespace
{

bool is_momentum(const std::string& name)
{
    return name == "u" || name == "v" || name == "w";
}

bool contains(const std::vector<std::string>& list, const std::string& name)
{
    return std::find(list.begin(), list.end(), name) != list.end();
}

/**
 * @brief Runs `work(n)` for all items on an OpenMP team.
 *
 * The first exception raised by any item is rethrown after the team has
 * joined; remaining items are skipped once an item failed.
 */
template<typename Work>
void run_work_items(int nitems, int ntasks, Work&& work)
{
    std::exception_ptr first_error = nullptr;
    std::atomic<bool> failed{false};

    #pragma omp parallel for schedule(dynamic) num_threads(ntasks)
    for (int n = 0; n < nitems; ++n)
    {
        if (failed.load())
            continue;

        try
        {
            work(n);
        }
        catch (...)
        {
            #pragma omp critical(nestinit_work_error)
            {
                if (!first_error)
                    first_error = std::current_exception();
            }
            failed.store(true);
        }
    }

    if (first_error)
        std::rethrow_exception(first_error);
}

double seconds_since(const std::chrono::steady_clock::time_point& tick)
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - tick).count();
}

}

void PipelineOptions::validate() const
{
    if (sigma_h < 0.0 || !std::isfinite(sigma_h))
        throw ConfigError("sigma_h must be a non-negative length");
    if (perturb_size <= 0)
        throw ConfigError("perturb_size must be positive");
    if (perturb_max_height < 0.0)
        throw ConfigError("perturb_max_height must be non-negative");
    if (ntasks < 1)
        throw ConfigError("ntasks must be at least 1");
    if (w_blend_height < 0.0)
        throw ConfigError("w_blend_height must be non-negative");
    if (!(correction.tolerance > 0.0))
        throw ConfigError("Divergence correction tolerance must be positive");
    if (correction.max_iter < 1)
        throw ConfigError("Divergence correction max_iter must be at least 1");
    if (output_dir.empty())
        throw ConfigError("output_dir must not be empty");

    for (const auto& [name, amplitude] : perturb_amplitude)
    {
        if (is_momentum(name))
            throw ConfigError("Momentum field '" + name + "' cannot be perturbed; only scalars are");
        if (amplitude < 0.0 || !std::isfinite(amplitude))
            throw ConfigError("Perturbation amplitude of '" + name + "' must be non-negative");
    }

    for (const std::string& name : clip_at_zero)
    {
        if (is_momentum(name))
            throw ConfigError("Momentum field '" + name + "' cannot be clipped at zero");
    }
}

template<typename TF>
NestingPipeline<TF>::NestingPipeline(const Domain& domain,
                                     const VerticalGrid<TF>& grid,
                                     const BaseState<TF>& base_state,
                                     const SourceData& source,
                                     const PipelineOptions& options)
    : domain_(domain),
      grid_(grid.has_ghost_levels() ? grid.without_ghost_levels() : grid),
      base_state_(base_state),
      source_(source),
      options_(options),
      sigma_n_(0),
      has_momentum_(false)
{
    options_.validate();
    source_.validate();

    if (!domain_.has_projection())
    {
        throw ConfigError("Domain '" + domain_.name() + "' needs a geographic anchor for nesting");
    }
    if (base_state_.ktot() != grid_.ktot())
    {
        throw ConfigError("Base state has " + std::to_string(base_state_.ktot()) +
                          " levels, vertical grid has " + std::to_string(grid_.ktot()));
    }

    z_ = grid_.z();
    zh_ = grid_.zh();
    dz_ = grid_.dz();

    // Momentum is all or nothing.
    const int n_momentum = static_cast<int>(source_.has_field("u")) +
                           static_cast<int>(source_.has_field("v")) +
                           static_cast<int>(source_.has_field("w"));
    if (n_momentum == 3)
    {
        has_momentum_ = true;
    }
    else if (n_momentum > 0)
    {
        throw DataError("Incomplete momentum set: u, v and w must all be present");
    }
    else
    {
        std::cerr << "Warning: no momentum fields (u, v, w) in the source data; skipping momentum" << std::endl;
    }

    for (const auto& entry : source_.fields)
    {
        if (!is_momentum(entry.first))
            scalar_names_.push_back(entry.first);
    }

    for (const auto& entry : options_.perturb_amplitude)
    {
        if (!source_.has_field(entry.first))
            std::cerr << "Warning: perturbed field '" << entry.first << "' is not in the source data" << std::endl;
    }
    for (const std::string& name : options_.clip_at_zero)
    {
        if (!source_.has_field(name))
            std::cerr << "Warning: clipped field '" << name << "' is not in the source data" << std::endl;
    }

    // Output times must be distinct whole seconds.
    std::set<int> iotimes;
    for (int t = 0; t < source_.ntime; ++t)
    {
        const double time = source_.time[t];
        if (time < 0.0 || time > static_cast<double>(std::numeric_limits<int>::max()))
        {
            throw DataError("Source time " + std::to_string(time) + " s cannot be written as an output time");
        }
        if (!iotimes.insert(iotime(t)).second)
        {
            throw DataError("Source times round to the same output time " + std::to_string(iotime(t)) + " s");
        }
    }

    sigma_n_ = filter_width_in_cells(options_.sigma_h, domain_.dx());
    if (sigma_n_ > 0 && log_normal_enabled())
    {
        std::cout << "[PIPELINE] Using Gaussian filter with sigma = " << sigma_n_ << " grid cells" << std::endl;
    }

    const Projection& proj_pad = domain_.proj_pad();
    const RectilinearAxes axes = extract_rectilinear_axes(source_);
    weights_s_ = compute_horizontal_weights(axes, proj_pad.lon(), proj_pad.lat());
    weights_u_ = compute_horizontal_weights(axes, proj_pad.lon_u(), proj_pad.lat_u());
    weights_v_ = compute_horizontal_weights(axes, proj_pad.lon_v(), proj_pad.lat_v());

    if (source_.vertical == VerticalCoordinate::pressure)
    {
        target_full_.assign(base_state_.p().begin(), base_state_.p().end());
        target_half_.assign(base_state_.ph().begin(), base_state_.ph().end());
    }
    else
    {
        target_full_.assign(z_.begin(), z_.end());
        target_half_.assign(zh_.begin(), zh_.end());
    }
}

template<typename TF>
int NestingPipeline<TF>::iotime(int t) const
{
    return static_cast<int>(std::lround(source_.time.at(t)));
}

template<typename TF>
GridRegion NestingPipeline<TF>::correction_region() const
{
    return GridRegion{0, domain_.itot() + 2*domain_.n_ghost(), 0, domain_.jtot() + 2*domain_.n_ghost()};
}

template<typename TF>
GridRegion NestingPipeline<TF>::interior_region() const
{
    return GridRegion{domain_.istart_pad(), domain_.iend_pad(), domain_.jstart_pad(), domain_.jend_pad()};
}

template<typename TF>
Field3D<TF> NestingPipeline<TF>::interpolate(const std::string& name, int t,
                                             const HorizontalWeights& weights,
                                             const std::vector<double>& target) const
{
    Field3D<TF> field(static_cast<int>(target.size()), domain_.jcells_pad(), domain_.icells_pad());

    interpolate_to_grid(field,
                        source_.field_at(name, t),
                        source_.zcoord_at(t),
                        source_.nlev, source_.nlat, source_.nlon,
                        weights,
                        target);

    // NaN would spread through the filter and the pressure solve unnoticed.
    for (int k = 0; k < field.size_z(); ++k)
        for (int j = 0; j < field.size_y(); ++j)
            for (int i = 0; i < field.size_x(); ++i)
            {
                if (!std::isfinite(static_cast<double>(field(k, j, i))))
                {
                    std::ostringstream ss;
                    ss << "Field '" << name << "' at time index " << t << " (" << source_.time[t]
                       << " s) is not finite after interpolation at level " << k << ", j=" << j
                       << ", i=" << i << "; masked or missing source values reach the LES domain";
                    throw DataError(ss.str());
                }
            }

    gaussian_filter(field, sigma_n_);
    return field;
}

template<typename TF>
Field3D<TF> NestingPipeline<TF>::process_scalar(const std::string& name, int t) const
{
    if (!contains(scalar_names_, name))
    {
        throw DataError("Scalar field '" + name + "' is not in the source data");
    }

    if (log_debug_enabled())
    {
        std::cout << "[PIPELINE] Processing field " << name << " at t=" << t << std::endl;
    }

    Field3D<TF> field = interpolate(name, t, weights_s_, target_full_);

    const auto amp = options_.perturb_amplitude.find(name);
    if (t == 0 && amp != options_.perturb_amplitude.end())
    {
        PerturbationSettings settings;
        settings.block_size = options_.perturb_size;
        settings.amplitude = amp->second;
        settings.max_height = options_.perturb_max_height;
        settings.seed = options_.perturb_seed;
        add_block_perturbations(field, z_, interior_region(), settings, name);
    }

    if (contains(options_.clip_at_zero, name))
        clip_at_zero(field);

    return field;
}

template<typename TF>
MomentumFields<TF> NestingPipeline<TF>::process_momentum(int t) const
{
    if (!has_momentum_)
    {
        throw DataError("No momentum fields in the source data");
    }

    if (log_debug_enabled())
    {
        std::cout << "[PIPELINE] Processing momentum at t=" << t << std::endl;
    }

    MomentumFields<TF> m;
    m.u = interpolate("u", t, weights_u_, target_full_);
    m.v = interpolate("v", t, weights_v_, target_full_);
    m.w = interpolate("w", t, weights_s_, target_half_);

    // Reanalysis w can have odd near-surface profiles; this also gives w = 0 at the surface.
    blend_w_to_zero(m.w, zh_, options_.w_blend_height);

    const GridRegion region = correction_region();
    std::ostringstream context;
    context << "momentum at t=" << t << " (" << source_.time[t] << " s)";

    correct_div_uv(m.u, m.v, m.w,
                   base_state_.rho(), base_state_.rhoh(), dz_,
                   domain_.dx(), domain_.dy(),
                   region.iend, region.jend,
                   options_.correction,
                   context.str());

    m.divergence = check_divergence(m.u, m.v, m.w,
                                    base_state_.rho(), base_state_.rhoh(), dz_,
                                    domain_.dx(), domain_.dy(),
                                    region);

    if (log_debug_enabled())
    {
        std::cout << "[PIPELINE] Maximum divergence in LES domain: " << m.divergence.max_abs
                  << " at i=" << m.divergence.i << ", j=" << m.divergence.j
                  << ", k=" << m.divergence.k << std::endl;
    }

    return m;
}

template<typename TF>
void NestingPipeline<TF>::write_outputs(const Field3D<TF>& field, const std::string& name, int t, int nlev,
                                        int& files_written) const
{
    const std::filesystem::path dir(options_.output_dir);
    const int time_tag = iotime(t);

    write_field_window(field_filename(dir, name, options_.name_suffix, time_tag), field, nlev,
                       domain_.jstart_pad(), domain_.jtot(), domain_.istart_pad(), domain_.itot());
    ++files_written;

    if (!options_.save_individual_lbcs)
        return;

    for (const LbcLocation loc : lbc_locations)
    {
        const LbcWindow window = lbc_window(domain_, loc, name);
        const std::vector<TF> face = extract_lbc(field, window, nlev);
        const std::string lbc_name = "lbc_" + name + "_" + to_string(loc);
        write_binary(field_filename(dir, lbc_name, options_.name_suffix, time_tag), face.data(), face.size());
        ++files_written;
    }
}

template<typename TF>
PipelineSummary NestingPipeline<TF>::run() const
{
    if (log_normal_enabled())
    {
        std::cout << "[PIPELINE] Creating input for domain '" << domain_.name() << "' in "
                  << options_.output_dir << " (" << source_.ntime << " times, "
                  << scalar_names_.size() << " scalars, momentum "
                  << (has_momentum_ ? "on" : "off") << ", " << options_.ntasks << " tasks)" << std::endl;
    }

    std::filesystem::create_directories(options_.output_dir);

    const int ktot = grid_.ktot();
    std::atomic<int> files_written{0};
    PipelineSummary summary;

    // Scalars: one item per (field, time).
    struct Scalar_item
    {
        const std::string* name;
        int t;
    };
    std::vector<Scalar_item> scalar_items;
    for (const std::string& name : scalar_names_)
        for (int t = 0; t < source_.ntime; ++t)
            scalar_items.push_back({&name, t});

    auto tick = std::chrono::steady_clock::now();
    run_work_items(static_cast<int>(scalar_items.size()), options_.ntasks, [&](int n)
    {
        const Scalar_item& item = scalar_items[n];
        const Field3D<TF> field = process_scalar(*item.name, item.t);
        int written = 0;
        write_outputs(field, *item.name, item.t, ktot, written);
        files_written += written;
    });
    summary.scalar_items = static_cast<int>(scalar_items.size());

    if (log_normal_enabled() && !scalar_items.empty())
    {
        std::cout << "[PIPELINE] Created scalar input in " << seconds_since(tick) << " s" << std::endl;
    }

    // Momentum: one item per time.
    if (has_momentum_)
    {
        double max_divergence = 0.0;

        tick = std::chrono::steady_clock::now();
        run_work_items(source_.ntime, options_.ntasks, [&](int t)
        {
            const MomentumFields<TF> m = process_momentum(t);
            int written = 0;
            write_outputs(m.u, "u", t, ktot, written);
            write_outputs(m.v, "v", t, ktot, written);
            // Top half level of w is not part of the model state.
            write_outputs(m.w, "w", t, ktot, written);
            files_written += written;

            #pragma omp critical(nestinit_divergence_max)
            {
                max_divergence = std::max(max_divergence, m.divergence.max_abs);
            }
        });
        summary.momentum_items = source_.ntime;
        summary.max_divergence = max_divergence;

        if (log_normal_enabled())
        {
            std::cout << "[PIPELINE] Created momentum input in " << seconds_since(tick)
                      << " s, max divergence " << max_divergence << std::endl;
        }
    }

    summary.files_written = files_written.load();
    return summary;
}

template class NestingPipeline<float>;
template class NestingPipeline<double>;

} // namespace nestinit
