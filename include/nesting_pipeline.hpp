#pragma once

#include "base_state.hpp"
#include "divergence.hpp"
#include "domain.hpp"
#include "field3d.hpp"
#include "interpolation.hpp"
#include "source_data.hpp"
#include "vertical_grid.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * @file nesting_pipeline.hpp
 * @brief Reanalysis to LES initial and lateral boundary conditions.
 *
 * For every (field, time) pair the pipeline interpolates the source data to
 * the ghost-padded grid of one domain, smooths it, and writes the interior
 * volume and optionally the four lateral boundary faces. Momentum is handled
 * per time: `w` is blended to zero near the surface and `u`, `v` are
 * corrected so the density-weighted divergence vanishes in every cell of
 * the padded region. Work items run on an OpenMP team of `ntasks` threads.
 */

namespace nestinit
{

struct PipelineOptions
{
    double sigma_h = 0.0;                     ///< Gaussian filter width (m).

    int perturb_size = 2;                     ///< Block size (cells).
    std::map<std::string, double> perturb_amplitude;
    double perturb_max_height = 0.0;          ///< (m)
    std::uint64_t perturb_seed = 1;

    std::vector<std::string> clip_at_zero;

    bool save_individual_lbcs = false;
    std::string name_suffix;
    std::string output_dir = ".";
    int ntasks = 1;

    double w_blend_height = 500.0;            ///< (m)
    CorrectionSettings correction;

    /**
     * @throws ConfigError on invalid values or momentum in the
     *         perturbation or clipping lists.
     */
    void validate() const;
};

/**
 * @brief Padded momentum fields of one time.
 */
template<typename TF>
struct MomentumFields
{
    Field3D<TF> u;
    Field3D<TF> v;
    Field3D<TF> w;
    DivergenceCheck divergence;
};

struct PipelineSummary
{
    int scalar_items = 0;
    int momentum_items = 0;
    int files_written = 0;
    double max_divergence = 0.0;
};

template<typename TF>
class NestingPipeline
{
public:
    /**
     * @brief Validates the inputs and precomputes interpolation weights.
     *
     * All references must outlive the pipeline.
     * @throws ConfigError when the domain has no projection or the grid and
     *         base state disagree.
     * @throws DataError on malformed source data, a partial momentum set or
     *         target points outside the source grid.
     */
    NestingPipeline(const Domain& domain,
                    const VerticalGrid<TF>& grid,
                    const BaseState<TF>& base_state,
                    const SourceData& source,
                    const PipelineOptions& options);

    /**
     * @brief Processes and writes all work items.
     */
    PipelineSummary run() const;

    /**
     * @brief Interpolated, filtered, perturbed and clipped scalar on the
     *        padded grid.
     */
    Field3D<TF> process_scalar(const std::string& name, int t) const;

    /**
     * @brief Interpolated, filtered and divergence-corrected momentum.
     */
    MomentumFields<TF> process_momentum(int t) const;

    /**
     * @brief Names of the scalar fields (all source fields except u, v, w).
     */
    const std::vector<std::string>& scalar_names() const { return scalar_names_; }

    bool has_momentum() const { return has_momentum_; }

    /**
     * @brief Output time in whole seconds for time index `t`.
     */
    int iotime(int t) const;

    /**
     * @brief Cells where the divergence is removed, interior plus ghost cells.
     */
    GridRegion correction_region() const;

    /**
     * @brief Physical cells of the domain inside the padded arrays.
     */
    GridRegion interior_region() const;

private:
    void write_outputs(const Field3D<TF>& field, const std::string& name, int t, int nlev,
                       int& files_written) const;

    Field3D<TF> interpolate(const std::string& name, int t, const HorizontalWeights& weights,
                            const std::vector<double>& target) const;

    const Domain& domain_;
    const VerticalGrid<TF> grid_;
    const BaseState<TF>& base_state_;
    const SourceData& source_;
    PipelineOptions options_;

    int sigma_n_;
    bool has_momentum_;
    std::vector<std::string> scalar_names_;

    HorizontalWeights weights_s_;
    HorizontalWeights weights_u_;
    HorizontalWeights weights_v_;

    // Vertical targets in the source coordinate (heights or pressures).
    std::vector<double> target_full_;
    std::vector<double> target_half_;

    std::vector<TF> z_;
    std::vector<TF> zh_;
    std::vector<TF> dz_;
};

} // namespace nestinit
