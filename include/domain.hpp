#pragma once

#include "projection.hpp"

#include <optional>
#include <string>
#include <vector>

/**
 * @file domain.hpp
 * @brief Nested Cartesian LES domains and the nest that links them.
 *
 * A `Domain` is one horizontal grid with ghost and sponge margins. When it
 * carries a geographic anchor it owns two projections: `proj` over the
 * physical cells and `proj_pad` over the ghost-padded cells used for the
 * lateral boundaries. Domains reference their parent and child by integer
 * handle into a `DomainNest`; nothing is owned across domains.
 */

namespace nestinit
{

/**
 * @brief User-facing description of one domain.
 */
struct DomainConfig
{
    std::string name = "domain";

    double xsize = 0.0;
    double ysize = 0.0;
    int itot = 0;
    int jtot = 0;

    int n_ghost = 3;
    int n_sponge = 5;

    // Placement inside the parent, ignored for root domains.
    bool center_in_parent = false;
    double xstart_in_parent = 0.0;
    double ystart_in_parent = 0.0;

    // Optional geographic anchor. A child without one is anchored at its
    // centre through the parent's projection.
    bool has_anchor = false;
    double lon = 0.0;
    double lat = 0.0;
    Anchor anchor = Anchor::center;
    std::string proj_str;
};

/**
 * @brief Absolute bounding box in the root frame (m).
 */
struct DomainBounds
{
    double xmin = 0.0;
    double xmax = 0.0;
    double ymin = 0.0;
    double ymax = 0.0;

    bool contains(const DomainBounds& other) const
    {
        return other.xmin >= xmin && other.xmax <= xmax &&
               other.ymin >= ymin && other.ymax <= ymax;
    }
};

class DomainNest;

class Domain
{
public:
    /**
     * @brief Builds a root domain.
     * @throws ConfigError on invalid geometry.
     */
    explicit Domain(const DomainConfig& config);

    /**
     * @brief Builds a domain nested in `parent`.
     *
     * The placement and the extent must both be integer multiples of the
     * parent grid spacing, and the domain must fit inside the parent.
     * @throws ConfigError when any of this does not hold.
     */
    Domain(const DomainConfig& config, const Domain& parent, int parent_id);

    const std::string& name() const { return name_; }

    double xsize() const { return xsize_; }
    double ysize() const { return ysize_; }
    int itot() const { return itot_; }
    int jtot() const { return jtot_; }
    double dx() const { return dx_; }
    double dy() const { return dy_; }
    double dxi() const { return 1.0 / dx_; }
    double dyi() const { return 1.0 / dy_; }

    int n_ghost() const { return n_ghost_; }
    int n_sponge() const { return n_sponge_; }

    int parent_id() const { return parent_id_; }
    int child_id() const { return child_id_; }
    bool has_parent() const { return parent_id_ >= 0; }
    bool has_child() const { return child_id_ >= 0; }

    /**
     * @brief Offset of the parent-relative placement (m).
     */
    double xstart_in_parent() const { return xstart_; }
    double ystart_in_parent() const { return ystart_; }

    /**
     * @brief Absolute offset of the south-west corner in the root frame (m).
     */
    double x0() const { return x0_; }
    double y0() const { return y0_; }

    DomainBounds bounds() const;

    /** Local cell centre and face positions of the physical cells. */
    const std::vector<double>& x() const { return x_; }
    const std::vector<double>& xh() const { return xh_; }
    const std::vector<double>& y() const { return y_; }
    const std::vector<double>& yh() const { return yh_; }

    /**
     * @brief Padded index range of the physical cells.
     *
     * Padded arrays have `n_ghost` extra cells west/south and `n_ghost+1`
     * east/north, so padded index `i` equals the host model's index `i`.
     */
    int istart_pad() const { return n_ghost_; }
    int iend_pad() const { return n_ghost_ + itot_; }
    int jstart_pad() const { return n_ghost_; }
    int jend_pad() const { return n_ghost_ + jtot_; }
    int icells_pad() const { return itot_ + 2 * n_ghost_ + 1; }
    int jcells_pad() const { return jtot_ + 2 * n_ghost_ + 1; }

    bool has_projection() const { return proj_.has_value(); }

    /**
     * @throws ConfigError when the domain has no geographic anchor.
     */
    const Projection& proj() const;
    const Projection& proj_pad() const;

private:
    friend class DomainNest;

    void validate_geometry() const;
    void build_coordinates();
    void build_projections(const std::string& proj_str, double lon, double lat, Anchor anchor,
                           std::shared_ptr<const MapTransform> transform);

    std::string name_;
    double xsize_;
    double ysize_;
    int itot_;
    int jtot_;
    double dx_;
    double dy_;
    int n_ghost_;
    int n_sponge_;

    int parent_id_ = -1;
    int child_id_ = -1;

    double xstart_ = 0.0;
    double ystart_ = 0.0;
    double x0_ = 0.0;
    double y0_ = 0.0;

    std::vector<double> x_;
    std::vector<double> xh_;
    std::vector<double> y_;
    std::vector<double> yh_;

    std::optional<Projection> proj_;
    std::optional<Projection> proj_pad_;
};

/**
 * @brief Index-based forest of domains.
 *
 * Handles are positions in the nest and stay valid for its lifetime.
 * Children are linked explicitly with `set_child`; the topology is assumed
 * to be a tree and is not checked for cycles.
 */
class DomainNest
{
public:
    /**
     * @brief Constructs a domain and stores it.
     * @param config Domain description.
     * @param parent_id Handle of the parent, or -1 for a root.
     * @return Handle of the new domain.
     */
    int add_domain(const DomainConfig& config, int parent_id = -1);

    /**
     * @brief Links `child_id` as the child of `parent_id`.
     * @throws ConfigError when the child was not built with that parent.
     */
    void set_child(int parent_id, int child_id);

    const Domain& domain(int id) const;
    const Domain& operator[](int id) const { return domain(id); }

    /**
     * @brief Returns the handle of a domain by name, -1 when absent.
     */
    int find(const std::string& name) const;

    int size() const { return static_cast<int>(domains_.size()); }

    const std::vector<Domain>& domains() const { return domains_; }

private:
    void check_handle(int id) const;

    std::vector<Domain> domains_;
};

} // namespace nestinit
