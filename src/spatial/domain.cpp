/**
 * @file domain.cpp
 * @brief Implementation for the spatial module.
 *
 * Domain geometry validation, nest placement checks and construction of the
 * unpadded and ghost-padded projections.
 * This file is part of the src/spatial subsystem.
 */

#include "domain.hpp"

#include "errors.hpp"
#include "logging.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

namespace nestinit
{

namespace
{

// Absolute tolerance, in parent cells, for a placement to count as integer.
constexpr double placement_tolerance_cells = 1.0e-9;

/**
 * @brief Returns true when `value` is an integer multiple of `spacing`.
 */
bool is_integer_multiple(double value, double spacing)
{
    const double cells = value / spacing;
    return std::abs(cells - std::round(cells)) <= placement_tolerance_cells;
}

std::string describe_cells(double value, double spacing)
{
    std::ostringstream ss;
    ss.precision(12);
    ss << value << " m = " << value / spacing << " parent cells of " << spacing << " m";
    return ss.str();
}

}

Domain::Domain(const DomainConfig& config)
    : name_(config.name),
      xsize_(config.xsize),
      ysize_(config.ysize),
      itot_(config.itot),
      jtot_(config.jtot),
      dx_(0.0),
      dy_(0.0),
      n_ghost_(config.n_ghost),
      n_sponge_(config.n_sponge)
{
    validate_geometry();
    dx_ = xsize_ / itot_;
    dy_ = ysize_ / jtot_;
    build_coordinates();

    if (config.has_anchor)
    {
        build_projections(config.proj_str, config.lon, config.lat, config.anchor, nullptr);
    }
}

Domain::Domain(const DomainConfig& config, const Domain& parent, int parent_id)
    : name_(config.name),
      xsize_(config.xsize),
      ysize_(config.ysize),
      itot_(config.itot),
      jtot_(config.jtot),
      dx_(0.0),
      dy_(0.0),
      n_ghost_(config.n_ghost),
      n_sponge_(config.n_sponge),
      parent_id_(parent_id)
{
    validate_geometry();
    dx_ = xsize_ / itot_;
    dy_ = ysize_ / jtot_;

    if (config.center_in_parent)
    {
        xstart_ = 0.5 * (parent.xsize() - xsize_);
        ystart_ = 0.5 * (parent.ysize() - ysize_);
    }
    else
    {
        xstart_ = config.xstart_in_parent;
        ystart_ = config.ystart_in_parent;
    }

    const std::string prefix = "Domain '" + name_ + "' in parent '" + parent.name() + "': ";

    if (!is_integer_multiple(xsize_, parent.dx()) || !is_integer_multiple(ysize_, parent.dy()))
    {
        throw ConfigError(prefix + "extent is not an integer number of parent cells (x: " +
                          describe_cells(xsize_, parent.dx()) + ", y: " +
                          describe_cells(ysize_, parent.dy()) + ")");
    }
    if (!is_integer_multiple(xstart_, parent.dx()))
    {
        throw ConfigError(prefix + "x placement is not an integer number of parent cells (" +
                          describe_cells(xstart_, parent.dx()) + ")");
    }
    if (!is_integer_multiple(ystart_, parent.dy()))
    {
        throw ConfigError(prefix + "y placement is not an integer number of parent cells (" +
                          describe_cells(ystart_, parent.dy()) + ")");
    }

    const double eps_x = placement_tolerance_cells * parent.dx();
    const double eps_y = placement_tolerance_cells * parent.dy();
    if (xstart_ < -eps_x || ystart_ < -eps_y ||
        xstart_ + xsize_ > parent.xsize() + eps_x ||
        ystart_ + ysize_ > parent.ysize() + eps_y)
    {
        throw ConfigError(prefix + "domain does not fit inside its parent");
    }

    x0_ = parent.x0() + xstart_;
    y0_ = parent.y0() + ystart_;

    build_coordinates();

    if (config.has_anchor)
    {
        build_projections(config.proj_str, config.lon, config.lat, config.anchor, nullptr);
    }
    else if (parent.has_projection())
    {
        // Anchor the child at its centre, located through the parent projection.
        const auto [lon, lat] = parent.proj().to_lonlat(xstart_ + 0.5 * xsize_,
                                                        ystart_ + 0.5 * ysize_);
        build_projections(parent.proj().transform().definition(), lon, lat,
                          Anchor::center, parent.proj().shared_transform());
    }
}

void Domain::validate_geometry() const
{
    const std::string prefix = "Domain '" + name_ + "': ";

    if (!(xsize_ > 0.0) || !(ysize_ > 0.0) || !std::isfinite(xsize_) || !std::isfinite(ysize_))
    {
        throw ConfigError(prefix + "xsize and ysize must be positive");
    }
    if (itot_ <= 0 || jtot_ <= 0)
    {
        throw ConfigError(prefix + "itot and jtot must be positive");
    }
    if (n_ghost_ < 0 || n_sponge_ < 0)
    {
        throw ConfigError(prefix + "n_ghost and n_sponge must be non-negative");
    }
    if (2 * n_sponge_ > itot_ || 2 * n_sponge_ > jtot_)
    {
        throw ConfigError(prefix + "sponge layer is wider than half the domain");
    }
}

void Domain::build_coordinates()
{
    x_.resize(itot_);
    xh_.resize(itot_);
    for (int i = 0; i < itot_; ++i)
    {
        x_[i] = (i + 0.5) * dx_;
        xh_[i] = i * dx_;
    }

    y_.resize(jtot_);
    yh_.resize(jtot_);
    for (int j = 0; j < jtot_; ++j)
    {
        y_[j] = (j + 0.5) * dy_;
        yh_[j] = j * dy_;
    }
}

void Domain::build_projections(const std::string& proj_str, double lon, double lat, Anchor anchor,
                               std::shared_ptr<const MapTransform> transform)
{
    if (!transform)
    {
        if (proj_str.empty())
        {
            throw ConfigError("Domain '" + name_ + "': geographic anchor given without a projection string");
        }
        transform = create_map_transform(proj_str);
    }

    const GridPadding padding{n_ghost_, n_ghost_ + 1, n_ghost_, n_ghost_ + 1};

    proj_.emplace(transform, lon, lat, anchor, xsize_, ysize_, itot_, jtot_);
    proj_pad_.emplace(transform, lon, lat, anchor, xsize_, ysize_, itot_, jtot_, padding);

    if (log_debug_enabled())
    {
        std::cout << "[DOMAIN] " << name_ << ": anchored at (" << lon << ", " << lat << ") "
                  << to_string(anchor) << ", lon [" << proj_->lon_min() << ", " << proj_->lon_max()
                  << "], lat [" << proj_->lat_min() << ", " << proj_->lat_max() << "]" << std::endl;
    }
}

DomainBounds Domain::bounds() const
{
    return DomainBounds{x0_, x0_ + xsize_, y0_, y0_ + ysize_};
}

const Projection& Domain::proj() const
{
    if (!proj_)
    {
        throw ConfigError("Domain '" + name_ + "' has no geographic anchor; projection is unavailable");
    }
    return *proj_;
}

const Projection& Domain::proj_pad() const
{
    if (!proj_pad_)
    {
        throw ConfigError("Domain '" + name_ + "' has no geographic anchor; projection is unavailable");
    }
    return *proj_pad_;
}

int DomainNest::add_domain(const DomainConfig& config, int parent_id)
{
    if (parent_id < 0)
    {
        domains_.emplace_back(config);
    }
    else
    {
        check_handle(parent_id);
        // Construct first, so a throwing placement check leaves the nest intact.
        Domain child(config, domains_[parent_id], parent_id);
        domains_.push_back(std::move(child));
    }

    const int id = static_cast<int>(domains_.size()) - 1;
    if (log_normal_enabled())
    {
        const Domain& d = domains_[id];
        std::cout << "[DOMAIN] " << d.name() << ": " << d.itot() << "x" << d.jtot()
                  << " cells, dx=" << d.dx() << " m, dy=" << d.dy() << " m";
        if (d.has_parent())
        {
            std::cout << ", offset (" << d.xstart_in_parent() << ", " << d.ystart_in_parent()
                      << ") m in '" << domains_[parent_id].name() << "'";
        }
        std::cout << std::endl;
    }
    return id;
}

void DomainNest::set_child(int parent_id, int child_id)
{
    check_handle(parent_id);
    check_handle(child_id);

    Domain& child = domains_[child_id];
    Domain& parent = domains_[parent_id];
    if (child.parent_id_ != parent_id)
    {
        throw ConfigError("Domain '" + child.name() + "' was not built inside '" + parent.name() + "'");
    }
    if (parent.child_id_ >= 0 && parent.child_id_ != child_id)
    {
        std::cerr << "Warning: domain '" << parent.name() << "' child replaced by '"
                  << child.name() << "'" << std::endl;
    }
    parent.child_id_ = child_id;
}

const Domain& DomainNest::domain(int id) const
{
    check_handle(id);
    return domains_[id];
}

int DomainNest::find(const std::string& name) const
{
    for (std::size_t n = 0; n < domains_.size(); ++n)
    {
        if (domains_[n].name() == name)
        {
            return static_cast<int>(n);
        }
    }
    return -1;
}

void DomainNest::check_handle(int id) const
{
    if (id < 0 || id >= size())
    {
        throw ConfigError("Invalid domain handle " + std::to_string(id));
    }
}

} // namespace nestinit
