/**
 * @file projection.cpp
 * @brief Implementation for the spatial module.
 *
 * Transform factory, anchor parsing and the precomputed Projection grid.
 * This file is part of the src/spatial subsystem.
 */

#include "projection.hpp"

#include "errors.hpp"
#include "string_utils.hpp"
#include "transforms/lambert_conformal.hpp"
#include "transforms/mercator.hpp"
#include "transforms/proj_params.hpp"

#include <algorithm>
#include <cmath>

namespace nestinit
{

std::shared_ptr<const MapTransform> create_map_transform(const std::string& definition)
{
    const proj::ParamList params(definition);
    const std::string name = strutil::lower_copy(params.get_string("proj"));

    if (name == "lcc")
    {
        return std::make_shared<LambertConformalTransform>(params);
    }
    else if (name == "merc")
    {
        return std::make_shared<MercatorTransform>(params);
    }

    throw ConfigError("Unknown projection: +proj=" + name +
                      ". Available projections: 'lcc', 'merc'");
}

Anchor parse_anchor(const std::string& value)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));

    if (normalized == "center" || normalized == "centre" || normalized == "c")
        return Anchor::center;
    if (normalized == "southwest" || normalized == "sw")
        return Anchor::southwest;
    if (normalized == "southeast" || normalized == "se")
        return Anchor::southeast;
    if (normalized == "northwest" || normalized == "nw")
        return Anchor::northwest;
    if (normalized == "northeast" || normalized == "ne")
        return Anchor::northeast;

    throw ConfigError("Unknown anchor '" + value +
                      "'. Valid values: center, southwest, southeast, northwest, northeast");
}

const char* to_string(Anchor anchor)
{
    switch (anchor)
    {
        case Anchor::southwest:
            return "southwest";
        case Anchor::southeast:
            return "southeast";
        case Anchor::northwest:
            return "northwest";
        case Anchor::northeast:
            return "northeast";
        case Anchor::center:
        default:
            return "center";
    }
}

Projection::Projection(std::shared_ptr<const MapTransform> transform,
                       double lon, double lat, Anchor anchor,
                       double xsize, double ysize, int itot, int jtot,
                       GridPadding padding)
    : transform_(std::move(transform)),
      anchor_lon_(lon),
      anchor_lat_(lat),
      anchor_(anchor),
      padding_(padding)
{
    if (!transform_)
    {
        throw ConfigError("Projection requires a map transform");
    }
    if (xsize <= 0.0 || ysize <= 0.0 || itot <= 0 || jtot <= 0)
    {
        throw ConfigError("Projection requires positive domain size and cell counts");
    }
    if (padding.west < 0 || padding.east < 0 || padding.south < 0 || padding.north < 0)
    {
        throw ConfigError("Projection padding must be non-negative");
    }

    dx_ = xsize / itot;
    dy_ = ysize / jtot;
    icells_ = itot + padding.west + padding.east;
    jcells_ = jtot + padding.south + padding.north;

    // Local coordinate of the anchor point within the unpadded domain.
    double x_anchor = 0.0;
    double y_anchor = 0.0;
    switch (anchor_)
    {
        case Anchor::center:
            x_anchor = 0.5 * xsize;
            y_anchor = 0.5 * ysize;
            break;
        case Anchor::southwest:
            break;
        case Anchor::southeast:
            x_anchor = xsize;
            break;
        case Anchor::northwest:
            y_anchor = ysize;
            break;
        case Anchor::northeast:
            x_anchor = xsize;
            y_anchor = ysize;
            break;
    }

    const auto [xp, yp] = transform_->forward(lon, lat);
    x_offset_ = xp - x_anchor;
    y_offset_ = yp - y_anchor;

    x_.resize(icells_);
    xh_.resize(icells_);
    for (int i = 0; i < icells_; ++i)
    {
        x_[i] = (i - padding_.west + 0.5) * dx_;
        xh_[i] = (i - padding_.west) * dx_;
    }

    y_.resize(jcells_);
    yh_.resize(jcells_);
    for (int j = 0; j < jcells_; ++j)
    {
        y_[j] = (j - padding_.south + 0.5) * dy_;
        yh_[j] = (j - padding_.south) * dy_;
    }

    fill_lonlat(x_, y_, lon_, lat_);
    fill_lonlat(xh_, y_, lon_u_, lat_u_);
    fill_lonlat(x_, yh_, lon_v_, lat_v_);

    build_bounding_polygon();
}

std::pair<double, double> Projection::to_xy(double lon, double lat) const
{
    const auto [xp, yp] = transform_->forward(lon, lat);
    return {xp - x_offset_, yp - y_offset_};
}

std::pair<double, double> Projection::to_lonlat(double x, double y) const
{
    return transform_->inverse(x + x_offset_, y + y_offset_);
}

void Projection::fill_lonlat(const std::vector<double>& xs,
                             const std::vector<double>& ys,
                             std::vector<double>& lon_out,
                             std::vector<double>& lat_out) const
{
    const std::size_t nx = xs.size();
    const std::size_t ny = ys.size();
    lon_out.resize(nx * ny);
    lat_out.resize(nx * ny);

    for (std::size_t j = 0; j < ny; ++j)
    {
        for (std::size_t i = 0; i < nx; ++i)
        {
            const auto [lon, lat] = to_lonlat(xs[i], ys[j]);
            lon_out[j * nx + i] = lon;
            lat_out[j * nx + i] = lat;
        }
    }
}

void Projection::build_bounding_polygon()
{
    const double x0 = -padding_.west * dx_;
    const double y0 = -padding_.south * dy_;
    const double x1 = x0 + xsize();
    const double y1 = y0 + ysize();

    bbox_lon_.clear();
    bbox_lat_.clear();

    auto add = [&](double x, double y)
    {
        const auto [lon, lat] = to_lonlat(x, y);
        bbox_lon_.push_back(lon);
        bbox_lat_.push_back(lat);
    };

    // Edges are traced cell by cell, projected edges are curved.
    for (int i = 0; i < icells_; ++i) add(x0 + i * dx_, y0);
    for (int j = 0; j < jcells_; ++j) add(x1, y0 + j * dy_);
    for (int i = icells_; i > 0; --i) add(x0 + i * dx_, y1);
    for (int j = jcells_; j >= 0; --j) add(x0, y0 + j * dy_);
}

double Projection::lon_min() const
{
    return *std::min_element(bbox_lon_.begin(), bbox_lon_.end());
}

double Projection::lon_max() const
{
    return *std::max_element(bbox_lon_.begin(), bbox_lon_.end());
}

double Projection::lat_min() const
{
    return *std::min_element(bbox_lat_.begin(), bbox_lat_.end());
}

double Projection::lat_max() const
{
    return *std::max_element(bbox_lat_.begin(), bbox_lat_.end());
}

} // namespace nestinit
