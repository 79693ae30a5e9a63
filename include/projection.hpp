#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * @file projection.hpp
 * @brief Geographic <-> local Cartesian transforms for one LES grid.
 *
 * A `MapTransform` is parsed from a PROJ-style parameter string and maps
 * geographic degrees to projected metres. A `Projection` places the origin
 * of the LES grid relative to an anchor point and precomputes the lon/lat
 * of every scalar, u and v point. Both are immutable after construction.
 */

namespace nestinit
{

/**
 * @brief Parametrized cartographic transform (degrees <-> metres).
 */
class MapTransform
{
public:
    virtual ~MapTransform() = default;

    /**
     * @brief Forward transform.
     * @param lon Longitude in degrees.
     * @param lat Latitude in degrees.
     * @return Projected (x, y) in metres.
     */
    virtual std::pair<double, double> forward(double lon, double lat) const = 0;

    /**
     * @brief Inverse transform.
     * @param x Projected easting in metres.
     * @param y Projected northing in metres.
     * @return (lon, lat) in degrees.
     */
    virtual std::pair<double, double> inverse(double x, double y) const = 0;

    /**
     * @brief Returns the parameter string the transform was built from.
     */
    virtual const std::string& definition() const = 0;
};

/**
 * @brief Creates a transform from a parameter string.
 *
 * Supported: `+proj=lcc` (Lambert conformal conic, one or two standard
 * parallels) and `+proj=merc` (Mercator), on `+ellps=WGS84|GRS80|sphere`
 * or explicit `+a/+b/+R`. Throws `ConfigError` for anything else.
 */
std::shared_ptr<const MapTransform> create_map_transform(const std::string& definition);

enum class Anchor
{
    center,
    southwest,
    southeast,
    northwest,
    northeast
};

/**
 * @brief Parses an anchor name (`center`, `southwest`, `sw`, ...).
 */
Anchor parse_anchor(const std::string& value);

const char* to_string(Anchor anchor);

/**
 * @brief Number of extra cells on each side of a projected grid.
 */
struct GridPadding
{
    int west = 0;
    int east = 0;
    int south = 0;
    int north = 0;
};

class Projection
{
public:
    /**
     * @brief Builds the projection and precomputes coordinate arrays.
     * @param transform Shared immutable map transform.
     * @param lon Anchor longitude in degrees.
     * @param lat Anchor latitude in degrees.
     * @param anchor Which point of the (unpadded) domain the anchor is.
     * @param xsize Unpadded domain size in x (m).
     * @param ysize Unpadded domain size in y (m).
     * @param itot Unpadded number of cells in x.
     * @param jtot Unpadded number of cells in y.
     * @param padding Extra cells outside the unpadded domain.
     */
    Projection(std::shared_ptr<const MapTransform> transform,
               double lon, double lat, Anchor anchor,
               double xsize, double ysize, int itot, int jtot,
               GridPadding padding = GridPadding{});

    /**
     * @brief Geographic to local grid coordinates (m).
     */
    std::pair<double, double> to_xy(double lon, double lat) const;

    /**
     * @brief Local grid coordinates (m) to geographic.
     */
    std::pair<double, double> to_lonlat(double x, double y) const;

    /**
     * @brief Cell counts including padding.
     */
    int itot() const { return icells_; }
    int jtot() const { return jcells_; }

    double dx() const { return dx_; }
    double dy() const { return dy_; }

    /**
     * @brief Size covered by the (possibly padded) arrays.
     */
    double xsize() const { return dx_ * icells_; }
    double ysize() const { return dy_ * jcells_; }

    const GridPadding& padding() const { return padding_; }

    /** Cell centre and face positions along each axis (local metres). */
    const std::vector<double>& x() const { return x_; }
    const std::vector<double>& xh() const { return xh_; }
    const std::vector<double>& y() const { return y_; }
    const std::vector<double>& yh() const { return yh_; }

    /** 2D arrays, index `j*itot()+i`. */
    const std::vector<double>& lon() const { return lon_; }
    const std::vector<double>& lat() const { return lat_; }
    const std::vector<double>& lon_u() const { return lon_u_; }
    const std::vector<double>& lat_u() const { return lat_u_; }
    const std::vector<double>& lon_v() const { return lon_v_; }
    const std::vector<double>& lat_v() const { return lat_v_; }

    /**
     * @brief Closed polygon along the outer cell edges (counter-clockwise).
     */
    const std::vector<double>& bbox_lon() const { return bbox_lon_; }
    const std::vector<double>& bbox_lat() const { return bbox_lat_; }

    /**
     * @brief Geographic extremes of the bounding polygon.
     */
    double lon_min() const;
    double lon_max() const;
    double lat_min() const;
    double lat_max() const;

    const MapTransform& transform() const { return *transform_; }
    std::shared_ptr<const MapTransform> shared_transform() const { return transform_; }

    double anchor_lon() const { return anchor_lon_; }
    double anchor_lat() const { return anchor_lat_; }
    Anchor anchor() const { return anchor_; }

private:
    void fill_lonlat(const std::vector<double>& xs,
                     const std::vector<double>& ys,
                     std::vector<double>& lon_out,
                     std::vector<double>& lat_out) const;

    void build_bounding_polygon();

    std::shared_ptr<const MapTransform> transform_;
    double anchor_lon_;
    double anchor_lat_;
    Anchor anchor_;

    double dx_;
    double dy_;
    int icells_;
    int jcells_;
    GridPadding padding_;

    // Projected coordinate of the local origin.
    double x_offset_;
    double y_offset_;

    std::vector<double> x_;
    std::vector<double> xh_;
    std::vector<double> y_;
    std::vector<double> yh_;

    std::vector<double> lon_;
    std::vector<double> lat_;
    std::vector<double> lon_u_;
    std::vector<double> lat_u_;
    std::vector<double> lon_v_;
    std::vector<double> lat_v_;

    std::vector<double> bbox_lon_;
    std::vector<double> bbox_lat_;
};

} // namespace nestinit
