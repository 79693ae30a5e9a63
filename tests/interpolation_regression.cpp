#include "errors.hpp"
#include "field3d.hpp"
#include "input_files.hpp"
#include "interpolation.hpp"
#include "source_data.hpp"
#include "spatial_filter.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

using namespace nestinit;

namespace
{
bool nearly_equal(double a, double b, double tol = 1.0e-9)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[interpolation-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
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

double linear_field(double lon, double lat, double z)
{
    return 280.0 + 0.5 * lon - 0.8 * lat + 0.004 * z;
}

/**
 * @brief Rectilinear source with latitudes stored north to south.
 */
SourceData make_source(int nlev = 6)
{
    SourceData s;
    s.ntime = 1;
    s.nlev = nlev;
    s.nlat = 5;
    s.nlon = 6;
    s.time = {0.0};

    for (int j = 0; j < s.nlat; ++j)
        for (int i = 0; i < s.nlon; ++i)
        {
            s.lon.push_back(2.0 + 0.25 * i);
            s.lat.push_back(53.0 - 0.25 * j);
        }

    std::vector<double> field;
    for (int k = 0; k < s.nlev; ++k)
        for (int j = 0; j < s.nlat; ++j)
            for (int i = 0; i < s.nlon; ++i)
            {
                const double lon = s.lon[j * s.nlon + i];
                const double lat = s.lat[j * s.nlon + i];
                const double z = 10.0 + 400.0 * k + 5.0 * i;
                s.zcoord.push_back(z);
                field.push_back(linear_field(lon, lat, z));
            }
    s.fields["thl"] = field;
    return s;
}

int test_axes_and_weights()
{
    int failures = 0;

    SourceData source = make_source();
    const RectilinearAxes axes = extract_rectilinear_axes(source);
    failures += expect_true(axes.lon.size() == 6 && axes.lat.size() == 5, "axis lengths");
    failures += expect_true(nearly_equal(axes.lat.front(), 53.0) && nearly_equal(axes.lat.back(), 52.0),
                            "descending latitude axis is kept in source order");

    const HorizontalWeights w = compute_horizontal_weights(axes, {2.3, 3.25}, {52.9, 52.0});
    failures += expect_true(w.il[0] == 1 && nearly_equal(w.fx[0], 0.2), "longitude cell and weight");
    failures += expect_true(w.jl[0] == 0 && nearly_equal(w.fy[0], 0.4), "latitude cell and weight on a descending axis");
    failures += expect_true(w.il[1] == 4 && nearly_equal(w.fx[1], 1.0), "point on the last longitude");

    // Masked corners, as in a cut-out of a larger grid.
    source.lon[0] = std::numeric_limits<double>::quiet_NaN();
    source.lat[source.nlon - 1] = std::numeric_limits<double>::quiet_NaN();
    const RectilinearAxes masked = extract_rectilinear_axes(source);
    failures += expect_true(nearly_equal(masked.lon[0], 2.0) && nearly_equal(masked.lat[0], 53.0),
                            "NaN-masked coordinates are skipped");

    return failures;
}

int test_invalid_source_grids()
{
    int failures = 0;

    failures += expect_true(throws_data_error([]
    {
        SourceData s = make_source();
        s.lon[2 * s.nlon + 3] += 0.01;
        extract_rectilinear_axes(s);
    }), "curvilinear longitudes must be rejected");

    failures += expect_true(throws_data_error([]
    {
        SourceData s = make_source();
        for (int j = 0; j < s.nlat; ++j)
            s.lat[j * s.nlon + 2] = std::numeric_limits<double>::quiet_NaN();
        for (int j = 0; j < s.nlat; ++j)
            s.lon[j * s.nlon + 2] = std::numeric_limits<double>::quiet_NaN();
        extract_rectilinear_axes(s);
    }), "fully masked column must be rejected");

    failures += expect_true(throws_data_error([]
    {
        SourceData s = make_source();
        for (int j = 0; j < s.nlat; ++j)
            s.lon[j * s.nlon + 3] = 2.5;
        extract_rectilinear_axes(s);
    }), "non-monotonic longitude axis must be rejected");

    failures += expect_true(throws_data_error([]
    {
        const RectilinearAxes axes = extract_rectilinear_axes(make_source());
        compute_horizontal_weights(axes, {1.9}, {52.5});
    }), "target west of the source grid must be rejected");

    return failures;
}

int test_longitude_wrap()
{
    int failures = 0;

    RectilinearAxes axes;
    axes.lon = {350.0, 355.0, 360.0, 365.0};
    axes.lat = {10.0, 11.0};
    const HorizontalWeights w = compute_horizontal_weights(axes, {2.5, -7.5}, {10.5, 10.5});
    failures += expect_true(w.il[0] == 2 && nearly_equal(w.fx[0], 0.5), "target east of 0 found on an axis past 360");
    failures += expect_true(w.il[1] == 0 && nearly_equal(w.fx[1], 0.5), "negative longitude wraps to 352.5");

    return failures;
}

int test_linear_field_is_reproduced()
{
    int failures = 0;

    const SourceData source = make_source();
    const RectilinearAxes axes = extract_rectilinear_axes(source);

    std::vector<double> lon_t;
    std::vector<double> lat_t;
    for (int j = 0; j < 3; ++j)
        for (int i = 0; i < 4; ++i)
        {
            lon_t.push_back(2.1 + 0.3 * i + 0.01 * j);
            lat_t.push_back(52.2 + 0.2 * j);
        }
    const HorizontalWeights weights = compute_horizontal_weights(axes, lon_t, lat_t);

    const std::vector<double> z_target = {200.0, 650.0, 1500.0, 1990.0};
    Field3D<double> out(4, 3, 4);
    interpolate_to_grid(out, source.field_at("thl", 0), source.zcoord_at(0),
                        source.nlev, source.nlat, source.nlon, weights, z_target);

    double max_error = 0.0;
    for (int k = 0; k < 4; ++k)
        for (int j = 0; j < 3; ++j)
            for (int i = 0; i < 4; ++i)
            {
                const std::size_t p = j * 4 + i;
                max_error = std::max(max_error,
                                     std::abs(out(k, j, i) - linear_field(lon_t[p], lat_t[p], z_target[k])));
            }
    failures += expect_true(max_error < 1.0e-9, "bilinear and vertical interpolation reproduce a linear field");

    // Above the source top the value is clamped to the top level.
    Field3D<float> above(1, 3, 4);
    interpolate_to_grid(above, source.field_at("thl", 0), source.zcoord_at(0),
                        source.nlev, source.nlat, source.nlon, weights, {50000.0});
    const double top_z = 10.0 + 400.0 * 5 + 5.0 * (lon_t[0] - 2.0) / 0.25;
    failures += expect_true(std::abs(above(0, 0, 0) - linear_field(lon_t[0], lat_t[0], top_z)) < 1.0e-3,
                            "targets above the source are clamped to the top value");

    failures += expect_true(throws_data_error([&]
    {
        Field3D<double> wrong(4, 2, 4);
        interpolate_to_grid(wrong, source.field_at("thl", 0), source.zcoord_at(0),
                            source.nlev, source.nlat, source.nlon, weights, z_target);
    }), "target field must match the weights");

    return failures;
}

int test_pressure_coordinate()
{
    int failures = 0;

    const double p[] = {100000.0, 90000.0, 80000.0, 70000.0};
    const double t[] = {290.0, 284.0, 277.0, 270.0};
    failures += expect_true(nearly_equal(interpolate_linear_clamped(p, t, 4, 85000.0), 280.5),
                            "decreasing pressure axis");
    failures += expect_true(nearly_equal(interpolate_linear_clamped(p, t, 4, 101300.0), 290.0),
                            "below the lowest pressure level the value is clamped");
    failures += expect_true(nearly_equal(interpolate_linear_clamped(p, t, 4, 50000.0), 270.0),
                            "above the highest pressure level the value is clamped");
    failures += expect_true(nearly_equal(interpolate_linear_clamped(p, t, 1, 50000.0), 290.0),
                            "single level column");
    return failures;
}

int test_non_monotonic_columns()
{
    int failures = 0;

    const SourceData source = make_source();
    const RectilinearAxes axes = extract_rectilinear_axes(source);
    const HorizontalWeights weights = compute_horizontal_weights(axes, {2.6}, {52.5});
    const std::size_t plane = source.plane_size();

    // Levels 2 and 3 swapped in one column.
    SourceData swapped = make_source();
    std::swap(swapped.zcoord[2 * plane + 7], swapped.zcoord[3 * plane + 7]);

    failures += expect_true(throws_data_error([&]
    {
        Field3D<double> out(2, 1, 1);
        interpolate_to_grid(out, swapped.field_at("thl", 0), swapped.zcoord_at(0),
                            swapped.nlev, swapped.nlat, swapped.nlon, weights, {500.0, 1000.0});
    }), "a column with swapped levels must be rejected by the interpolation");

    bool names_column = false;
    try
    {
        swapped.validate();
    }
    catch (const DataError& e)
    {
        const std::string message = e.what();
        names_column = message.find("time index 0") != std::string::npos &&
                       message.find("lat 1, lon 1") != std::string::npos &&
                       message.find("level 3") != std::string::npos;
    }
    failures += expect_true(names_column, "validation names the time, column and level of the swap");

    failures += expect_true(throws_data_error([&]
    {
        SourceData repeated = make_source();
        repeated.zcoord[4 * plane + 3] = repeated.zcoord[3 * plane + 3];
        repeated.validate();
    }), "a repeated level must be rejected");

    failures += expect_true(throws_data_error([&]
    {
        SourceData nan_level = make_source();
        nan_level.zcoord[plane + 12] = std::numeric_limits<double>::quiet_NaN();
        nan_level.validate();
    }), "a NaN vertical coordinate must be rejected");

    failures += expect_true(throws_data_error([&]
    {
        SourceData flipped = make_source();
        for (int k = 0; k < flipped.nlev; ++k)
            flipped.zcoord[k * plane + 5] = 3000.0 - 400.0 * k;
        flipped.validate();
    }), "a column running the other way than the rest must be rejected");

    failures += expect_true(!throws_data_error([&] { make_source().validate(); }),
                            "a consistent source passes validation");

    failures += expect_true(throws_data_error([]
    {
        interpolate_profile<double>({0.0, 200.0, 100.0, 300.0}, {0.0, 2.0, 1.0, 3.0}, {150.0});
    }), "a profile with unsorted heights must be rejected");

    const std::vector<double> descending =
        interpolate_profile<double>({300.0, 200.0, 100.0, 0.0}, {3.0, 2.0, 1.0, 0.0}, {150.0});
    failures += expect_true(nearly_equal(descending[0], 1.5), "a strictly decreasing profile is accepted");

    return failures;
}

int test_gaussian_filter()
{
    int failures = 0;

    failures += expect_true(filter_width_in_cells(250.0, 100.0) == 3 && filter_width_in_cells(0.0, 100.0) == 0,
                            "filter width rounds up to whole cells");

    const std::vector<double> kernel = gaussian_kernel(2);
    const double ksum = std::accumulate(kernel.begin(), kernel.end(), 0.0);
    failures += expect_true(kernel.size() == 17 && nearly_equal(ksum, 1.0, 1.0e-14),
                            "kernel truncated at 4 sigma and normalized");
    failures += expect_true(nearly_equal(kernel[0], kernel[16], 0.0) && kernel[8] == *std::max_element(kernel.begin(), kernel.end()),
                            "kernel is symmetric and peaks in the centre");

    Field3D<double> constant(3, 12, 9, 4.25);
    gaussian_filter(constant, 3);
    bool preserved = true;
    for (const double v : constant.values())
        preserved = preserved && nearly_equal(v, 4.25, 1.0e-12);
    failures += expect_true(preserved, "a constant field is unchanged, also at the reflected edges");

    Field3D<double> spike(1, 41, 41);
    spike(0, 20, 20) = 1.0;
    gaussian_filter(spike, 2);
    const double total = std::accumulate(spike.values().begin(), spike.values().end(), 0.0);
    failures += expect_true(nearly_equal(total, 1.0, 1.0e-12), "filtering away from the edges conserves the sum");
    failures += expect_true(spike(0, 20, 20) < 0.1 && spike(0, 20, 20) > spike(0, 20, 22),
                            "the spike is spread out and still peaks in the centre");
    failures += expect_true(nearly_equal(spike(0, 18, 20), spike(0, 20, 22), 1.0e-15),
                            "equal spacing gives an isotropic result");

    Field3D<float> untouched(2, 5, 5, 1.0f);
    untouched(1, 2, 2) = 7.0f;
    gaussian_filter(untouched, 0);
    failures += expect_true(untouched(1, 2, 2) == 7.0f, "zero width is a no-op");

    return failures;
}
}

int main()
{
    int failures = 0;
    failures += test_axes_and_weights();
    failures += test_invalid_source_grids();
    failures += test_longitude_wrap();
    failures += test_linear_field_is_reproduced();
    failures += test_pressure_coordinate();
    failures += test_non_monotonic_columns();
    failures += test_gaussian_filter();

    if (failures > 0)
    {
        std::cerr << "[interpolation-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[interpolation-regression] all checks passed" << std::endl;
    return 0;
}
