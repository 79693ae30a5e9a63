#include "errors.hpp"
#include "input_files.hpp"
#include "vertical_grid.hpp"

#include <cmath>
#include <functional>
#include <iostream>
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
        std::cerr << "[vertical-grid-regression] FAIL: " << message << std::endl;
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

// Stretched grid: 20 m near the surface, growing by 5 % per level.
std::vector<double> stretched_levels(int ktot, double& zsize)
{
    std::vector<double> z(ktot);
    double dz = 20.0;
    double zh = 0.0;
    for (int k = 0; k < ktot; ++k)
    {
        z[k] = zh + 0.5 * dz;
        zh += dz;
        dz *= 1.05;
    }
    zsize = zh;
    return z;
}

int test_grid_invariants()
{
    int failures = 0;

    double zsize = 0.0;
    const std::vector<double> z = stretched_levels(64, zsize);
    const VerticalGrid<double> grid(z, zsize);

    failures += expect_true(grid.ktot() == 64 && grid.kstart() == 0 && grid.kend() == 64,
                            "grid without ghost levels starts at 0");
    failures += expect_true(grid.zh().size() == 65 && grid.dz().size() == 64, "array sizes");
    failures += expect_true(nearly_equal(grid.zh()[0], 0.0) && nearly_equal(grid.zh()[64], zsize),
                            "half levels span [0, zsize]");

    double sum_dz = 0.0;
    bool staggered = true;
    bool positive = true;
    for (int k = 0; k < grid.ktot(); ++k)
    {
        staggered = staggered && grid.zh()[k] < grid.z()[k] && grid.z()[k] < grid.zh()[k+1];
        positive = positive && grid.dz()[k] > 0.0 && nearly_equal(grid.dzi()[k] * grid.dz()[k], 1.0);
        sum_dz += grid.dz()[k];
    }
    failures += expect_true(staggered, "every full level lies between its half levels");
    failures += expect_true(positive, "dz positive and dzi its inverse");
    failures += expect_true(nearly_equal(sum_dz, zsize, 1.0e-8), "sum of dz equals zsize");

    failures += expect_true(nearly_equal(grid.dzh()[0], 2.0 * z[0]), "first dzh spans the mirrored level");
    failures += expect_true(nearly_equal(grid.dzh()[10], z[10] - z[9]), "interior dzh is the full-level spacing");
    failures += expect_true(nearly_equal(grid.dzh()[64], 2.0 * (zsize - z[63])), "top dzh spans the mirrored level");

    return failures;
}

int test_ghost_levels()
{
    int failures = 0;

    const std::vector<double> z = equidistant_levels<double>(32, 3200.0);
    const VerticalGrid<double> grid(z, 3200.0, true);

    failures += expect_true(grid.has_ghost_levels() && grid.kstart() == 1 && grid.kend() == 33,
                            "ghost levels shift the physical range by one");
    failures += expect_true(grid.z().size() == 34 && grid.zh().size() == 35, "ghost arrays sizes");
    failures += expect_true(nearly_equal(grid.z()[0], -50.0) && nearly_equal(grid.z()[33], 3250.0),
                            "ghost full levels mirror the first and last level");
    failures += expect_true(nearly_equal(grid.zh()[1], 0.0) && nearly_equal(grid.zh()[33], 3200.0),
                            "surface and top half levels");
    failures += expect_true(nearly_equal(grid.zh()[0], -100.0) && nearly_equal(grid.zh()[34], 3300.0),
                            "ghost half levels mirror about the surface and the top");

    const VerticalGrid<double> stripped = grid.without_ghost_levels();
    failures += expect_true(!stripped.has_ghost_levels() && stripped.ktot() == 32 &&
                            nearly_equal(stripped.z()[0], 50.0),
                            "stripping ghost levels restores the physical grid");
    failures += expect_true(grid.z_physical() == z, "z_physical returns the input levels");

    const VerticalGrid<float> single(equidistant_levels<float>(10, 1000.0f), 1000.0f);
    failures += expect_true(std::abs(single.zh()[5] - 500.0f) < 1.0e-3f, "single precision grid");

    return failures;
}

int test_invalid_grids()
{
    int failures = 0;

    failures += expect_true(throws_config_error([] { VerticalGrid<double> g({}, 100.0); }),
                            "empty grid must be rejected");
    failures += expect_true(throws_config_error([] { VerticalGrid<double> g({10.0, 30.0}, 0.0); }),
                            "non-positive zsize must be rejected");
    failures += expect_true(throws_config_error([] { VerticalGrid<double> g({0.0, 30.0}, 100.0); }),
                            "level at the surface must be rejected");
    failures += expect_true(throws_config_error([] { VerticalGrid<double> g({10.0, 30.0, 30.0}, 100.0); }),
                            "repeated level must be rejected");
    failures += expect_true(throws_config_error([] { VerticalGrid<double> g({10.0, 50.0, 30.0}, 100.0); }),
                            "decreasing levels must be rejected");
    failures += expect_true(throws_config_error([] { VerticalGrid<double> g({10.0, 30.0, 100.0}, 100.0); }),
                            "level at zsize must be rejected");
    failures += expect_true(throws_config_error([] { equidistant_levels<double>(0, 100.0); }),
                            "equidistant grid without levels must be rejected");

    return failures;
}
}

int main()
{
    int failures = 0;
    failures += test_grid_invariants();
    failures += test_ghost_levels();
    failures += test_invalid_grids();

    if (failures > 0)
    {
        std::cerr << "[vertical-grid-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[vertical-grid-regression] all checks passed" << std::endl;
    return 0;
}
