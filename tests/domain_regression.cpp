#include "domain.hpp"
#include "errors.hpp"

#include <cmath>
#include <functional>
#include <iostream>
#include <string>

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
        std::cerr << "[domain-regression] FAIL: " << message << std::endl;
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

const char* proj_str = "+proj=lcc +lat_1=52.5 +lat_2=51.5 +lat_0=52 +lon_0=4.9 +ellps=WGS84 +units=m";

DomainConfig make_config(const std::string& name, double xsize, double ysize, int itot, int jtot)
{
    DomainConfig config;
    config.name = name;
    config.xsize = xsize;
    config.ysize = ysize;
    config.itot = itot;
    config.jtot = jtot;
    return config;
}

int test_root_geometry()
{
    int failures = 0;

    DomainConfig config = make_config("outer", 3200.0, 1600.0, 32, 16);
    config.n_ghost = 3;
    config.n_sponge = 5;
    const Domain d(config);

    failures += expect_true(nearly_equal(d.dx(), 100.0) && nearly_equal(d.dy(), 100.0), "dx and dy from size/cells");
    failures += expect_true(nearly_equal(d.dxi(), 0.01), "dxi must be 1/dx");
    failures += expect_true(d.istart_pad() == 3 && d.iend_pad() == 35 && d.icells_pad() == 39,
                            "padded x range must be [g, g+itot) in itot+2g+1 cells");
    failures += expect_true(d.jstart_pad() == 3 && d.jend_pad() == 19 && d.jcells_pad() == 23,
                            "padded y range must be [g, g+jtot) in jtot+2g+1 cells");
    failures += expect_true(nearly_equal(d.x()[0], 50.0) && nearly_equal(d.xh()[31], 3100.0),
                            "cell centres and faces of a root domain");
    failures += expect_true(!d.has_projection() && !d.has_parent(), "root without anchor has no projection");

    failures += expect_true(throws_config_error([&] { d.proj(); }),
                            "proj() on an unanchored domain must raise ConfigError");
    failures += expect_true(throws_config_error([&] { d.proj_pad(); }),
                            "proj_pad() on an unanchored domain must raise ConfigError");

    return failures;
}

int test_invalid_geometry()
{
    int failures = 0;

    failures += expect_true(throws_config_error([] { Domain d(make_config("bad", 0.0, 100.0, 10, 10)); }),
                            "zero xsize must be rejected");
    failures += expect_true(throws_config_error([] { Domain d(make_config("bad", 100.0, 100.0, 0, 10)); }),
                            "zero itot must be rejected");
    failures += expect_true(throws_config_error([]
    {
        DomainConfig config = make_config("bad", 800.0, 800.0, 8, 8);
        config.n_sponge = 5;
        Domain d(config);
    }), "sponge wider than half the domain must be rejected");
    failures += expect_true(throws_config_error([]
    {
        DomainConfig config = make_config("bad", 800.0, 800.0, 16, 16);
        config.n_ghost = -1;
        Domain d(config);
    }), "negative ghost count must be rejected");
    failures += expect_true(throws_config_error([]
    {
        DomainConfig config = make_config("bad", 800.0, 800.0, 16, 16);
        config.has_anchor = true;
        config.lon = 4.9;
        config.lat = 52.0;
        Domain d(config);
    }), "anchor without projection string must be rejected");

    return failures;
}

int test_integer_cell_placement()
{
    int failures = 0;

    const Domain parent(make_config("parent", 51200.0, 51200.0, 512, 512));

    DomainConfig child = make_config("child", 6400.0, 6400.0, 128, 128);
    child.xstart_in_parent = 200.0 * parent.dx();
    child.ystart_in_parent = 200.0 * parent.dy();

    bool ok = true;
    try
    {
        const Domain d(child, parent, 0);
        ok = nearly_equal(d.x0(), 20000.0) && nearly_equal(d.y0(), 20000.0);
    }
    catch (const ConfigError& e)
    {
        std::cerr << e.what() << std::endl;
        ok = false;
    }
    failures += expect_true(ok, "placement at 200 parent cells must be accepted");

    child.xstart_in_parent = 200.0000001 * parent.dx();
    failures += expect_true(throws_config_error([&] { Domain d(child, parent, 0); }),
                            "placement at 200.0000001 parent cells must be rejected");

    child.xstart_in_parent = 200.0 * parent.dx();
    child.xsize = 6400.00001;
    failures += expect_true(throws_config_error([&] { Domain d(child, parent, 0); }),
                            "extent that is not a whole number of parent cells must be rejected");

    child.xsize = 6400.0;
    child.xstart_in_parent = 48000.0;
    failures += expect_true(throws_config_error([&] { Domain d(child, parent, 0); }),
                            "child sticking out of its parent must be rejected");

    return failures;
}

int test_three_domain_nest()
{
    int failures = 0;

    DomainNest nest;

    DomainConfig outer = make_config("outer", 3200.0, 3200.0, 32, 32);
    outer.has_anchor = true;
    outer.lon = 4.9;
    outer.lat = 52.0;
    outer.proj_str = proj_str;
    const int id_outer = nest.add_domain(outer);

    DomainConfig middle = make_config("middle", 1600.0, 1600.0, 32, 32);
    middle.center_in_parent = true;
    const int id_middle = nest.add_domain(middle, id_outer);
    nest.set_child(id_outer, id_middle);

    DomainConfig inner = make_config("inner", 800.0, 800.0, 32, 32);
    inner.xstart_in_parent = 200.0;
    inner.ystart_in_parent = 200.0;
    const int id_inner = nest.add_domain(inner, id_middle);
    nest.set_child(id_middle, id_inner);

    failures += expect_true(nest.size() == 3, "nest must hold three domains");
    failures += expect_true(nest.find("middle") == id_middle && nest.find("none") == -1, "find by name");
    failures += expect_true(nest[id_outer].child_id() == id_middle && nest[id_middle].parent_id() == id_outer,
                            "parent and child handles must be linked");
    failures += expect_true(nest[id_inner].parent_id() == id_middle && !nest[id_inner].has_child(),
                            "innermost domain has no child");

    const DomainBounds b_outer = nest[id_outer].bounds();
    const DomainBounds b_middle = nest[id_middle].bounds();
    const DomainBounds b_inner = nest[id_inner].bounds();

    failures += expect_true(nearly_equal(b_middle.xmin, 800.0) && nearly_equal(b_middle.xmax, 2400.0),
                            "centred middle domain spans [800, 2400] m");
    failures += expect_true(nearly_equal(b_inner.xmin, 1000.0) && nearly_equal(b_inner.ymax, 1800.0),
                            "inner domain offset is relative to its parent");
    failures += expect_true(b_outer.contains(b_middle) && b_middle.contains(b_inner) && b_outer.contains(b_inner),
                            "bounding boxes must nest");

    // Children inherit the transform and are anchored through the parent.
    failures += expect_true(nest[id_middle].has_projection() && nest[id_inner].has_projection(),
                            "children of an anchored root must have projections");
    const auto [lon_c, lat_c] = nest[id_outer].proj().to_lonlat(1600.0, 1600.0);
    const auto [x_c, y_c] = nest[id_middle].proj().to_xy(lon_c, lat_c);
    failures += expect_true(nearly_equal(x_c, 800.0, 1.0e-4) && nearly_equal(y_c, 800.0, 1.0e-4),
                            "outer centre must be the centre of the centred middle domain");
    failures += expect_true(nest[id_inner].proj_pad().lon_min() > nest[id_outer].proj_pad().lon_min() &&
                            nest[id_inner].proj_pad().lon_max() < nest[id_outer].proj_pad().lon_max(),
                            "inner geographic extent must lie inside the outer one");

    failures += expect_true(throws_config_error([&] { nest.set_child(id_outer, id_inner); }),
                            "linking a domain to a parent it was not built in must fail");
    failures += expect_true(throws_config_error([&] { nest.domain(7); }), "invalid handle must fail");

    return failures;
}
}

int main()
{
    int failures = 0;
    failures += test_root_geometry();
    failures += test_invalid_geometry();
    failures += test_integer_cell_placement();
    failures += test_three_domain_nest();

    if (failures > 0)
    {
        std::cerr << "[domain-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[domain-regression] all checks passed" << std::endl;
    return 0;
}
