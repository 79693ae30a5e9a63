#include "divergence.hpp"
#include "errors.hpp"
#include "field3d.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace nestinit;

namespace
{
int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[divergence-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

constexpr double pi = 3.14159265358979323846;

/**
 * @brief Padded momentum on `ktot` equidistant 50 m levels.
 */
template<typename TF>
struct SyntheticCase
{
    int ktot = 12;
    int ncx = 38;   // itot = 32 plus 2 x 3 ghost cells
    int ncy = 30;   // jtot = 24 plus 2 x 3 ghost cells
    double dx = 100.0;
    double dy = 125.0;

    std::vector<TF> z;
    std::vector<TF> zh;
    std::vector<TF> dz;
    std::vector<TF> rho;
    std::vector<TF> rhoh;

    Field3D<TF> u;
    Field3D<TF> v;
    Field3D<TF> w;

    SyntheticCase()
    {
        for (int k = 0; k < ktot; ++k)
        {
            z.push_back(TF(25 + 50*k));
            dz.push_back(TF(50));
            rho.push_back(TF(1.2 * std::exp(-(25.0 + 50.0*k) / 8000.0)));
        }
        for (int k = 0; k <= ktot; ++k)
        {
            zh.push_back(TF(50*k));
            rhoh.push_back(TF(1.2 * std::exp(-50.0*k / 8000.0)));
        }

        u.resize(ktot, ncy + 1, ncx + 1);
        v.resize(ktot, ncy + 1, ncx + 1);
        w.resize(ktot + 1, ncy + 1, ncx + 1);

        const double lx = ncx * dx;
        const double ly = ncy * dy;
        for (int k = 0; k < ktot; ++k)
            for (int j = 0; j <= ncy; ++j)
                for (int i = 0; i <= ncx; ++i)
                {
                    const double x = i * dx;
                    const double y = j * dy;
                    const double noise = std::sin(12.9898*i + 78.233*j + 37.719*k);
                    u(k, j, i) = TF(8.0 + 0.1*k + 2.0*std::sin(2*pi*x/lx)*std::cos(2*pi*y/ly) + 0.5*noise);
                    v(k, j, i) = TF(-3.0 + 1.5*std::cos(2*pi*x/lx + 0.3*k) + 0.4*std::cos(3.1*noise));
                }

        for (int k = 1; k <= ktot; ++k)
            for (int j = 0; j <= ncy; ++j)
                for (int i = 0; i <= ncx; ++i)
                    w(k, j, i) = TF(0.05*std::sin(0.7*i + 1.3*j + 0.5*k));
    }

    GridRegion region() const { return GridRegion{0, ncx, 0, ncy}; }
};

int test_correction_removes_divergence()
{
    int failures = 0;

    SyntheticCase<double> c;
    const GridRegion region = c.region();

    const DivergenceCheck before = check_divergence(c.u, c.v, c.w, c.rho, c.rhoh, c.dz, c.dx, c.dy, region);
    const std::vector<double> w_mean = mean_w(c.w, region);
    const Field3D<double> w_before = c.w;

    const CorrectionResult result = correct_div_uv(c.u, c.v, c.w, c.rho, c.rhoh, c.dz, c.dx, c.dy,
                                                   c.ncx, c.ncy, CorrectionSettings{}, "synthetic");

    const DivergenceCheck after = check_divergence(c.u, c.v, c.w, c.rho, c.rhoh, c.dz, c.dx, c.dy, region);

    failures += expect_true(before.max_abs > 1.0e-4, "synthetic field must start divergent");
    failures += expect_true(after.max_abs < 1.0e-10 * before.max_abs,
                            "divergence after correction must be below 1e-10 of the initial maximum");
    failures += expect_true(result.max_iterations > 0 && result.max_relative_residual <= 1.0e-12,
                            "correction reports its iterations and residual");
    failures += expect_true(c.w.values() == w_before.values(), "w must not be modified by the correction");

    const std::vector<double> w_implied = implied_mean_w(c.u, c.v, c.w, c.rho, c.rhoh, c.dz, c.dx, c.dy, region);
    double max_diff = 0.0;
    double max_mean = 0.0;
    for (int k = 0; k <= c.ktot; ++k)
    {
        max_diff = std::max(max_diff, std::abs(w_implied[k] - w_mean[k]));
        max_mean = std::max(max_mean, std::abs(w_mean[k]));
    }
    failures += expect_true(max_mean > 0.0, "source w has a non-zero domain mean");
    failures += expect_true(max_diff < 1.0e-9, "mean w implied by the corrected wind must match the source w");

    // Only the faces inside and on the edge of the region change.
    SyntheticCase<double> untouched;
    failures += expect_true(c.v(3, 5, c.ncx) == untouched.v(3, 5, c.ncx),
                            "v outside the correction region must be unchanged");
    failures += expect_true(c.u(3, c.ncy, 5) == untouched.u(3, c.ncy, 5),
                            "u outside the correction region must be unchanged");

    return failures;
}

int test_single_precision_correction()
{
    int failures = 0;

    SyntheticCase<float> c;
    const GridRegion region = c.region();
    const DivergenceCheck before = check_divergence(c.u, c.v, c.w, c.rho, c.rhoh, c.dz, c.dx, c.dy, region);

    CorrectionSettings settings;
    settings.tolerance = 1.0e-10;
    correct_div_uv(c.u, c.v, c.w, c.rho, c.rhoh, c.dz, c.dx, c.dy, c.ncx, c.ncy, settings, "synthetic float");

    const DivergenceCheck after = check_divergence(c.u, c.v, c.w, c.rho, c.rhoh, c.dz, c.dx, c.dy, region);
    failures += expect_true(after.max_abs < 1.0e-4 * before.max_abs,
                            "single precision correction reduces the divergence to rounding level");
    return failures;
}

int test_non_convergence_is_reported()
{
    int failures = 0;

    SyntheticCase<double> c;
    CorrectionSettings settings;
    settings.max_iter = 2;

    bool threw = false;
    try
    {
        correct_div_uv(c.u, c.v, c.w, c.rho, c.rhoh, c.dz, c.dx, c.dy, c.ncx, c.ncy, settings, "capped");
    }
    catch (const NumericalError& e)
    {
        threw = std::string(e.what()).find("capped") != std::string::npos;
    }
    failures += expect_true(threw, "iteration cap must raise NumericalError naming the context");

    Field3D<double> small_w(c.ktot, c.ncy + 1, c.ncx + 1);
    threw = false;
    try
    {
        correct_div_uv(c.u, c.v, small_w, c.rho, c.rhoh, c.dz, c.dx, c.dy, c.ncx, c.ncy,
                       CorrectionSettings{}, "shape");
    }
    catch (const DataError&)
    {
        threw = true;
    }
    failures += expect_true(threw, "w without the top half level must be rejected");

    return failures;
}

int test_non_finite_momentum()
{
    int failures = 0;

    SyntheticCase<double> c;
    c.u(0, 2, 2) = std::numeric_limits<double>::quiet_NaN();

    const DivergenceCheck check = check_divergence(c.u, c.v, c.w, c.rho, c.rhoh, c.dz, c.dx, c.dy, c.region());
    failures += expect_true(!std::isfinite(check.max_abs), "NaN in u is reported as the maximum divergence");
    failures += expect_true(check.k == 0 && check.j == 2 && check.i == 1,
                            "the maximum points at the first cell touching the NaN face");

    bool threw = false;
    try
    {
        correct_div_uv(c.u, c.v, c.w, c.rho, c.rhoh, c.dz, c.dx, c.dy, c.ncx, c.ncy,
                       CorrectionSettings{}, "nan");
    }
    catch (const NumericalError& e)
    {
        const std::string message = e.what();
        threw = message.find("nan") != std::string::npos && message.find("level 0") != std::string::npos;
    }
    failures += expect_true(threw, "NaN in u must raise NumericalError naming the context and level");

    SyntheticCase<double> f;
    f.w(4, 7, 9) = std::numeric_limits<double>::infinity();
    threw = false;
    try
    {
        correct_div_uv(f.u, f.v, f.w, f.rho, f.rhoh, f.dz, f.dx, f.dy, f.ncx, f.ncy,
                       CorrectionSettings{}, "inf");
    }
    catch (const NumericalError& e)
    {
        threw = std::string(e.what()).find("level 3") != std::string::npos;
    }
    failures += expect_true(threw, "infinite w must raise NumericalError at the first level it enters");

    return failures;
}

int test_w_blending()
{
    int failures = 0;

    SyntheticCase<double> c;
    c.w.fill(2.0);
    blend_w_to_zero(c.w, c.zh, 500.0);

    failures += expect_true(c.w(0, 4, 4) == 0.0, "w vanishes at the surface");
    failures += expect_true(std::abs(c.w(5, 4, 4) - 1.0) < 1.0e-12, "w is halved at half the blend height");
    failures += expect_true(c.w(10, 4, 4) == 2.0 && c.w(12, 4, 4) == 2.0, "w above the blend height is unchanged");

    c.w.fill(2.0);
    blend_w_to_zero(c.w, c.zh, 0.0);
    failures += expect_true(c.w(0, 4, 4) == 2.0, "zero blend height disables blending");

    return failures;
}
}

int main()
{
    int failures = 0;
    failures += test_correction_removes_divergence();
    failures += test_single_precision_correction();
    failures += test_non_convergence_is_reported();
    failures += test_non_finite_momentum();
    failures += test_w_blending();

    if (failures > 0)
    {
        std::cerr << "[divergence-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[divergence-regression] all checks passed" << std::endl;
    return 0;
}
