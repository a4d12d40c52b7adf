#include "curve_fit.hpp"

#include "../core/numeric.hpp"
#include "../solvers/least_squares.hpp"
#include "../solvers/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace plasticity::analysis
{

namespace
{

using Model = double (*)(const std::vector<double>&, double);

bool allFinite(const std::vector<double>& v)
{
    return std::all_of(v.begin(), v.end(),
                       [](double d) { return std::isfinite(d); });
}

double maxAbs(const std::vector<double>& v)
{
    double m = 0.0;
    for (double d : v)
        m = std::max(m, std::abs(d));
    return m > 0.0 ? m : 1.0;
}

std::vector<double> scaled(const std::vector<double>& v, double s)
{
    std::vector<double> out(v.size());
    for (size_t i = 0; i < v.size(); ++i)
        out[i] = v[i] / s;
    return out;
}

// Minimize the sum of squared residuals, restarting once from the first
// optimum so a collapsed simplex gets a fresh start.
solvers::NelderMead::Result minimizeSse(Model model,
                                        const std::vector<double>& x,
                                        const std::vector<double>& y,
                                        const std::vector<double>& guess)
{
    auto sse = [&](const std::vector<double>& p) {
        double s = 0.0;
        for (size_t i = 0; i < x.size(); ++i)
        {
            const double r = model(p, x[i]) - y[i];
            s += r * r;
        }
        return s;
    };

    solvers::NelderMead::Options opts;
    opts.relTol = 1e-10;
    opts.absTol = 1e-18;

    auto first = solvers::NelderMead::solve(guess, sse, opts);
    if (first.params.empty() || !std::isfinite(first.cost))
        return first;
    return solvers::NelderMead::solve(first.params, sse, opts);
}

double scoreR2(Model model, const std::vector<double>& params,
               const std::vector<double>& x, const std::vector<double>& y)
{
    std::vector<double> pred(x.size());
    for (size_t i = 0; i < x.size(); ++i)
        pred[i] = model(params, x[i]);
    return solvers::LeastSquares::rSquared(y, pred);
}

bool usable(const std::vector<double>& x, const std::vector<double>& y)
{
    return x.size() == y.size() && x.size() >= 3 && allFinite(x) &&
           allFinite(y);
}

} // namespace

double decayModel(const std::vector<double>& p, double x)
{
    return p[0] * std::exp(-x / p[1]) + p[2];
}

double gaussianModel(const std::vector<double>& p, double x)
{
    const double d = x - p[1];
    return p[0] * std::exp(-(d * d) / (2.0 * p[2] * p[2]));
}

FitResult fitExponentialDecay(const std::vector<double>& x,
                              const std::vector<double>& y)
{
    FitResult out;
    if (!usable(x, y))
        return out;

    // Solve in unit-scaled coordinates; currents and intervals span many
    // decades and the simplex tolerances are absolute in cost.
    const double sx = maxAbs(x);
    const double sy = maxAbs(y);
    const auto xs = scaled(x, sx);
    const auto ys = scaled(y, sy);

    double tau0 = numeric::mean(xs);
    if (std::abs(tau0) < 1e-12)
        tau0 = 1.0;
    const std::vector<double> guess{maxAbs(ys), tau0,
                                    *std::min_element(ys.begin(), ys.end())};

    const auto res = minimizeSse(decayModel, xs, ys, guess);
    if (!res.converged || !allFinite(res.params))
        return out;

    std::vector<double> params{res.params[0] * sy, res.params[1] * sx,
                               res.params[2] * sy};
    const double r2 = scoreR2(decayModel, params, x, y);
    if (!std::isfinite(r2))
        return out;

    out.params = std::move(params);
    out.r2 = r2;
    out.success = true;
    return out;
}

FitResult fitGaussian(const std::vector<double>& xIn,
                      const std::vector<double>& yIn)
{
    FitResult out;
    if (!usable(xIn, yIn))
        return out;

    std::vector<std::pair<double, double>> pts;
    pts.reserve(xIn.size());
    for (size_t i = 0; i < xIn.size(); ++i)
        pts.emplace_back(xIn[i], yIn[i]);
    std::stable_sort(pts.begin(), pts.end(),
                     [](const auto& a, const auto& b) {
                         return a.first < b.first;
                     });
    std::vector<double> x, y;
    for (const auto& [px, py] : pts)
    {
        x.push_back(px);
        y.push_back(py);
    }

    const double sx = maxAbs(x);
    const double sy = maxAbs(y);
    const auto xs = scaled(x, sx);
    const auto ys = scaled(y, sy);

    const auto peak = std::max_element(ys.begin(), ys.end());
    const double a0 = *peak;
    const double b0 = xs[static_cast<size_t>(peak - ys.begin())];
    double c0 = (xs.back() - xs.front()) / 4.0;
    if (c0 <= 1e-12)
        c0 = 1.0;

    const auto res = minimizeSse(gaussianModel, xs, ys, {a0, b0, c0});
    if (!res.converged || !allFinite(res.params))
        return out;

    std::vector<double> params{res.params[0] * sy, res.params[1] * sx,
                               std::abs(res.params[2]) * sx};
    const double r2 = scoreR2(gaussianModel, params, x, y);
    if (!std::isfinite(r2))
        return out;

    out.params = std::move(params);
    out.r2 = r2;
    out.success = true;
    return out;
}

LinearFit fitLinear(const std::vector<double>& x, const std::vector<double>& y)
{
    const auto r = solvers::LeastSquares::solveLinearRegression(x, y);
    if (!r.valid)
        return {};
    return LinearFit{r.slope, r.intercept, r.r2};
}

} // namespace plasticity::analysis
