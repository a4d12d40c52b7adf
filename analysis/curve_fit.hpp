#pragma once

#include <vector>

namespace plasticity::analysis
{

// Outcome of one fit attempt. A failed fit has no parameters and r2 == 0.
struct FitResult
{
    std::vector<double> params;
    double r2{0.0};
    bool success{false};
};

struct LinearFit
{
    double slope{0.0};
    double intercept{0.0};
    double r2{0.0};
};

// f(x) = a * exp(-x / tau) + c, params {a, tau, c}
double decayModel(const std::vector<double>& params, double x);

// f(x) = a * exp(-(x - b)^2 / (2 c^2)), params {a, b, c}
double gaussianModel(const std::vector<double>& params, double x);

// Nonlinear least-squares fit of decayModel. Needs at least 3 points.
// Initial guess: a = max|y|, tau = mean(x), c = min(y).
FitResult fitExponentialDecay(const std::vector<double>& x,
                              const std::vector<double>& y);

// Nonlinear least-squares fit of gaussianModel after sorting the pairs by x.
// Needs at least 3 points. The reported width c is non-negative.
FitResult fitGaussian(const std::vector<double>& x,
                      const std::vector<double>& y);

// Ordinary least squares; fewer than 2 points (or constant x) gives zeros.
LinearFit fitLinear(const std::vector<double>& x, const std::vector<double>& y);

} // namespace plasticity::analysis
