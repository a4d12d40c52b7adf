#pragma once

#include <cmath>
#include <vector>

namespace plasticity::solvers
{

class LeastSquares
{
  public:
    // Relative sum-of-squares threshold for treating data as constant.
    static constexpr double kConstantTolerance = 1e-24;

    struct Result
    {
        double slope = 0.0;
        double intercept = 0.0;
        double r2 = 0.0;
        bool valid = false;
    };

    /**
     * @brief Coefficient of determination of predictions against data.
     *
     * A constant data set scores 1 when reproduced exactly and 0 otherwise;
     * spreads within kConstantTolerance of sum(y^2) count as constant.
     */
    static double rSquared(const std::vector<double>& y,
                           const std::vector<double>& yPred)
    {
        if (y.empty() || y.size() != yPred.size())
            return 0.0;

        double mean = 0.0;
        for (double v : y)
            mean += v;
        mean /= static_cast<double>(y.size());

        double ssRes = 0.0, ssTot = 0.0, sumSq = 0.0;
        for (size_t i = 0; i < y.size(); ++i)
        {
            const double r = y[i] - yPred[i];
            const double d = y[i] - mean;
            ssRes += r * r;
            ssTot += d * d;
            sumSq += y[i] * y[i];
        }
        // Spread below rounding noise of the data counts as constant.
        const double zero = kConstantTolerance * sumSq;
        if (ssTot <= zero)
            return ssRes <= zero ? 1.0 : 0.0;
        return 1.0 - ssRes / ssTot;
    }

    /**
     * @brief Perform simple linear regression y = ax + b
     */
    static Result solveLinearRegression(const std::vector<double>& x,
                                        const std::vector<double>& y)
    {
        Result res;
        if (x.size() != y.size() || x.size() < 2)
            return res;

        size_t n = x.size();
        double sumX = 0.0, sumY = 0.0, sumXY = 0.0, sumX2 = 0.0;

        for (size_t i = 0; i < n; ++i)
        {
            sumX += x[i];
            sumY += y[i];
            sumXY += x[i] * y[i];
            sumX2 += x[i] * x[i];
        }

        double denominator = n * sumX2 - sumX * sumX;
        if (std::abs(denominator) < 1e-9)
            return res;

        res.slope = (n * sumXY - sumX * sumY) / denominator;
        res.intercept = (sumY - res.slope * sumX) / n;
        res.valid = true;

        std::vector<double> pred(n);
        for (size_t i = 0; i < n; ++i)
            pred[i] = res.slope * x[i] + res.intercept;
        res.r2 = rSquared(y, pred);

        return res;
    }
};

} // namespace plasticity::solvers
