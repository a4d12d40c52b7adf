#pragma once

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <vector>

namespace plasticity::solvers
{

/**
 * @brief Nelder-Mead Optimization Solver.
 * Minimizes a cost function of N variables.
 */
class NelderMead
{
  public:
    using CostFunction = std::function<double(const std::vector<double>&)>;

    struct Point
    {
        std::vector<double> params;
        double cost;
    };

    struct Result
    {
        std::vector<double> params;
        double cost = std::numeric_limits<double>::infinity();
        int iterations = 0;
        bool converged = false;
    };

    struct Options
    {
        int maxIter = 5000;
        double relTol = 1e-12; // simplex cost spread relative to best cost
        double absTol = 1e-20; // spread floor for a zero-residual optimum
    };

    /**
     * @brief Solve the optimization problem.
     * @param initialParams Initial guess for parameters.
     * @param costFunc Function to minimize. Non-finite costs are treated as
     *        +infinity so the simplex moves away from them.
     * @param opts Iteration budget and stopping tolerances.
     * @return Best vertex; converged is false when the budget ran out or the
     *         best cost is not finite.
     */
    static Result solve(const std::vector<double>& initialParams,
                        const CostFunction& costFunc, const Options& opts)
    {
        Result res;
        const size_t n = initialParams.size();
        if (n == 0)
            return res;

        auto cost = [&](const std::vector<double>& p) {
            const double c = costFunc(p);
            return std::isfinite(c) ? c
                                    : std::numeric_limits<double>::infinity();
        };

        std::vector<Point> simplex(n + 1);

        // P0 = initial guess
        simplex[0].params = initialParams;
        simplex[0].cost = cost(initialParams);

        // P1..Pn = perturbed P0
        for (size_t i = 1; i <= n; ++i)
        {
            simplex[i].params = initialParams;
            // Perturb i-th dimension by 5% or minimally 0.00025
            if (std::abs(simplex[i].params[i - 1]) > 1e-9)
            {
                simplex[i].params[i - 1] *= 1.05;
            }
            else
            {
                simplex[i].params[i - 1] = 0.00025;
            }
            simplex[i].cost = cost(simplex[i].params);
        }

        const double alpha = 1.0; // Reflection
        const double gamma = 2.0; // Expansion
        const double rho = 0.5;   // Contraction
        const double sigma = 0.5; // Shrink

        auto byCost = [](const Point& a, const Point& b) {
            return a.cost < b.cost;
        };

        int iter = 0;
        for (; iter < opts.maxIter; ++iter)
        {
            std::sort(simplex.begin(), simplex.end(), byCost);

            const auto& best = simplex[0];
            const auto& worst = simplex[n];
            const auto& secondWorst = simplex[n - 1];

            if (std::isfinite(worst.cost))
            {
                const double range = worst.cost - best.cost;
                if (range <= opts.relTol * std::abs(best.cost) + opts.absTol)
                {
                    res.converged = true;
                    break;
                }
            }

            // Centroid of all points except worst
            std::vector<double> centroid(n, 0.0);
            for (size_t i = 0; i < n; ++i)
            {
                for (size_t j = 0; j < n; ++j)
                {
                    centroid[j] += simplex[i].params[j];
                }
            }
            for (size_t j = 0; j < n; ++j)
                centroid[j] /= static_cast<double>(n);

            std::vector<double> reflected(n);
            for (size_t j = 0; j < n; ++j)
                reflected[j] = centroid[j] +
                               alpha * (centroid[j] - worst.params[j]);

            double reflectedCost = cost(reflected);

            if (best.cost <= reflectedCost && reflectedCost < secondWorst.cost)
            {
                simplex[n].params = reflected;
                simplex[n].cost = reflectedCost;
                continue;
            }

            if (reflectedCost < best.cost)
            {
                std::vector<double> expanded(n);
                for (size_t j = 0; j < n; ++j)
                    expanded[j] = centroid[j] +
                                  gamma * (reflected[j] - centroid[j]);

                double expandedCost = cost(expanded);
                if (expandedCost < reflectedCost)
                {
                    simplex[n].params = expanded;
                    simplex[n].cost = expandedCost;
                }
                else
                {
                    simplex[n].params = reflected;
                    simplex[n].cost = reflectedCost;
                }
                continue;
            }

            // Here reflectedCost >= secondWorst.cost
            bool isOutside = (reflectedCost < worst.cost);

            std::vector<double> contracted(n);
            double contractedCost = 0.0;

            if (isOutside)
            {
                for (size_t j = 0; j < n; ++j)
                    contracted[j] = centroid[j] +
                                    rho * (reflected[j] - centroid[j]);
                contractedCost = cost(contracted);

                if (contractedCost <= reflectedCost)
                {
                    simplex[n].params = contracted;
                    simplex[n].cost = contractedCost;
                    continue;
                }
            }
            else
            {
                for (size_t j = 0; j < n; ++j)
                    contracted[j] = centroid[j] +
                                    rho * (worst.params[j] - centroid[j]);
                contractedCost = cost(contracted);

                if (contractedCost < worst.cost)
                {
                    simplex[n].params = contracted;
                    simplex[n].cost = contractedCost;
                    continue;
                }
            }

            // Shrink toward best
            for (size_t i = 1; i <= n; ++i)
            {
                for (size_t j = 0; j < n; ++j)
                {
                    simplex[i].params[j] =
                        simplex[0].params[j] +
                        sigma * (simplex[i].params[j] - simplex[0].params[j]);
                }
                simplex[i].cost = cost(simplex[i].params);
            }
        }

        std::sort(simplex.begin(), simplex.end(), byCost);

        res.params = simplex[0].params;
        res.cost = simplex[0].cost;
        res.iterations = iter;
        if (!std::isfinite(res.cost))
            res.converged = false;
        return res;
    }
};

} // namespace plasticity::solvers
