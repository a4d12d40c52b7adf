#include "loop_metrics.hpp"

#include <algorithm>
#include <cmath>

namespace plasticity::analysis
{

namespace
{

bool sameCoordinate(double a, double b)
{
    return std::abs(a - b) <= 1e-9 * (std::abs(a) + std::abs(b));
}

bool samePoint(const Point& a, const Point& b)
{
    return sameCoordinate(a.first, b.first) &&
           sameCoordinate(a.second, b.second);
}

} // namespace

double loopArea(const std::vector<Point>& points)
{
    const size_t n = points.size();
    if (n < 3)
        return 0.0;

    double twice = 0.0;
    for (size_t i = 0; i < n; ++i)
    {
        const auto& [x1, y1] = points[i];
        const auto& [x2, y2] = points[(i + 1) % n];
        twice += x1 * y2 - x2 * y1;
    }
    return std::abs(twice) / 2.0;
}

double sweepFrequency(const std::vector<double>& times)
{
    if (times.size() < 2)
        return 0.0;
    const double span = times.back() - times.front();
    if (span <= kMinSweepSpan)
        return 0.0;
    return 1.0 / span;
}

double sweepFrequency(const SampleLog& log)
{
    return sweepFrequency(timestamps(log.samples()));
}

std::vector<double> differentialConductance(const std::vector<Point>& points)
{
    const size_t n = points.size();
    std::vector<double> out;
    if (n < 2)
        return out;

    out.resize(n, 0.0);
    for (size_t i = 1; i < n; ++i)
    {
        const double dv = points[i].first - points[i - 1].first;
        const double di = points[i].second - points[i - 1].second;
        out[i] = (dv == 0.0) ? 0.0 : di / dv;
    }
    out[0] = out[1];
    return out;
}

IntersectionReport findIntersections(const std::vector<Point>& points)
{
    IntersectionReport report;
    const size_t n = points.size();
    if (n < 4)
        return report;

    // Segment i runs from points[i] to points[i + 1].
    const size_t segments = n - 1;
    for (size_t i = 0; i < segments; ++i)
    {
        const auto& [x1, y1] = points[i];
        const auto& [x2, y2] = points[i + 1];
        for (size_t j = i + 2; j < segments; ++j)
        {
            const auto& [x3, y3] = points[j];
            const auto& [x4, y4] = points[j + 1];

            const double denom = (y4 - y3) * (x2 - x1) - (x4 - x3) * (y2 - y1);
            if (std::abs(denom) < kParallelEpsilon)
                continue;

            const double ua =
                ((x4 - x3) * (y1 - y3) - (y4 - y3) * (x1 - x3)) / denom;
            const double ub =
                ((x2 - x1) * (y1 - y3) - (y2 - y1) * (x1 - x3)) / denom;

            if (ua >= 0.0 && ua <= 1.0 && ub >= 0.0 && ub <= 1.0)
            {
                const Point hit{x1 + ua * (x2 - x1), y1 + ua * (y2 - y1)};
                // A crossing through a shared vertex is hit by both of the
                // segments meeting there.
                const bool seen = std::any_of(
                    report.points.begin(), report.points.end(),
                    [&](const Point& p) { return samePoint(p, hit); });
                if (!seen)
                    report.points.push_back(hit);
            }
        }
    }
    report.found = !report.points.empty();
    return report;
}

} // namespace plasticity::analysis
