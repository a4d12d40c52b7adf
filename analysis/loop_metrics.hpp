#pragma once

#include "../core/sample_log.hpp"

#include <vector>

namespace plasticity::analysis
{

// Determinant magnitude below which two segments count as parallel.
inline constexpr double kParallelEpsilon = 1e-10;

// Shortest sweep span (s) that still yields a frequency.
inline constexpr double kMinSweepSpan = 1e-9;

struct IntersectionReport
{
    bool found{false};
    std::vector<Point> points;
};

// Enclosed area of the (voltage, current) polygon, closed from the last point
// back to the first. Fewer than 3 points give 0.
double loopArea(const std::vector<Point>& points);

// 1 / (t_last - t_first), or 0 for a span of at most kMinSweepSpan.
double sweepFrequency(const std::vector<double>& times);
double sweepFrequency(const SampleLog& log);

// dI/dV at every point from the difference with the previous point; the first
// point repeats the second point's value. A zero voltage step yields 0.
std::vector<double> differentialConductance(const std::vector<Point>& points);

// Distinct crossings between non-adjacent segments of the open polyline,
// ordered by the first segment index and then the second.
IntersectionReport findIntersections(const std::vector<Point>& points);

} // namespace plasticity::analysis
