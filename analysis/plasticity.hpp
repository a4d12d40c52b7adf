#pragma once

#include "../core/sample_log.hpp"
#include "curve_fit.hpp"
#include "loop_metrics.hpp"

#include <string>
#include <vector>

namespace plasticity::analysis
{

struct PairedPulseResult
{
    double ratio{0.0};
    bool valid{false};
    bool isFacilitation{false};
};

// ratio = I2 / I1 - 1. A reference current below 1e-20 A in magnitude gives
// an invalid result with ratio 0.
PairedPulseResult pairedPulseRatio(double i1, double i2);

// (time, conductance) for every sample, G = I / readVoltage.
std::vector<Point> conductanceSeries(const std::vector<Sample>& reads,
                                     double readVoltage);

struct LtpLtdSummary
{
    std::vector<Point> ltpConductance;
    std::vector<Point> ltdConductance;
    PairedPulseResult potentiation; // last vs first LTP read
    PairedPulseResult depression;   // last vs first LTD read
};

LtpLtdSummary summarizeLtpLtd(const SampleLog& log, double readVoltage);

struct IntervalRatio
{
    double interval{};
    double meanRatio{};
    int validPairs{};
    bool isFacilitation{};
};

struct PairedPulseSummary
{
    std::vector<IntervalRatio> intervals;
    FitResult decay; // over (interval, meanRatio) of intervals with data
};

// Pairs the k-th "pulse1" with the k-th "pulse2" sample; pairs are grouped by
// interval in blocks of `repetitions`.
PairedPulseSummary summarizePairedPulse(const SampleLog& log,
                                        const std::vector<double>& intervals,
                                        int repetitions);

struct StdpSummary
{
    std::vector<Point> window; // (delta t, delta g)
    FitResult potentiationFit; // delta g over |delta t| for delta t > 0
    FitResult depressionFit;   // delta g over |delta t| for delta t < 0
};

// Delta g from the mean probe read over the mean baseline read of each event
// (blocks of `readNum`), delta t = t(post_spike) - t(pre_spike).
StdpSummary summarizeStdp(const SampleLog& log, int readNum);

struct RateGroup
{
    int group{};
    PairedPulseResult change; // last vs first read of the group
};

struct SrdpSummary
{
    std::vector<Point> conductance;
    std::vector<RateGroup> groups;
};

SrdpSummary summarizeSrdp(const SampleLog& log, double readVoltage,
                          int groupCount);

struct LtmSummary
{
    std::vector<Point> conductance;
    PairedPulseResult retention; // mean after-block vs mean before-block
};

LtmSummary summarizeLtm(const SampleLog& log, double readVoltage,
                        int readCount);

struct SineSummary
{
    std::vector<double> positivePeaks;
    std::vector<double> negativePeaks;
    LinearFit positiveFit; // over peak index 1..n
    LinearFit negativeFit;
    std::string memristorType; // "M0".."M4"
};

// Currents of samples whose voltage lies within `tol` of `target`.
std::vector<double> peakCurrents(const std::vector<Sample>& samples,
                                 double target, double tol);

// Classify from the slopes of linear fits over the first and second halves of
// the peak currents: (-,+) M1, (-,-) M2, (+,-) M3, (+,+) M4, otherwise M0.
std::string classifyMemristor(const std::vector<double>& peaks);

SineSummary summarizeSine(const SampleLog& log, double amplitude, double tol);

struct IvSummary
{
    double loopArea{};
    double frequency{};
    std::vector<double> differentialConductance;
    IntersectionReport intersections;
};

IvSummary summarizeIvSweep(const SampleLog& log);

} // namespace plasticity::analysis
