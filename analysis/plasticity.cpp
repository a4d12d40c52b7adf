#include "plasticity.hpp"

#include "../core/numeric.hpp"

#include <algorithm>
#include <cmath>

namespace plasticity::analysis
{

namespace
{

std::vector<double> blockMeans(const std::vector<Sample>& reads, int block)
{
    std::vector<double> out;
    if (block <= 0)
        return out;
    const size_t b = static_cast<size_t>(block);
    for (size_t i = 0; i + b <= reads.size(); i += b)
    {
        double sum = 0.0;
        for (size_t k = i; k < i + b; ++k)
            sum += reads[k].current;
        out.push_back(sum / static_cast<double>(b));
    }
    return out;
}

PairedPulseResult firstToLast(const std::vector<Sample>& reads)
{
    if (reads.size() < 2)
        return {};
    return pairedPulseRatio(reads.front().current, reads.back().current);
}

} // namespace

PairedPulseResult pairedPulseRatio(double i1, double i2)
{
    PairedPulseResult r;
    if (std::abs(i1) < numeric::kCurrentFloor)
        return r;
    r.ratio = i2 / i1 - 1.0;
    r.valid = true;
    r.isFacilitation = r.ratio > 0.0;
    return r;
}

std::vector<Point> conductanceSeries(const std::vector<Sample>& reads,
                                     double readVoltage)
{
    std::vector<Point> out;
    out.reserve(reads.size());
    for (const auto& s : reads)
        out.emplace_back(s.timestamp,
                         numeric::conductance(s.current, readVoltage));
    return out;
}

LtpLtdSummary summarizeLtpLtd(const SampleLog& log, double readVoltage)
{
    LtpLtdSummary out;
    const auto ltp = log.filter("LTP_read");
    const auto ltd = log.filter("LTD_read");
    out.ltpConductance = conductanceSeries(ltp, readVoltage);
    out.ltdConductance = conductanceSeries(ltd, readVoltage);
    out.potentiation = firstToLast(ltp);
    out.depression = firstToLast(ltd);
    return out;
}

PairedPulseSummary summarizePairedPulse(const SampleLog& log,
                                        const std::vector<double>& intervals,
                                        int repetitions)
{
    PairedPulseSummary out;
    if (repetitions <= 0)
        return out;

    const auto first = log.filter("pulse1");
    const auto second = log.filter("pulse2");
    const size_t pairs = std::min(first.size(), second.size());
    const size_t reps = static_cast<size_t>(repetitions);

    std::vector<double> fitX, fitY;
    for (size_t k = 0; k < intervals.size(); ++k)
    {
        IntervalRatio ir;
        ir.interval = intervals[k];
        double sum = 0.0;
        for (size_t r = 0; r < reps; ++r)
        {
            const size_t idx = k * reps + r;
            if (idx >= pairs)
                break;
            const auto pr =
                pairedPulseRatio(first[idx].current, second[idx].current);
            if (!pr.valid)
                continue;
            sum += pr.ratio;
            ++ir.validPairs;
        }
        if (ir.validPairs > 0)
        {
            ir.meanRatio = sum / ir.validPairs;
            ir.isFacilitation = ir.meanRatio > 0.0;
            fitX.push_back(ir.interval);
            fitY.push_back(ir.meanRatio);
        }
        out.intervals.push_back(ir);
    }

    out.decay = fitExponentialDecay(fitX, fitY);
    return out;
}

StdpSummary summarizeStdp(const SampleLog& log, int readNum)
{
    StdpSummary out;
    const auto baseline = blockMeans(log.filter("baseline_read"), readNum);
    const auto probe = blockMeans(log.filter("probe_read"), readNum);
    const auto pre = log.filter("pre_spike");
    const auto post = log.filter("post_spike");

    const size_t events = std::min({baseline.size(), probe.size(), pre.size(),
                                    post.size()});

    std::vector<double> posX, posY, negX, negY;
    for (size_t k = 0; k < events; ++k)
    {
        const auto dg = pairedPulseRatio(baseline[k], probe[k]);
        if (!dg.valid)
            continue;
        const double dt = post[k].timestamp - pre[k].timestamp;
        out.window.emplace_back(dt, dg.ratio);
        if (dt > 0.0)
        {
            posX.push_back(dt);
            posY.push_back(dg.ratio);
        }
        else if (dt < 0.0)
        {
            negX.push_back(-dt);
            negY.push_back(dg.ratio);
        }
    }

    out.potentiationFit = fitExponentialDecay(posX, posY);
    out.depressionFit = fitExponentialDecay(negX, negY);
    return out;
}

SrdpSummary summarizeSrdp(const SampleLog& log, double readVoltage,
                          int groupCount)
{
    SrdpSummary out;
    out.conductance = conductanceSeries(log.filter("_read"), readVoltage);
    for (int g = 1; g <= groupCount; ++g)
    {
        const auto reads =
            log.filter("rate" + std::to_string(g) + "_read");
        out.groups.push_back(RateGroup{g, firstToLast(reads)});
    }
    return out;
}

LtmSummary summarizeLtm(const SampleLog& log, double readVoltage,
                        int readCount)
{
    LtmSummary out;
    const auto reads = log.filter("ltm_read");
    out.conductance = conductanceSeries(reads, readVoltage);

    const auto means = blockMeans(reads, readCount);
    if (means.size() >= 2)
        out.retention = pairedPulseRatio(means.front(), means.back());
    return out;
}

std::vector<double> peakCurrents(const std::vector<Sample>& samples,
                                 double target, double tol)
{
    std::vector<double> out;
    for (const auto& s : samples)
    {
        if (std::abs(s.voltage - target) < tol)
            out.push_back(s.current);
    }
    return out;
}

std::string classifyMemristor(const std::vector<double>& peaks)
{
    const size_t half = peaks.size() / 2;
    std::vector<double> x1, y1, x2, y2;
    for (size_t i = 0; i < half; ++i)
    {
        x1.push_back(static_cast<double>(i + 1));
        y1.push_back(peaks[i]);
    }
    for (size_t i = half; i < peaks.size(); ++i)
    {
        x2.push_back(static_cast<double>(i - half + 1));
        y2.push_back(peaks[i]);
    }

    const double k1 = fitLinear(x1, y1).slope;
    const double k2 = fitLinear(x2, y2).slope;
    if (k1 < 0.0 && k2 > 0.0)
        return "M1";
    if (k1 < 0.0 && k2 < 0.0)
        return "M2";
    if (k1 > 0.0 && k2 < 0.0)
        return "M3";
    if (k1 > 0.0 && k2 > 0.0)
        return "M4";
    return "M0";
}

SineSummary summarizeSine(const SampleLog& log, double amplitude, double tol)
{
    SineSummary out;
    const auto samples = log.filter("sine");
    out.positivePeaks = peakCurrents(samples, amplitude, tol);
    out.negativePeaks = peakCurrents(samples, -amplitude, tol);

    auto indexFit = [](const std::vector<double>& y) {
        std::vector<double> x(y.size());
        for (size_t i = 0; i < y.size(); ++i)
            x[i] = static_cast<double>(i + 1);
        return fitLinear(x, y);
    };
    out.positiveFit = indexFit(out.positivePeaks);
    out.negativeFit = indexFit(out.negativePeaks);
    out.memristorType = classifyMemristor(out.positivePeaks);
    return out;
}

IvSummary summarizeIvSweep(const SampleLog& log)
{
    IvSummary out;
    const auto points = ivPoints(log.samples());
    out.loopArea = loopArea(points);
    out.frequency = sweepFrequency(log);
    out.differentialConductance = differentialConductance(points);
    out.intersections = findIntersections(points);
    return out;
}

} // namespace plasticity::analysis
