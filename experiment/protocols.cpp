#include "protocols.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace plasticity::exp
{

namespace
{

// Levels strictly after `from` up to and including `to`, spaced by `step`.
std::vector<double> ramp(double from, double to, double step)
{
    std::vector<double> out;
    const double span = to - from;
    if (step <= 0.0 || std::abs(span) < 1e-12)
        return out;
    const int n = static_cast<int>(std::ceil(std::abs(span) / step - 1e-9));
    const double dir = span > 0.0 ? 1.0 : -1.0;
    for (int i = 1; i < n; ++i)
        out.push_back(from + dir * step * i);
    out.push_back(to);
    return out;
}

void appendReads(StepList& steps, int count, double voltage,
                 const std::string& label, double settle)
{
    for (int i = 0; i < count; ++i)
        steps.push_back(Read{voltage, label, settle});
}

// Output off for `offTime`, then back on.
void appendOffGap(StepList& steps, double offTime)
{
    steps.push_back(OutputEnable{false});
    steps.push_back(Wait{offTime});
    steps.push_back(OutputEnable{true});
}

} // namespace

std::string srdpReadLabel(int group)
{
    return "rate" + std::to_string(group) + "_read";
}

std::string srdpWriteLabel(int group)
{
    return "rate" + std::to_string(group) + "_write";
}

StepList ltpLtdSteps(const LtpLtdParams& p)
{
    StepList steps;
    const int n = std::max(0, p.pulseTime);
    steps.push_back(OutputEnable{true});
    for (int i = 0; i < n; ++i)
    {
        steps.push_back(Read{p.readVoltage, "LTP_read", p.pulseWidth});
        steps.push_back(Write{p.writePVoltage, "LTP_write", p.pulseWidth});
    }
    // Depression follows at once: no delay, output stays on.
    for (int i = 0; i < n; ++i)
    {
        steps.push_back(Read{p.readVoltage, "LTD_read", p.pulseWidth});
        steps.push_back(Write{p.writeDVoltage, "LTD_write", p.pulseWidth});
    }
    steps.push_back(OutputEnable{false});
    return steps;
}

StepList pairedPulseSteps(const PairedPulseParams& p)
{
    StepList steps;
    const int reps = std::max(0, p.repetitions);
    steps.push_back(OutputEnable{true});
    for (size_t k = 0; k < p.intervals.size(); ++k)
    {
        for (int r = 0; r < reps; ++r)
        {
            steps.push_back(Write{p.pulseVoltage, "pulse1", p.pulseWidth});
            appendOffGap(steps, p.offTime);
            steps.push_back(Wait{p.intervals[k]});
            steps.push_back(Write{p.pulseVoltage, "pulse2", p.pulseWidth});
            if (r + 1 < reps)
                steps.push_back(Wait{p.repetitionCooldown});
        }
        if (k + 1 < p.intervals.size())
            steps.push_back(Wait{p.intervalCooldown});
    }
    steps.push_back(OutputEnable{false});
    return steps;
}

StepList stdpSteps(const StdpParams& p)
{
    StepList steps;
    const int reads = std::max(0, p.readNum);
    steps.push_back(OutputEnable{true});
    for (size_t k = 0; k < p.timings.size(); ++k)
    {
        const double dt = p.timings[k];
        appendReads(steps, reads, p.readVoltage, "baseline_read", p.pulseWidth);

        const Write pre{p.spikeVoltage, "pre_spike", p.pulseWidth};
        const Write post{-p.spikeVoltage, "post_spike", p.pulseWidth};
        steps.push_back(dt >= 0.0 ? Step{pre} : Step{post});
        steps.push_back(Wait{std::abs(dt)});
        steps.push_back(dt >= 0.0 ? Step{post} : Step{pre});

        appendReads(steps, reads, p.readVoltage, "probe_read", p.pulseWidth);
        if (k + 1 < p.timings.size())
            steps.push_back(Wait{p.rest});
    }
    steps.push_back(OutputEnable{false});
    return steps;
}

StepList srdpSteps(const SrdpParams& p)
{
    StepList steps;
    const int pulses = std::max(0, p.pulseNum);
    steps.push_back(OutputEnable{true});
    for (size_t k = 0; k < p.spacings.size(); ++k)
    {
        const int group = static_cast<int>(k) + 1;
        for (int i = 0; i < pulses; ++i)
        {
            steps.push_back(
                Read{p.readVoltage, srdpReadLabel(group), p.pulseWidth});
            appendOffGap(steps, p.offTime);
            steps.push_back(
                Write{p.writeVoltage, srdpWriteLabel(group), p.pulseWidth});
            if (i + 1 < pulses)
            {
                appendOffGap(steps, p.offTime);
                steps.push_back(Wait{p.spacings[k]});
            }
        }
    }
    steps.push_back(OutputEnable{false});
    return steps;
}

StepList ltmSteps(const LtmParams& p)
{
    StepList steps;
    const int pulses = std::max(0, p.pulseCount);
    const int reads = std::max(0, p.readCount);
    steps.push_back(OutputEnable{true});
    appendReads(steps, reads, p.readVoltage, "ltm_read", p.pulseWidth);
    for (double spacing : p.spacings)
    {
        for (int i = 0; i < pulses; ++i)
        {
            steps.push_back(Write{p.writeVoltage, "ltm_write", p.pulseWidth});
            appendOffGap(steps, p.offTime);
            if (i + 1 < pulses)
                steps.push_back(Wait{spacing});
        }
    }
    appendReads(steps, reads, p.readVoltage, "ltm_read", p.pulseWidth);
    steps.push_back(OutputEnable{false});
    return steps;
}

std::vector<double> sineVoltages(double amplitude, int pointsPerHalf,
                                 int cycles)
{
    std::vector<double> out;
    if (pointsPerHalf <= 0 || cycles <= 0)
        return out;

    const double pi = std::acos(-1.0);
    auto level = [&](int i) {
        return amplitude * std::sin(i * pi / pointsPerHalf);
    };
    for (int c = 0; c < cycles; ++c)
        for (int i = 0; i < pointsPerHalf; ++i)
            out.push_back(level(i));
    for (int c = 0; c < cycles; ++c)
        for (int i = pointsPerHalf; i < 2 * pointsPerHalf; ++i)
            out.push_back(level(i));
    out.push_back(0.0);
    return out;
}

StepList sineSteps(const SineParams& p)
{
    StepList steps;
    const auto levels = sineVoltages(p.amplitude, p.pointsPerHalf, p.cycles);
    if (levels.empty())
        return steps;
    steps.push_back(OutputEnable{true});
    for (double v : levels)
    {
        steps.push_back(Write{v, "sine", p.pulseWidth});
        steps.push_back(Wait{p.offTime});
    }
    steps.push_back(OutputEnable{false});
    return steps;
}

StepList ivSweepSteps(const IvSweepParams& p)
{
    StepList steps;
    if (p.vMax <= 0.0 || p.stepSize < kMinIvStep ||
        p.vMax / p.stepSize > kMaxIvStepsPerLeg)
        return steps;

    steps.push_back(OutputEnable{true});
    steps.push_back(Write{0.0, "iv_forward", p.sourceDelay});
    for (double v : ramp(0.0, p.vMax, p.stepSize))
        steps.push_back(Write{v, "iv_forward", p.sourceDelay});
    for (double v : ramp(p.vMax, -p.vMax, p.stepSize))
        steps.push_back(Write{v, "iv_reverse", p.sourceDelay});
    for (double v : ramp(-p.vMax, 0.0, p.stepSize))
        steps.push_back(Write{v, "iv_return", p.sourceDelay});
    steps.push_back(OutputEnable{false});
    return steps;
}

} // namespace plasticity::exp
