#pragma once

#include "protocol_step.hpp"

#include <vector>

namespace plasticity::exp
{

struct LtpLtdParams
{
    int pulseTime{2};         // repetitions of each (read, write) pair
    double pulseWidth{0.1};   // settle per read/write (s)
    double readVoltage{0.1};
    double writePVoltage{1.0};
    double writeDVoltage{-1.0};
};

struct PairedPulseParams
{
    double pulseVoltage{1.0};
    double pulseWidth{0.1};
    double offTime{1e-4};
    std::vector<double> intervals{0.01, 0.05, 0.1, 0.5, 1.0};
    int repetitions{3};
    double repetitionCooldown{1.0};
    double intervalCooldown{2.0};
};

struct StdpParams
{
    double readVoltage{0.1};
    int readNum{5};
    double spikeVoltage{0.5};
    double pulseWidth{0.01};
    // Spike timing; positive means the pre spike leads.
    std::vector<double> timings{-0.1, -0.05, -0.02, 0.02, 0.05, 0.1};
    double rest{1.0};
};

struct SrdpParams
{
    double readVoltage{0.1};
    double writeVoltage{1.0};
    double pulseWidth{0.2};
    int pulseNum{10};
    double offTime{1e-4};
    std::vector<double> spacings{2.0, 1.0, 0.2};
};

struct LtmParams
{
    double readVoltage{0.1};
    double writeVoltage{1.0};
    double pulseWidth{0.2};
    double offTime{1e-4};
    int pulseCount{50};
    int readCount{5};
    std::vector<double> spacings{1.0};
};

struct SineParams
{
    double amplitude{1.0};
    int pointsPerHalf{6};
    int cycles{4};
    double pulseWidth{0.1};
    double offTime{0.01};
    double peakTolerance{0.05};
};

// Smallest IV step (V) a sweep accepts, and the most steps per sweep leg.
inline constexpr double kMinIvStep = 1e-6;
inline constexpr double kMaxIvStepsPerLeg = 1e6;

struct IvSweepParams
{
    double vMax{1.0};
    double stepSize{0.1};
    double sourceDelay{0.01};
};

StepList ltpLtdSteps(const LtpLtdParams& p);
StepList pairedPulseSteps(const PairedPulseParams& p);
StepList stdpSteps(const StdpParams& p);
StepList srdpSteps(const SrdpParams& p);
StepList ltmSteps(const LtmParams& p);
StepList sineSteps(const SineParams& p);
StepList ivSweepSteps(const IvSweepParams& p);

// Source levels of the sine protocol, in issue order.
std::vector<double> sineVoltages(double amplitude, int pointsPerHalf,
                                 int cycles);

// Label of the reads / writes of SRDP rate group `group` (1-based).
std::string srdpReadLabel(int group);
std::string srdpWriteLabel(int group);

} // namespace plasticity::exp
