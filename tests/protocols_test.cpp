#include "experiment/protocols.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace plasticity::test
{

using namespace plasticity::exp;

namespace
{

std::vector<std::string> measuredLabels(const StepList& steps)
{
    std::vector<std::string> out;
    for (const auto& s : steps)
    {
        if (const auto* r = std::get_if<Read>(&s))
            out.push_back(r->label);
        else if (const auto* w = std::get_if<Write>(&s))
            out.push_back(w->label);
    }
    return out;
}

std::vector<double> measuredLevels(const StepList& steps)
{
    std::vector<double> out;
    for (const auto& s : steps)
    {
        if (const auto* r = std::get_if<Read>(&s))
            out.push_back(r->voltage);
        else if (const auto* w = std::get_if<Write>(&s))
            out.push_back(w->voltage);
    }
    return out;
}

int countWaits(const StepList& steps)
{
    int n = 0;
    for (const auto& s : steps)
        n += std::holds_alternative<Wait>(s) ? 1 : 0;
    return n;
}

} // namespace

TEST(ProtocolsTest, LtpLtdAlternatesReadAndWriteWithoutPause)
{
    LtpLtdParams p;
    p.pulseTime = 2;
    const auto steps = ltpLtdSteps(p);

    const std::vector<std::string> expected{
        "LTP_read", "LTP_write", "LTP_read", "LTP_write",
        "LTD_read", "LTD_write", "LTD_read", "LTD_write"};
    EXPECT_EQ(measuredLabels(steps), expected);
    EXPECT_EQ(countWaits(steps), 0);

    const std::vector<double> levels{0.1, 1.0, 0.1, 1.0, 0.1, -1.0, 0.1, -1.0};
    EXPECT_EQ(measuredLevels(steps), levels);

    ASSERT_TRUE(std::holds_alternative<OutputEnable>(steps.front()));
    EXPECT_TRUE(std::get<OutputEnable>(steps.front()).enabled);
    ASSERT_TRUE(std::holds_alternative<OutputEnable>(steps.back()));
    EXPECT_FALSE(std::get<OutputEnable>(steps.back()).enabled);
    // Output stays on between potentiation and depression.
    for (size_t i = 1; i + 1 < steps.size(); ++i)
        EXPECT_FALSE(std::holds_alternative<OutputEnable>(steps[i]));
}

TEST(ProtocolsTest, PairedPulseTurnsOutputOffBetweenPulses)
{
    PairedPulseParams p;
    p.intervals = {0.05};
    p.repetitions = 1;
    p.offTime = 0.001;
    const auto steps = pairedPulseSteps(p);

    ASSERT_EQ(steps.size(), 8u);
    EXPECT_EQ(std::get<Write>(steps[1]).label, "pulse1");
    EXPECT_FALSE(std::get<OutputEnable>(steps[2]).enabled);
    EXPECT_DOUBLE_EQ(std::get<Wait>(steps[3]).durationSec, 0.001);
    EXPECT_TRUE(std::get<OutputEnable>(steps[4]).enabled);
    EXPECT_DOUBLE_EQ(std::get<Wait>(steps[5]).durationSec, 0.05);
    EXPECT_EQ(std::get<Write>(steps[6]).label, "pulse2");
}

TEST(ProtocolsTest, PairedPulseCooldownsSeparateRepetitionsAndIntervals)
{
    PairedPulseParams p;
    p.intervals = {0.01, 0.1};
    p.repetitions = 3;
    p.repetitionCooldown = 1.5;
    p.intervalCooldown = 4.0;
    const auto steps = pairedPulseSteps(p);

    const auto labels = measuredLabels(steps);
    ASSERT_EQ(labels.size(), 12u);
    for (size_t i = 0; i < labels.size(); ++i)
        EXPECT_EQ(labels[i], i % 2 == 0 ? "pulse1" : "pulse2");

    int repCool = 0, intervalCool = 0;
    for (const auto& s : steps)
    {
        if (const auto* w = std::get_if<Wait>(&s))
        {
            repCool += w->durationSec == 1.5 ? 1 : 0;
            intervalCool += w->durationSec == 4.0 ? 1 : 0;
        }
    }
    EXPECT_EQ(repCool, 4);
    EXPECT_EQ(intervalCool, 1);
}

TEST(ProtocolsTest, StdpOrdersSpikesByTimingSign)
{
    StdpParams p;
    p.readNum = 2;
    p.timings = {0.02, -0.05};
    const auto labels = measuredLabels(stdpSteps(p));

    const std::vector<std::string> expected{
        "baseline_read", "baseline_read", "pre_spike",  "post_spike",
        "probe_read",    "probe_read",    "baseline_read", "baseline_read",
        "post_spike",    "pre_spike",     "probe_read", "probe_read"};
    EXPECT_EQ(labels, expected);
}

TEST(ProtocolsTest, StdpSpikePolarity)
{
    StdpParams p;
    p.readNum = 0;
    p.spikeVoltage = 0.7;
    p.timings = {0.1};
    const auto steps = stdpSteps(p);

    ASSERT_EQ(steps.size(), 5u);
    EXPECT_DOUBLE_EQ(std::get<Write>(steps[1]).voltage, 0.7);
    EXPECT_DOUBLE_EQ(std::get<Wait>(steps[2]).durationSec, 0.1);
    EXPECT_DOUBLE_EQ(std::get<Write>(steps[3]).voltage, -0.7);
}

TEST(ProtocolsTest, SrdpLabelsEveryRateGroup)
{
    SrdpParams p;
    p.pulseNum = 2;
    p.spacings = {2.0, 0.5};
    const auto labels = measuredLabels(srdpSteps(p));

    const std::vector<std::string> expected{
        "rate1_read", "rate1_write", "rate1_read", "rate1_write",
        "rate2_read", "rate2_write", "rate2_read", "rate2_write"};
    EXPECT_EQ(labels, expected);
    EXPECT_EQ(srdpReadLabel(10), "rate10_read");
}

TEST(ProtocolsTest, LtmReadsBracketTheWriteTrain)
{
    LtmParams p;
    p.pulseCount = 3;
    p.readCount = 2;
    p.spacings = {1.0, 2.0};
    const auto labels = measuredLabels(ltmSteps(p));

    ASSERT_EQ(labels.size(), 2u + 6u + 2u);
    EXPECT_EQ(labels.front(), "ltm_read");
    EXPECT_EQ(labels[2], "ltm_write");
    EXPECT_EQ(labels[7], "ltm_write");
    EXPECT_EQ(labels.back(), "ltm_read");
}

TEST(ProtocolsTest, SineVoltagesCoverBothHalves)
{
    const auto v = sineVoltages(1.0, 6, 4);
    ASSERT_EQ(v.size(), 2u * 6u * 4u + 1u);
    EXPECT_NEAR(v[3], 1.0, 1e-12);
    EXPECT_NEAR(v[24 + 3], -1.0, 1e-12);
    EXPECT_DOUBLE_EQ(v.back(), 0.0);

    EXPECT_TRUE(sineVoltages(1.0, 0, 4).empty());
    EXPECT_TRUE(sineSteps(SineParams{1.0, 6, 0}).empty());
}

TEST(ProtocolsTest, IvSweepIsTriangular)
{
    const auto steps = ivSweepSteps(IvSweepParams{1.0, 0.25, 0.02});
    const auto levels = measuredLevels(steps);
    const std::vector<double> expected{0.0,  0.25,  0.5,   0.75, 1.0,
                                       0.75, 0.5,   0.25,  0.0,  -0.25,
                                       -0.5, -0.75, -1.0,  -0.75, -0.5,
                                       -0.25, 0.0};
    ASSERT_EQ(levels.size(), expected.size());
    for (size_t i = 0; i < levels.size(); ++i)
        EXPECT_NEAR(levels[i], expected[i], 1e-12) << "point " << i;

    const auto labels = measuredLabels(steps);
    EXPECT_EQ(labels.front(), "iv_forward");
    EXPECT_EQ(labels[5], "iv_reverse");
    EXPECT_EQ(labels.back(), "iv_return");
    EXPECT_DOUBLE_EQ(std::get<Write>(steps[1]).settleSec, 0.02);
}

TEST(ProtocolsTest, IvSweepStepNotDividingRangeEndsOnTheLimits)
{
    const auto levels =
        measuredLevels(ivSweepSteps(IvSweepParams{1.0, 0.3, 0.0}));
    ASSERT_FALSE(levels.empty());
    EXPECT_DOUBLE_EQ(*std::max_element(levels.begin(), levels.end()), 1.0);
    EXPECT_DOUBLE_EQ(*std::min_element(levels.begin(), levels.end()), -1.0);
    EXPECT_DOUBLE_EQ(levels.back(), 0.0);
}

TEST(ProtocolsTest, DegenerateIvSweepIsEmpty)
{
    EXPECT_TRUE(ivSweepSteps(IvSweepParams{1.0, 0.0, 0.01}).empty());
    EXPECT_TRUE(ivSweepSteps(IvSweepParams{0.0, 0.1, 0.01}).empty());
}

TEST(ProtocolsTest, IvSweepRejectsUnboundedPointCounts)
{
    EXPECT_TRUE(ivSweepSteps(IvSweepParams{1.0, 1e-12, 0.01}).empty());
    EXPECT_TRUE(ivSweepSteps(IvSweepParams{1e300, 0.1, 0.01}).empty());
    EXPECT_FALSE(ivSweepSteps(IvSweepParams{1.0, kMinIvStep, 0.0}).empty());
}

} // namespace plasticity::test
