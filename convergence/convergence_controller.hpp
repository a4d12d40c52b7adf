#pragma once

#include "../analysis/curve_fit.hpp"
#include "../core/sample_log.hpp"

#include <functional>
#include <vector>

namespace plasticity::conv
{

enum class State
{
    Running,
    Converged,
    Exhausted
};

const char* toString(State s);

struct ConvergenceConfig
{
    std::vector<double> stepSizes{0.1, 0.05, 0.02}; // V, used largest first
    double targetR2{0.98};
    int minAttempts{3};
    int maxAttempts{20};

    // Source delay of the first attempt; after every unconverged attempt it
    // is multiplied by delayGrowth and capped at maxSourceDelay.
    double sourceDelay{0.01};
    double delayGrowth{1.5};
    double maxSourceDelay{1.0};
};

struct LoopPoint
{
    double frequency{};  // Hz
    double area{};       // V*A
    double stepSize{};   // V
    double sourceDelay{}; // s
    int attempt{};
};

struct ConvergenceReport
{
    State state{State::Running};
    int attempts{};
    double r2{};
    analysis::FitResult fit; // last fit, even when exhausted
    std::vector<LoopPoint> points;
};

// Runs one IV sweep at the given step size and source delay.
using SweepFn =
    std::function<SampleLog(double stepSize, double sourceDelaySec)>;

// Repeats IV sweeps over the configured step sizes until the Gaussian fit of
// loop area against sweep frequency reaches the target R^2 (never before
// minAttempts) or maxAttempts is used up. Both outcomes are terminal.
class ConvergenceController
{
  public:
    ConvergenceController(ConvergenceConfig cfg, SweepFn sweep);

    // Run one attempt. Does nothing once terminal.
    State step();

    // Run attempts until a terminal state.
    ConvergenceReport run();

    State state() const
    {
        return current;
    }

    int attempts() const
    {
        return attempt;
    }

    double r2() const
    {
        return lastR2;
    }

    const analysis::FitResult& lastFit() const
    {
        return fit;
    }

    const std::vector<LoopPoint>& points() const
    {
        return accumulated;
    }

    double sourceDelay() const
    {
        return delay;
    }

  private:
    ConvergenceConfig cfg;
    SweepFn sweep;
    State current{State::Running};
    int attempt{0};
    double delay;
    double lastR2{0.0};
    analysis::FitResult fit;
    std::vector<LoopPoint> accumulated;
};

} // namespace plasticity::conv
