#include "convergence_controller.hpp"

#include "../analysis/loop_metrics.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace plasticity::conv
{

const char* toString(State s)
{
    switch (s)
    {
        case State::Running:
            return "RUNNING";
        case State::Converged:
            return "CONVERGED";
        case State::Exhausted:
            return "EXHAUSTED";
    }
    return "UNKNOWN";
}

ConvergenceController::ConvergenceController(ConvergenceConfig c,
                                             SweepFn fn) :
    cfg(std::move(c)), sweep(std::move(fn)), delay(cfg.sourceDelay)
{
    if (!sweep)
        throw std::invalid_argument("ConvergenceController needs a sweep");

    cfg.stepSizes.erase(std::remove_if(cfg.stepSizes.begin(),
                                       cfg.stepSizes.end(),
                                       [](double s) { return s <= 0.0; }),
                        cfg.stepSizes.end());
    std::sort(cfg.stepSizes.begin(), cfg.stepSizes.end(),
              std::greater<double>());

    cfg.maxAttempts = std::max(1, cfg.maxAttempts);
    cfg.minAttempts = std::clamp(cfg.minAttempts, 1, cfg.maxAttempts);
}

State ConvergenceController::step()
{
    if (current != State::Running)
        return current;

    ++attempt;
    for (double stepSize : cfg.stepSizes)
    {
        const SampleLog log = sweep(stepSize, delay);
        const double freq = analysis::sweepFrequency(log);
        if (freq <= 0.0)
        {
            std::cerr << "[convergence] attempt " << attempt << " step "
                      << stepSize << " V: degenerate sweep ("
                      << log.size() << " samples), skipped\n";
            continue;
        }
        const double area = analysis::loopArea(ivPoints(log.samples()));
        accumulated.push_back(LoopPoint{freq, area, stepSize, delay, attempt});
    }

    std::vector<double> freqs, areas;
    freqs.reserve(accumulated.size());
    areas.reserve(accumulated.size());
    for (const auto& p : accumulated)
    {
        freqs.push_back(p.frequency);
        areas.push_back(p.area);
    }
    fit = analysis::fitGaussian(freqs, areas);
    lastR2 = fit.success ? fit.r2 : 0.0;

    std::cerr << "[convergence] attempt " << attempt << "/" << cfg.maxAttempts
              << " points=" << accumulated.size() << " r2=" << lastR2
              << " delay=" << delay << "s\n";

    if (lastR2 >= cfg.targetR2 && attempt >= cfg.minAttempts)
    {
        current = State::Converged;
    }
    else if (attempt >= cfg.maxAttempts)
    {
        current = State::Exhausted;
    }
    else
    {
        delay = std::min(delay * cfg.delayGrowth, cfg.maxSourceDelay);
    }
    return current;
}

ConvergenceReport ConvergenceController::run()
{
    while (step() == State::Running)
    {
    }

    ConvergenceReport report;
    report.state = current;
    report.attempts = attempt;
    report.r2 = lastR2;
    report.fit = fit;
    report.points = accumulated;
    return report;
}

} // namespace plasticity::conv
