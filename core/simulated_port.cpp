#include "simulated_port.hpp"

#include <algorithm>
#include <cmath>

namespace plasticity::port
{

SimulatedPort::SimulatedPort(timeutil::Timebase& c, DeviceModel model) :
    clock(c), m(model), g(std::clamp(model.gInitial, model.gMin, model.gMax)),
    lastT(c.now()), rng(model.seed)
{}

double SimulatedPort::appliedVoltage() const
{
    return state.outputEnabled ? state.voltageLevel : 0.0;
}

// Advance the device state from the last event to now under the bias that was
// applied in between.
void SimulatedPort::integrate()
{
    const double t = clock.now();
    const double dt = std::max(0.0, t - lastT);
    lastT = t;
    if (dt <= 0.0)
        return;

    const double v = appliedVoltage();
    const double over = std::abs(v) - m.threshold;
    if (over > 0.0)
    {
        const double k = std::exp(-m.rate * over * dt);
        if (v > 0.0)
            g = m.gMax - (m.gMax - g) * k;
        else
            g = m.gMin + (g - m.gMin) * k;
    }

    if (m.stpTau > 0.0)
        gs *= std::exp(-dt / m.stpTau);
}

void SimulatedPort::setOutputEnabled(bool enabled)
{
    integrate();
    state.outputEnabled = enabled;
}

void SimulatedPort::setVoltageLevel(double volts)
{
    integrate();
    state.voltageLevel = volts;
    if (state.outputEnabled && volts > m.threshold)
        gs += m.stpGain * std::max(0.0, m.gMax - g - gs);
}

void SimulatedPort::setCurrentLimit(double amps)
{
    state.currentLimit = std::abs(amps);
}

void SimulatedPort::setIntegrationCycles(double nplc)
{
    state.integrationCycles = nplc;
}

Reading SimulatedPort::measure()
{
    integrate();
    const double v = appliedVoltage();
    double i = (g + gs) * v;
    if (m.noiseRel > 0.0)
    {
        std::normal_distribution<double> noise(0.0, m.noiseRel);
        i *= 1.0 + noise(rng);
    }
    if (state.currentLimit > 0.0)
        i = std::clamp(i, -state.currentLimit, state.currentLimit);
    return Reading{i, v};
}

PortState SimulatedPort::queryState()
{
    return state;
}

} // namespace plasticity::port
