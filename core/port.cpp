#include "port.hpp"

namespace plasticity::port
{

PortSession::PortSession(std::unique_ptr<SourceMeasurePort> p) :
    port(std::move(p))
{
    if (!port)
        throw std::invalid_argument("PortSession requires a port");
}

// The cache only changes after the instrument accepted the command.
void PortSession::setOutputEnabled(bool enabled)
{
    port->setOutputEnabled(enabled);
    state.outputEnabled = enabled;
}

void PortSession::setVoltageLevel(double volts)
{
    port->setVoltageLevel(volts);
    state.voltageLevel = volts;
}

void PortSession::setCurrentLimit(double amps)
{
    port->setCurrentLimit(amps);
    state.currentLimit = amps;
}

void PortSession::setIntegrationCycles(double nplc)
{
    port->setIntegrationCycles(nplc);
    state.integrationCycles = nplc;
}

Reading PortSession::measure()
{
    return port->measure();
}

const PortState& PortSession::refresh()
{
    state = port->queryState();
    return state;
}

} // namespace plasticity::port
