#include "sequencer.hpp"

#include <iostream>

namespace plasticity::exp
{

Sequencer::Sequencer(timeutil::Timebase& c, SourceSettings s) :
    clock(c), settings(s)
{}

SampleLog Sequencer::run(const StepList& steps, port::PortSession& port)
{
    SampleLog log;
    failed = 0;
    if (steps.empty())
        return log;

    try
    {
        port.setCurrentLimit(settings.currentLimit);
        port.setIntegrationCycles(settings.nplc);
    }
    catch (const port::PortError& e)
    {
        std::cerr << "[sequencer] source setup failed: " << e.what() << "\n";
    }
    lastCommanded = port.cached().voltageLevel;

    for (const auto& step : steps)
    {
        if (const auto* r = std::get_if<Read>(&step))
        {
            measureStep(r->voltage, r->label, r->settleSec, port, log);
        }
        else if (const auto* w = std::get_if<Write>(&step))
        {
            measureStep(w->voltage, w->label, w->settleSec, port, log);
        }
        else if (const auto* wait = std::get_if<Wait>(&step))
        {
            clock.sleepFor(wait->durationSec);
        }
        else if (const auto* oe = std::get_if<OutputEnable>(&step))
        {
            try
            {
                port.setOutputEnabled(oe->enabled);
            }
            catch (const port::PortError& e)
            {
                std::cerr << "[sequencer] output "
                          << (oe->enabled ? "on" : "off")
                          << " failed: " << e.what() << "\n";
            }
        }
    }

    log.normalize();
    if (failed > 0)
    {
        std::cerr << "[sequencer] sweep finished with " << failed << " of "
                  << log.size() << " samples degraded\n";
    }
    return log;
}

void Sequencer::measureStep(double voltage, const std::string& label,
                            double settleSec, port::PortSession& port,
                            SampleLog& log)
{
    lastCommanded = voltage;
    try
    {
        port.setVoltageLevel(voltage);
    }
    catch (const port::PortError& e)
    {
        std::cerr << "[sequencer] set level " << voltage
                  << " V failed: " << e.what() << "\n";
    }

    clock.sleepFor(settleSec);

    Sample s;
    s.label = label;
    try
    {
        const auto reading = port.measure();
        s.current = reading.current;
        s.voltage = reading.voltage;
    }
    catch (const port::CommunicationError& e)
    {
        std::cerr << "[sequencer] " << label
                  << ": communication error, sentinel sample: " << e.what()
                  << "\n";
        s.current = 0.0;
        s.voltage = lastCommanded;
        ++failed;
    }
    catch (const port::PortError& e)
    {
        std::cerr << "[sequencer] " << label
                  << ": measurement failed, sentinel sample: " << e.what()
                  << "\n";
        s.current = 0.0;
        s.voltage = lastCommanded;
        ++failed;
    }
    s.timestamp = clock.now();
    log.append(std::move(s));
}

} // namespace plasticity::exp
