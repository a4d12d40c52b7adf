#pragma once

#include "../core/port.hpp"
#include "../core/sample_log.hpp"
#include "../core/time_utils.hpp"
#include "protocol_step.hpp"

#include <string>

namespace plasticity::exp
{

// Source configuration applied once at sweep start.
struct SourceSettings
{
    double currentLimit{1e-7}; // A
    double nplc{1.0};
};

// Executes a step list against a port, one command at a time, blocking on
// every hold. A sweep always runs to completion: port failures degrade the
// affected sample to a sentinel and are counted, never rethrown.
class Sequencer
{
  public:
    explicit Sequencer(timeutil::Timebase& clock, SourceSettings settings = {});

    SampleLog run(const StepList& steps, port::PortSession& port);

    // Sentinel samples recorded by the last run().
    int failedSamples() const
    {
        return failed;
    }

  private:
    void measureStep(double voltage, const std::string& label,
                     double settleSec, port::PortSession& port,
                     SampleLog& log);

    timeutil::Timebase& clock;
    SourceSettings settings;
    double lastCommanded{0.0};
    int failed{0};
};

} // namespace plasticity::exp
