#pragma once

#include "port.hpp"
#include "time_utils.hpp"

#include <random>

namespace plasticity::port
{

// Behavioral memristor model used for dry runs and end-to-end tests.
//
// Above the switching threshold the non-volatile conductance g drifts toward
// gMax (positive bias) or gMin (negative bias) at a rate proportional to the
// overdrive. Every supra-threshold positive pulse also adds a volatile
// component that relaxes with time constant stpTau, which is what produces
// paired-pulse facilitation.
struct DeviceModel
{
    double gMin{1e-10};      // S
    double gMax{1e-8};       // S
    double gInitial{1e-9};   // S
    double threshold{0.3};   // V
    double rate{5.0};        // 1/(V*s)
    double stpGain{0.2};     // fraction of headroom per pulse
    double stpTau{0.1};      // s
    double noiseRel{0.0};    // relative gaussian current noise
    unsigned seed{1};
};

class SimulatedPort : public SourceMeasurePort
{
  public:
    SimulatedPort(timeutil::Timebase& clock, DeviceModel model = {});

    void setOutputEnabled(bool enabled) override;
    void setVoltageLevel(double volts) override;
    void setCurrentLimit(double amps) override;
    void setIntegrationCycles(double nplc) override;
    Reading measure() override;
    PortState queryState() override;

    double conductance() const
    {
        return g + gs;
    }

  private:
    void integrate();
    double appliedVoltage() const;

    timeutil::Timebase& clock;
    DeviceModel m;
    PortState state;
    double g;
    double gs{0.0};
    double lastT;
    std::mt19937 rng;
};

} // namespace plasticity::port
