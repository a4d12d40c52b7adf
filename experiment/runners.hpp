#pragma once

#include "../analysis/plasticity.hpp"
#include "../buildjson/buildjson.hpp"
#include "../convergence/convergence_controller.hpp"
#include "../core/port.hpp"
#include "../core/time_utils.hpp"

namespace plasticity::exp
{

// What every experiment run needs from the session. The port is exclusively
// owned by the session; runs are strictly sequential.
struct SessionContext
{
    const BasicSettings& basic;
    port::PortSession& port;
    timeutil::Timebase& clock;
};

// Each run executes its sweep(s), writes the raw CSV and the derived CSVs to
// basic.outputDir, reports milestones and returns the analysis summary.
analysis::LtpLtdSummary runLtpLtd(SessionContext& ctx,
                                  const LtpLtdExperimentCfg& cfg);
analysis::PairedPulseSummary runPairedPulse(
    SessionContext& ctx, const PairedPulseExperimentCfg& cfg);
analysis::StdpSummary runStdp(SessionContext& ctx,
                              const StdpExperimentCfg& cfg);
analysis::SrdpSummary runSrdp(SessionContext& ctx,
                              const SrdpExperimentCfg& cfg);
analysis::LtmSummary runLtm(SessionContext& ctx, const LtmExperimentCfg& cfg);
analysis::SineSummary runSine(SessionContext& ctx,
                              const SineExperimentCfg& cfg);
conv::ConvergenceReport runIvConvergence(
    SessionContext& ctx, const IvConvergenceExperimentCfg& cfg);

} // namespace plasticity::exp
