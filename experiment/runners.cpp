#include "runners.hpp"

#include "../core/logging.hpp"
#include "../output/sweep_csv.hpp"
#include "protocols.hpp"
#include "sequencer.hpp"

#include <iostream>
#include <sstream>

namespace plasticity::exp
{

namespace
{

SampleLog runSweep(SessionContext& ctx, const StepList& steps)
{
    Sequencer seq(ctx.clock,
                  SourceSettings{ctx.basic.currentLimit, ctx.basic.nplc});
    return seq.run(steps, ctx.port);
}

void saveRaw(SessionContext& ctx, const std::string& stem,
             const SampleLog& log)
{
    output::writeSweepCsv(ctx.basic.outputDir, stem, log,
                          ctx.basic.writeLabels);
}

void note(SessionContext& ctx, const std::ostringstream& oss)
{
    log::milestone(ctx.basic.sessionLog, oss.str());
}

std::string describeFit(const analysis::FitResult& fit)
{
    if (!fit.success)
        return "no fit";
    std::ostringstream oss;
    oss << "params=[";
    for (size_t i = 0; i < fit.params.size(); ++i)
        oss << (i ? "," : "") << fit.params[i];
    oss << "] r2=" << fit.r2;
    return oss.str();
}

} // namespace

analysis::LtpLtdSummary runLtpLtd(SessionContext& ctx,
                                  const LtpLtdExperimentCfg& cfg)
{
    const auto& p = cfg.params;
    const SampleLog log = runSweep(ctx, ltpLtdSteps(p));
    saveRaw(ctx, "ltpltd_raw_data", log);

    auto s = analysis::summarizeLtpLtd(log, p.readVoltage);
    output::writePointsCsv(ctx.basic.outputDir, "ltpltd_ltp_conductance",
                           "Time(s)", "Conductance(S)", s.ltpConductance);
    output::writePointsCsv(ctx.basic.outputDir, "ltpltd_ltd_conductance",
                           "Time(s)", "Conductance(S)", s.ltdConductance);

    std::ostringstream oss;
    oss << "LTP/LTD: samples=" << log.size()
        << " potentiation=" << s.potentiation.ratio
        << (s.potentiation.valid ? "" : " (undefined)")
        << " depression=" << s.depression.ratio
        << (s.depression.valid ? "" : " (undefined)");
    note(ctx, oss);
    return s;
}

analysis::PairedPulseSummary runPairedPulse(
    SessionContext& ctx, const PairedPulseExperimentCfg& cfg)
{
    const auto& p = cfg.params;
    const SampleLog log = runSweep(ctx, pairedPulseSteps(p));
    saveRaw(ctx, "ppf_raw_data", log);

    auto s = analysis::summarizePairedPulse(log, p.intervals, p.repetitions);

    std::vector<Point> ratios;
    for (const auto& ir : s.intervals)
    {
        if (ir.validPairs > 0)
            ratios.emplace_back(ir.interval, ir.meanRatio);
    }
    output::writePointsCsv(ctx.basic.outputDir, "ppf_ratio", "Interval(s)",
                           "PPF_Ratio", ratios);

    std::ostringstream oss;
    oss << "PPF/PPD: intervals=" << s.intervals.size();
    for (const auto& ir : s.intervals)
    {
        oss << " [" << ir.interval << "s " << ir.meanRatio
            << (ir.isFacilitation ? " PPF" : " PPD") << "]";
    }
    oss << " decay: " << describeFit(s.decay);
    note(ctx, oss);
    return s;
}

analysis::StdpSummary runStdp(SessionContext& ctx, const StdpExperimentCfg& cfg)
{
    const auto& p = cfg.params;
    const SampleLog log = runSweep(ctx, stdpSteps(p));
    saveRaw(ctx, "stdp_raw_data", log);

    auto s = analysis::summarizeStdp(log, p.readNum);
    output::writePointsCsv(ctx.basic.outputDir, "stdp_delta", "Delta_t",
                           "Delta_g", s.window);

    std::ostringstream oss;
    oss << "STDP: points=" << s.window.size()
        << " pre-before-post: " << describeFit(s.potentiationFit)
        << " post-before-pre: " << describeFit(s.depressionFit);
    note(ctx, oss);
    return s;
}

analysis::SrdpSummary runSrdp(SessionContext& ctx, const SrdpExperimentCfg& cfg)
{
    const auto& p = cfg.params;
    const SampleLog log = runSweep(ctx, srdpSteps(p));
    saveRaw(ctx, "srdp_raw_data", log);

    auto s = analysis::summarizeSrdp(log, p.readVoltage,
                                     static_cast<int>(p.spacings.size()));
    output::writePointsCsv(ctx.basic.outputDir, "srdp_conductance", "Time(s)",
                           "Conductance(S)", s.conductance);

    std::ostringstream oss;
    oss << "SRDP: reads=" << s.conductance.size();
    for (size_t i = 0; i < s.groups.size() && i < p.spacings.size(); ++i)
    {
        oss << " [space " << p.spacings[i] << "s change "
            << s.groups[i].change.ratio << "]";
    }
    note(ctx, oss);
    return s;
}

analysis::LtmSummary runLtm(SessionContext& ctx, const LtmExperimentCfg& cfg)
{
    const auto& p = cfg.params;
    const SampleLog log = runSweep(ctx, ltmSteps(p));
    saveRaw(ctx, "srdp_ltm_raw_data", log);

    auto s = analysis::summarizeLtm(log, p.readVoltage, p.readCount);
    output::writePointsCsv(ctx.basic.outputDir, "srdp_ltm_conductance",
                           "Time(s)", "Conductance(S)", s.conductance);

    std::ostringstream oss;
    oss << "LTM: retention=" << s.retention.ratio
        << (s.retention.valid ? "" : " (undefined)");
    note(ctx, oss);
    return s;
}

analysis::SineSummary runSine(SessionContext& ctx, const SineExperimentCfg& cfg)
{
    const auto& p = cfg.params;
    const SampleLog log = runSweep(ctx, sineSteps(p));

    auto s = analysis::summarizeSine(log, p.amplitude, p.peakTolerance);
    saveRaw(ctx, s.memristorType + "_sine_raw_data", log);

    std::ostringstream oss;
    oss << "Sine: type=" << s.memristorType
        << " r2_pos=" << s.positiveFit.r2 << " r2_neg=" << s.negativeFit.r2;
    note(ctx, oss);
    return s;
}

conv::ConvergenceReport runIvConvergence(SessionContext& ctx,
                                         const IvConvergenceExperimentCfg& cfg)
{
    auto sweep = [&ctx, &cfg](double stepSize, double sourceDelay) {
        const SampleLog log =
            runSweep(ctx, ivSweepSteps({cfg.vMax, stepSize, sourceDelay}));
        saveRaw(ctx, "iv_sweep_raw_data", log);

        const auto iv = analysis::summarizeIvSweep(log);
        std::cerr << "[plasticity] IV step=" << stepSize
                  << "V area=" << iv.loopArea << " freq=" << iv.frequency
                  << "Hz crossings=" << iv.intersections.points.size()
                  << "\n";
        return log;
    };

    conv::ConvergenceController controller(cfg.convergence, sweep);
    auto report = controller.run();

    std::vector<Point> loop;
    for (const auto& pt : report.points)
        loop.emplace_back(pt.frequency, pt.area);
    output::writePointsCsv(ctx.basic.outputDir, "iv_loop_area", "Frequency(Hz)",
                           "LoopArea(VA)", loop);

    std::ostringstream oss;
    oss << "IV convergence: " << conv::toString(report.state)
        << " attempts=" << report.attempts << " r2=" << report.r2
        << " gaussian: " << describeFit(report.fit);
    note(ctx, oss);
    return report;
}

} // namespace plasticity::exp
