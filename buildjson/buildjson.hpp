#pragma once

#include "../convergence/convergence_controller.hpp"
#include "../experiment/protocols.hpp"

#include <optional>
#include <string>

namespace plasticity
{

struct BasicSettings
{
    std::string outputDir{"./plasticity-data"};
    std::string sessionLog; // empty -> stderr only
    double currentLimit{1e-7}; // A, source compliance
    double nplc{1.0};
    bool writeLabels{true}; // add the Label column to raw sweep CSVs
    bool simulate{true};    // drive the built-in device model
};

// Common switches of every experiment entry.
struct ExperimentSwitch
{
    int priority{};
    bool enabled{true};
};

struct LtpLtdExperimentCfg : ExperimentSwitch
{
    exp::LtpLtdParams params;
};

struct PairedPulseExperimentCfg : ExperimentSwitch
{
    exp::PairedPulseParams params;
};

struct StdpExperimentCfg : ExperimentSwitch
{
    exp::StdpParams params;
};

struct SrdpExperimentCfg : ExperimentSwitch
{
    exp::SrdpParams params;
};

struct LtmExperimentCfg : ExperimentSwitch
{
    exp::LtmParams params;
};

struct SineExperimentCfg : ExperimentSwitch
{
    exp::SineParams params;
};

struct IvConvergenceExperimentCfg : ExperimentSwitch
{
    double vMax{1.0};
    conv::ConvergenceConfig convergence;
};

struct Config
{
    BasicSettings basic;

    std::optional<LtpLtdExperimentCfg> ltpLtd;
    std::optional<PairedPulseExperimentCfg> pairedPulse;
    std::optional<StdpExperimentCfg> stdp;
    std::optional<SrdpExperimentCfg> srdp;
    std::optional<LtmExperimentCfg> ltm;
    std::optional<SineExperimentCfg> sine;
    std::optional<IvConvergenceExperimentCfg> ivConvergence;
};

// Load from file (JSON). Throws std::runtime_error when the file cannot be
// read or is not valid JSON. Individual fields that do not parse are
// reported and replaced by their defaults.
Config loadConfigFromJsonFile(const std::string& jsonPath);

// Every experiment enabled with its default parameters, in priority order
// ltpltd, ppf, stdp, srdp, ltm, sine, ivconvergence.
Config defaultConfig();

} // namespace plasticity
