#include "buildjson.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace j = nlohmann;

namespace plasticity
{

namespace
{

void reportInvalid(const char* key, const std::string& why)
{
    std::cerr << "[plasticity] config: invalid '" << key << "' (" << why
              << "), using default\n";
}

void reportStep(const char* key, double value)
{
    std::cerr << "[plasticity] config: invalid '" << key << "' entry " << value
              << " (below " << exp::kMinIvStep << " V), dropped\n";
}

template <typename T>
T readOr(const j::json& obj, const char* key, T def)
{
    auto it = obj.find(key);
    if (it == obj.end())
        return def;
    try
    {
        return it->get<T>();
    }
    catch (const j::json::exception& e)
    {
        reportInvalid(key, e.what());
        return def;
    }
}

double readDouble(const j::json& obj, const char* key, double def)
{
    const double v = readOr<double>(obj, key, def);
    if (!std::isfinite(v))
    {
        reportInvalid(key, "not finite");
        return def;
    }
    return v;
}

// Durations, amplitudes and limits that must not be negative.
double readNonNegative(const j::json& obj, const char* key, double def)
{
    const double v = readDouble(obj, key, def);
    if (v < 0.0)
    {
        reportInvalid(key, "negative");
        return def;
    }
    return v;
}

int readCount(const j::json& obj, const char* key, int def)
{
    const int v = readOr<int>(obj, key, def);
    if (v < 0)
    {
        reportInvalid(key, "negative");
        return def;
    }
    return v;
}

std::vector<double> readList(const j::json& obj, const char* key,
                             const std::vector<double>& def)
{
    auto v = readOr<std::vector<double>>(obj, key, def);
    for (double d : v)
    {
        if (!std::isfinite(d))
        {
            reportInvalid(key, "not finite");
            return def;
        }
    }
    return v;
}

// IV step sizes; entries below kMinIvStep are dropped.
std::vector<double> readStepSizes(const j::json& obj, const char* key,
                                  const std::vector<double>& def)
{
    std::vector<double> out;
    for (double s : readList(obj, key, def))
    {
        if (s < exp::kMinIvStep)
        {
            reportStep(key, s);
            continue;
        }
        out.push_back(s);
    }
    return out;
}

void readSwitch(const j::json& e, ExperimentSwitch& sw, int defPriority)
{
    sw.priority = readOr<int>(e, "priority", defPriority);
    sw.enabled = readOr<bool>(e, "enable", true);
}

LtpLtdExperimentCfg parseLtpLtd(const j::json& e)
{
    LtpLtdExperimentCfg cfg{};
    readSwitch(e, cfg, 1);
    auto& p = cfg.params;
    p.pulseTime = readCount(e, "pulsetime", p.pulseTime);
    p.pulseWidth = readNonNegative(e, "pulsewidth", p.pulseWidth);
    p.readVoltage = readDouble(e, "readvoltage", p.readVoltage);
    p.writePVoltage = readDouble(e, "writepvoltage", p.writePVoltage);
    p.writeDVoltage = readDouble(e, "writedvoltage", p.writeDVoltage);
    return cfg;
}

PairedPulseExperimentCfg parsePairedPulse(const j::json& e)
{
    PairedPulseExperimentCfg cfg{};
    readSwitch(e, cfg, 2);
    auto& p = cfg.params;
    p.pulseVoltage = readDouble(e, "pulsevoltage", p.pulseVoltage);
    p.pulseWidth = readNonNegative(e, "pulsewidth", p.pulseWidth);
    p.offTime = readNonNegative(e, "offtime", p.offTime);
    p.intervals = readList(e, "intervals", p.intervals);
    p.repetitions = readCount(e, "repetitions", p.repetitions);
    p.repetitionCooldown =
        readNonNegative(e, "repetitioncooldown", p.repetitionCooldown);
    p.intervalCooldown =
        readNonNegative(e, "intervalcooldown", p.intervalCooldown);
    return cfg;
}

StdpExperimentCfg parseStdp(const j::json& e)
{
    StdpExperimentCfg cfg{};
    readSwitch(e, cfg, 3);
    auto& p = cfg.params;
    p.readVoltage = readDouble(e, "readvoltage", p.readVoltage);
    p.readNum = readCount(e, "readnum", p.readNum);
    p.spikeVoltage = readDouble(e, "spikevoltage", p.spikeVoltage);
    p.pulseWidth = readNonNegative(e, "pulsewidth", p.pulseWidth);
    p.timings = readList(e, "timings", p.timings);
    p.rest = readNonNegative(e, "rest", p.rest);
    return cfg;
}

SrdpExperimentCfg parseSrdp(const j::json& e)
{
    SrdpExperimentCfg cfg{};
    readSwitch(e, cfg, 4);
    auto& p = cfg.params;
    p.readVoltage = readDouble(e, "readvoltage", p.readVoltage);
    p.writeVoltage = readDouble(e, "writevoltage", p.writeVoltage);
    p.pulseWidth = readNonNegative(e, "pulsewidth", p.pulseWidth);
    p.pulseNum = readCount(e, "pulsenum", p.pulseNum);
    p.offTime = readNonNegative(e, "offtime", p.offTime);
    p.spacings = readList(e, "spacings", p.spacings);
    return cfg;
}

LtmExperimentCfg parseLtm(const j::json& e)
{
    LtmExperimentCfg cfg{};
    readSwitch(e, cfg, 5);
    auto& p = cfg.params;
    p.readVoltage = readDouble(e, "readvoltage", p.readVoltage);
    p.writeVoltage = readDouble(e, "writevoltage", p.writeVoltage);
    p.pulseWidth = readNonNegative(e, "pulsewidth", p.pulseWidth);
    p.offTime = readNonNegative(e, "offtime", p.offTime);
    p.pulseCount = readCount(e, "pulsecount", p.pulseCount);
    p.readCount = readCount(e, "readcount", p.readCount);
    p.spacings = readList(e, "spacings", p.spacings);
    return cfg;
}

SineExperimentCfg parseSine(const j::json& e)
{
    SineExperimentCfg cfg{};
    readSwitch(e, cfg, 6);
    auto& p = cfg.params;
    p.amplitude = readDouble(e, "amplitude", p.amplitude);
    p.pointsPerHalf = readCount(e, "pointsperhalf", p.pointsPerHalf);
    p.cycles = readCount(e, "cycles", p.cycles);
    p.pulseWidth = readNonNegative(e, "pulsewidth", p.pulseWidth);
    p.offTime = readNonNegative(e, "offtime", p.offTime);
    p.peakTolerance = readNonNegative(e, "peaktolerance", p.peakTolerance);
    return cfg;
}

IvConvergenceExperimentCfg parseIvConvergence(const j::json& e)
{
    IvConvergenceExperimentCfg cfg{};
    readSwitch(e, cfg, 7);
    auto& c = cfg.convergence;
    cfg.vMax = readNonNegative(e, "vmax", cfg.vMax);
    c.stepSizes = readStepSizes(e, "stepsizes", c.stepSizes);
    c.sourceDelay = readNonNegative(e, "sourcedelay", c.sourceDelay);
    c.delayGrowth = readNonNegative(e, "delaygrowth", c.delayGrowth);
    c.maxSourceDelay = readNonNegative(e, "maxsourcedelay", c.maxSourceDelay);
    c.targetR2 = readDouble(e, "targetr2", c.targetR2);
    c.minAttempts = readCount(e, "minattempts", c.minAttempts);
    c.maxAttempts = readCount(e, "maxattempts", c.maxAttempts);
    return cfg;
}

} // namespace

Config loadConfigFromJsonFile(const std::string& jsonPath)
{
    std::ifstream ifs(jsonPath);
    if (!ifs.good())
    {
        throw std::runtime_error("Cannot open config file: " + jsonPath);
    }

    j::json root;
    try
    {
        root = j::json::parse(ifs);
    }
    catch (const j::json::parse_error& e)
    {
        throw std::runtime_error("Malformed config file " + jsonPath + ": " +
                                 e.what());
    }

    Config out{};

    // ===== basic settings =====
    if (root.contains("basic settings") && root["basic settings"].is_array() &&
        !root["basic settings"].empty())
    {
        const auto& basic = root["basic settings"].at(0);
        auto& b = out.basic;
        b.outputDir = readOr<std::string>(basic, "outputdir", b.outputDir);
        b.sessionLog = readOr<std::string>(basic, "sessionlog", b.sessionLog);
        b.currentLimit = readNonNegative(basic, "currentlimit", b.currentLimit);
        b.nplc = readNonNegative(basic, "nplc", b.nplc);
        b.writeLabels = readOr<bool>(basic, "writelabels", b.writeLabels);
        b.simulate = readOr<bool>(basic, "simulate", b.simulate);
    }
    else
    {
        std::cerr << "[plasticity] config: no basic settings, using defaults\n";
    }

    // ===== experiments =====
    if (root.contains("experiment") && root["experiment"].is_array())
    {
        for (const auto& e : root["experiment"])
        {
            if (!e.is_object())
                continue;
            const std::string type = readOr<std::string>(e, "type", "");
            if (type == "ltpltd")
                out.ltpLtd = parseLtpLtd(e);
            else if (type == "ppf" || type == "ppd")
                out.pairedPulse = parsePairedPulse(e);
            else if (type == "stdp")
                out.stdp = parseStdp(e);
            else if (type == "srdp")
                out.srdp = parseSrdp(e);
            else if (type == "ltm")
                out.ltm = parseLtm(e);
            else if (type == "sine")
                out.sine = parseSine(e);
            else if (type == "ivconvergence")
                out.ivConvergence = parseIvConvergence(e);
            else
                std::cerr << "[plasticity] config: unknown experiment type '"
                          << type << "' ignored\n";
        }
    }

    return out;
}

Config defaultConfig()
{
    const j::json empty = j::json::object();
    Config out{};
    out.ltpLtd = parseLtpLtd(empty);
    out.pairedPulse = parsePairedPulse(empty);
    out.stdp = parseStdp(empty);
    out.srdp = parseSrdp(empty);
    out.ltm = parseLtm(empty);
    out.sine = parseSine(empty);
    out.ivConvergence = parseIvConvergence(empty);
    return out;
}

} // namespace plasticity
