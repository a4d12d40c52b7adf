#pragma once

#include <string>
#include <variant>
#include <vector>

namespace plasticity::exp
{

// Set the level, hold `settleSec`, measure once.
struct Read
{
    double voltage{};
    std::string label;
    double settleSec{};
};

struct Write
{
    double voltage{};
    std::string label;
    double settleSec{};
};

// Blocking hold.
struct Wait
{
    double durationSec{};
};

struct OutputEnable
{
    bool enabled{};
};

using Step = std::variant<Read, Write, Wait, OutputEnable>;
using StepList = std::vector<Step>;

} // namespace plasticity::exp
