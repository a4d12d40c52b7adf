#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <vector>

namespace plasticity::numeric
{

// Below this magnitude a reference current is treated as zero.
inline constexpr double kCurrentFloor = 1e-20;

inline double mean(const std::vector<double>& v)
{
    if (v.empty())
        return 0.0;
    double sum = 0.0;
    for (double x : v)
        sum += x;
    return sum / static_cast<double>(v.size());
}

inline std::string toLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

// Conductance from a read sample; zero read voltage gives 0.
inline double conductance(double current, double readVoltage)
{
    if (std::abs(readVoltage) < 1e-12)
        return 0.0;
    return current / readVoltage;
}

} // namespace plasticity::numeric
