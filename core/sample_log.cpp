#include "sample_log.hpp"

#include "numeric.hpp"

namespace plasticity
{

void SampleLog::append(Sample sample)
{
    items.push_back(std::move(sample));
}

std::vector<Sample> SampleLog::filter(const std::string& labelSubstring) const
{
    const std::string needle = numeric::toLower(labelSubstring);
    std::vector<Sample> out;
    for (const auto& s : items)
    {
        if (numeric::toLower(s.label).find(needle) != std::string::npos)
            out.push_back(s);
    }
    return out;
}

void SampleLog::normalize()
{
    if (items.empty())
        return;
    const double t0 = items.front().timestamp;
    if (t0 == 0.0)
        return;
    for (auto& s : items)
        s.timestamp -= t0;
}

std::vector<Point> ivPoints(const std::vector<Sample>& samples)
{
    std::vector<Point> out;
    out.reserve(samples.size());
    for (const auto& s : samples)
        out.emplace_back(s.voltage, s.current);
    return out;
}

std::vector<Point> timeCurrentPoints(const std::vector<Sample>& samples)
{
    std::vector<Point> out;
    out.reserve(samples.size());
    for (const auto& s : samples)
        out.emplace_back(s.timestamp, s.current);
    return out;
}

std::vector<double> currents(const std::vector<Sample>& samples)
{
    std::vector<double> out;
    out.reserve(samples.size());
    for (const auto& s : samples)
        out.push_back(s.current);
    return out;
}

std::vector<double> timestamps(const std::vector<Sample>& samples)
{
    std::vector<double> out;
    out.reserve(samples.size());
    for (const auto& s : samples)
        out.push_back(s.timestamp);
    return out;
}

} // namespace plasticity
