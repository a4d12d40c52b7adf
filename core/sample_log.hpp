#pragma once

#include <string>
#include <utility>
#include <vector>

namespace plasticity
{

// One measurement event. Timestamps are seconds relative to sweep start.
struct Sample
{
    double timestamp{};
    double voltage{};
    double current{};
    std::string label;
};

using Point = std::pair<double, double>;

// Append-only store for the samples of one sweep.
class SampleLog
{
  public:
    void append(Sample sample);

    // Samples whose label contains `labelSubstring` (case-insensitive), in
    // their original order. An empty substring matches every sample.
    std::vector<Sample> filter(const std::string& labelSubstring) const;

    // Shift every timestamp so the first sample sits at 0. Idempotent.
    void normalize();

    const std::vector<Sample>& samples() const
    {
        return items;
    }

    size_t size() const
    {
        return items.size();
    }

    bool empty() const
    {
        return items.empty();
    }

    const Sample& operator[](size_t i) const
    {
        return items[i];
    }

    std::vector<Sample>::const_iterator begin() const
    {
        return items.begin();
    }

    std::vector<Sample>::const_iterator end() const
    {
        return items.end();
    }

  private:
    std::vector<Sample> items;
};

// (voltage, current) pairs in sample order.
std::vector<Point> ivPoints(const std::vector<Sample>& samples);

// (timestamp, current) pairs in sample order.
std::vector<Point> timeCurrentPoints(const std::vector<Sample>& samples);

std::vector<double> currents(const std::vector<Sample>& samples);
std::vector<double> timestamps(const std::vector<Sample>& samples);

} // namespace plasticity
