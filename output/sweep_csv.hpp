#pragma once

#include "../core/sample_log.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace plasticity::output
{

// dir/stem+ext, or dir/stem_N+ext with the smallest N >= 1 that is free.
std::filesystem::path uniquePath(const std::filesystem::path& dir,
                                 const std::string& stem,
                                 const std::string& ext = ".csv");

// Raw sweep: "Time(s),Voltage(V),Current(A)" plus ",Label" when requested.
// Creates `dir` if needed and never overwrites. Returns the written path, or
// nullopt after logging when the file could not be written.
std::optional<std::filesystem::path> writeSweepCsv(
    const std::filesystem::path& dir, const std::string& stem,
    const SampleLog& log, bool withLabel = true);

// Two-column derived data (e.g. "Delta_t,Delta_g"), same naming rules.
std::optional<std::filesystem::path> writePointsCsv(
    const std::filesystem::path& dir, const std::string& stem,
    const std::string& xHeader, const std::string& yHeader,
    const std::vector<Point>& points);

} // namespace plasticity::output
