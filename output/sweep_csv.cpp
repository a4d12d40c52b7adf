#include "sweep_csv.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>

namespace plasticity::output
{

namespace fs = std::filesystem;

namespace
{

std::optional<fs::path> openUnique(const fs::path& dir,
                                   const std::string& stem,
                                   std::ofstream& file)
{
    try
    {
        fs::create_directories(dir);
    }
    catch (const fs::filesystem_error& e)
    {
        std::cerr << "[output] Error creating dir: " << e.what() << "\n";
        return std::nullopt;
    }

    const fs::path path = uniquePath(dir, stem);
    file.open(path, std::ios::out | std::ios::trunc);
    if (!file.is_open())
    {
        std::cerr << "[output] Failed to open: " << path << "\n";
        return std::nullopt;
    }
    file << std::setprecision(10);
    return path;
}

std::optional<fs::path> finish(std::ofstream& file, const fs::path& path)
{
    file.flush();
    if (!file.good())
    {
        std::cerr << "[output] Write failed: " << path << "\n";
        return std::nullopt;
    }
    std::cerr << "[output] Saved " << path << "\n";
    return path;
}

} // namespace

fs::path uniquePath(const fs::path& dir, const std::string& stem,
                    const std::string& ext)
{
    fs::path candidate = dir / (stem + ext);
    for (int idx = 1; fs::exists(candidate); ++idx)
        candidate = dir / (stem + "_" + std::to_string(idx) + ext);
    return candidate;
}

std::optional<fs::path> writeSweepCsv(const fs::path& dir,
                                      const std::string& stem,
                                      const SampleLog& log, bool withLabel)
{
    std::ofstream file;
    const auto path = openUnique(dir, stem, file);
    if (!path)
        return std::nullopt;

    file << "Time(s),Voltage(V),Current(A)" << (withLabel ? ",Label" : "")
         << "\n";
    for (const auto& s : log)
    {
        file << s.timestamp << "," << s.voltage << "," << s.current;
        if (withLabel)
            file << "," << s.label;
        file << "\n";
    }
    return finish(file, *path);
}

std::optional<fs::path> writePointsCsv(const fs::path& dir,
                                       const std::string& stem,
                                       const std::string& xHeader,
                                       const std::string& yHeader,
                                       const std::vector<Point>& points)
{
    std::ofstream file;
    const auto path = openUnique(dir, stem, file);
    if (!path)
        return std::nullopt;

    file << xHeader << "," << yHeader << "\n";
    for (const auto& [x, y] : points)
        file << x << "," << y << "\n";
    return finish(file, *path);
}

} // namespace plasticity::output
