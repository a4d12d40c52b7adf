#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace plasticity::log
{

inline std::string nowIso()
{
    using namespace std::chrono;
    auto t = system_clock::now();
    std::time_t tt = system_clock::to_time_t(t);
    std::tm tm = *std::gmtime(&tt);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Append a timestamped line to the given path, creating directories as needed.
inline void appendLine(const std::string& path, const std::string& line)
{
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent);
    std::ofstream f(path, std::ios::app);
    f << nowIso() << " " << line << "\n";
}

// Report a session milestone on stderr and, when a session log is configured,
// append it there as well. A failing session log never stops the run.
inline void milestone(const std::string& sessionLog, const std::string& line)
{
    std::cerr << "[plasticity] " << line << "\n";
    if (sessionLog.empty())
        return;
    try
    {
        appendLine(sessionLog, line);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[plasticity] session log write failed: " << e.what()
                  << "\n";
    }
}

} // namespace plasticity::log
