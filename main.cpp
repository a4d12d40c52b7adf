#include "buildjson/buildjson.hpp"
#include "core/logging.hpp"
#include "core/port.hpp"
#include "core/simulated_port.hpp"
#include "core/time_utils.hpp"
#include "experiment/runners.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{

struct Task
{
    int priority{};
    std::string name;
    std::function<void()> fn;
};

// Collect the enabled experiments of the config as tasks, lowest priority
// value first; equal priorities keep declaration order.
std::vector<Task> buildTasks(const plasticity::Config& cfg,
                             plasticity::exp::SessionContext& ctx)
{
    std::vector<Task> tasks;

    auto add = [&](const auto& entry, const char* name, auto runner) {
        if (!entry || !entry->enabled)
            return;
        const auto e = *entry;
        tasks.push_back(Task{e.priority, name, [&ctx, e, runner] {
                                 runner(ctx, e);
                             }});
    };

    using namespace plasticity::exp;
    add(cfg.ltpLtd, "ltpltd",
        [](auto& c, const auto& e) { runLtpLtd(c, e); });
    add(cfg.pairedPulse, "ppf",
        [](auto& c, const auto& e) { runPairedPulse(c, e); });
    add(cfg.stdp, "stdp", [](auto& c, const auto& e) { runStdp(c, e); });
    add(cfg.srdp, "srdp", [](auto& c, const auto& e) { runSrdp(c, e); });
    add(cfg.ltm, "ltm", [](auto& c, const auto& e) { runLtm(c, e); });
    add(cfg.sine, "sine", [](auto& c, const auto& e) { runSine(c, e); });
    add(cfg.ivConvergence, "ivconvergence",
        [](auto& c, const auto& e) { runIvConvergence(c, e); });

    std::stable_sort(tasks.begin(), tasks.end(),
                     [](const Task& a, const Task& b) {
                         return a.priority < b.priority;
                     });
    return tasks;
}

} // namespace

int main(int argc, char** argv)
{
    std::string jsonPath =
        "/usr/share/plasticity-tester/configs/plasticity.json";
    if (argc > 1)
    {
        jsonPath = argv[1];
    }

    plasticity::Config cfg;
    try
    {
        cfg = plasticity::loadConfigFromJsonFile(jsonPath);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[plasticity] Config error: " << e.what()
                  << "; running every experiment with default parameters\n";
        cfg = plasticity::defaultConfig();
    }

    if (!cfg.basic.simulate)
    {
        // The instrument driver is supplied by the host application through
        // the SourceMeasurePort interface; this binary only carries the model.
        std::cerr << "[plasticity] no instrument driver in this build; set "
                     "\"simulate\": true to run against the device model\n";
        return 1;
    }

    // The device model runs on virtual time, so holds cost no wall-clock time.
    plasticity::timeutil::ManualTimebase clock;
    plasticity::port::PortSession port(
        std::make_unique<plasticity::port::SimulatedPort>(clock));
    plasticity::exp::SessionContext ctx{cfg.basic, port, clock};

    plasticity::log::milestone(cfg.basic.sessionLog,
                               "session started, config=" + jsonPath +
                                   " output=" + cfg.basic.outputDir);

    boost::asio::io_context io;
    bool cancelRequested = false;

    // A signal only stops experiments that have not started yet; a sweep in
    // progress always completes.
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec)
            return;
        std::cerr << "[plasticity] signal " << signo
                  << " received; skipping remaining experiments\n";
        cancelRequested = true;
    });

    const auto tasks = buildTasks(cfg, ctx);
    if (tasks.empty())
    {
        std::cerr << "[plasticity] no experiment enabled\n";
    }

    for (const auto& task : tasks)
    {
        boost::asio::post(io, [&, task] {
            if (cancelRequested)
            {
                std::cerr << "[plasticity] " << task.name << " skipped\n";
                return;
            }
            std::cerr << "[plasticity] " << task.name << " started\n";
            try
            {
                task.fn();
            }
            catch (const std::exception& e)
            {
                plasticity::log::milestone(cfg.basic.sessionLog,
                                           task.name + " failed: " + e.what());
            }
        });
    }

    // Leave the device unbiased and let io.run() return.
    boost::asio::post(io, [&] {
        try
        {
            port.setOutputEnabled(false);
        }
        catch (const plasticity::port::PortError& e)
        {
            std::cerr << "[plasticity] WARN: output off failed: " << e.what()
                      << "\n";
        }
        signals.cancel();
        plasticity::log::milestone(cfg.basic.sessionLog,
                                   cancelRequested ? "session cancelled"
                                                   : "session finished");
    });

    io.run();
    return cancelRequested ? 130 : 0;
}
