#include "time_utils.hpp"

#include <chrono>
#include <thread>

namespace plasticity::timeutil
{

static double steadySeconds()
{
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

void sleepSeconds(double sec)
{
    if (sec <= 0.0)
        return;
    std::this_thread::sleep_for(std::chrono::duration<double>(sec));
}

SteadyTimebase::SteadyTimebase() : origin(steadySeconds()) {}

double SteadyTimebase::now() const
{
    return steadySeconds() - origin;
}

void SteadyTimebase::sleepFor(double sec)
{
    sleepSeconds(sec);
}

} // namespace plasticity::timeutil
