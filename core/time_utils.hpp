#pragma once

namespace plasticity::timeutil
{

// Blocking hold of the calling thread; non-positive durations return at once.
void sleepSeconds(double sec);

// Clock and hold used by the sequencer. now() is monotonic, in seconds.
class Timebase
{
  public:
    virtual ~Timebase() = default;

    virtual double now() const = 0;
    virtual void sleepFor(double sec) = 0;
};

// Wall-clock timebase backed by std::chrono::steady_clock.
class SteadyTimebase : public Timebase
{
  public:
    SteadyTimebase();

    double now() const override;
    void sleepFor(double sec) override;

  private:
    double origin;
};

// Virtual time: sleepFor() advances the clock instead of blocking.
// Used for dry runs against the simulated device and in tests.
class ManualTimebase : public Timebase
{
  public:
    explicit ManualTimebase(double start = 0.0) : t(start) {}

    double now() const override
    {
        return t;
    }

    void sleepFor(double sec) override
    {
        if (sec > 0.0)
            t += sec;
    }

    void advance(double sec)
    {
        sleepFor(sec);
    }

  private:
    double t;
};

} // namespace plasticity::timeutil
