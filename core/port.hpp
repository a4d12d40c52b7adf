#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace plasticity::port
{

// Base of every failure reported by a source-measurement port.
class PortError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// Instrument unreachable or reply timed out.
class CommunicationError : public PortError
{
  public:
    using PortError::PortError;
};

// Instrument answered, but the reply could not be interpreted.
class MeasurementError : public PortError
{
  public:
    using PortError::PortError;
};

struct Reading
{
    double current{}; // A
    double voltage{}; // V
};

struct PortState
{
    bool outputEnabled{false};
    double voltageLevel{0.0};   // V
    double currentLimit{1e-7};  // A
    double integrationCycles{1.0}; // NPLC
};

// Request/response capability of a single-channel SMU. Every call may throw
// CommunicationError or MeasurementError.
class SourceMeasurePort
{
  public:
    virtual ~SourceMeasurePort() = default;

    virtual void setOutputEnabled(bool enabled) = 0;
    virtual void setVoltageLevel(double volts) = 0;
    virtual void setCurrentLimit(double amps) = 0;
    virtual void setIntegrationCycles(double nplc) = 0;
    virtual Reading measure() = 0;

    // Query the instrument's actual configuration.
    virtual PortState queryState() = 0;
};

// Exclusive handle on a port for one test session. Keeps the last-known
// state without issuing a query per access; refresh() resynchronizes it.
class PortSession
{
  public:
    explicit PortSession(std::unique_ptr<SourceMeasurePort> port);

    PortSession(const PortSession&) = delete;
    PortSession& operator=(const PortSession&) = delete;
    PortSession(PortSession&&) = default;
    PortSession& operator=(PortSession&&) = default;

    void setOutputEnabled(bool enabled);
    void setVoltageLevel(double volts);
    void setCurrentLimit(double amps);
    void setIntegrationCycles(double nplc);
    Reading measure();

    // Replace the cache with the instrument's reported state.
    const PortState& refresh();

    const PortState& cached() const
    {
        return state;
    }

    SourceMeasurePort& device()
    {
        return *port;
    }

  private:
    std::unique_ptr<SourceMeasurePort> port;
    PortState state;
};

} // namespace plasticity::port
