#pragma once

#include "core/port.hpp"

#include <gmock/gmock.h>

namespace plasticity::test
{

class MockPort : public port::SourceMeasurePort
{
  public:
    MOCK_METHOD(void, setOutputEnabled, (bool), (override));
    MOCK_METHOD(void, setVoltageLevel, (double), (override));
    MOCK_METHOD(void, setCurrentLimit, (double), (override));
    MOCK_METHOD(void, setIntegrationCycles, (double), (override));
    MOCK_METHOD(port::Reading, measure, (), (override));
    MOCK_METHOD(port::PortState, queryState, (), (override));
};

} // namespace plasticity::test
