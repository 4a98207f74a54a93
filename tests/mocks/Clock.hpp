#pragma once

#include <Clock.hpp>
#include <gmock/gmock.h>

class MockClock : public ClockBase {
   public:
    MockClock() = default;

    MOCK_METHOD(std::chrono::year_month_day, today, (), (const, override));
};
