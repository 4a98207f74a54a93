#pragma once

#include <chrono>

// Source of "today" for date based queries.
class ClockBase {
   public:
    virtual ~ClockBase() = default;

    /**
     * @brief Returns the current calendar date in local time.
     */
    [[nodiscard]] virtual std::chrono::year_month_day today() const = 0;
};

class SystemClock : public ClockBase {
   public:
    SystemClock() = default;
    ~SystemClock() override = default;

    [[nodiscard]] std::chrono::year_month_day today() const override;
};
