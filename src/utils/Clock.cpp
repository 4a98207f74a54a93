#include <AbslLogCompat.hpp>
#include <Clock.hpp>
#include <chrono>
#include <ctime>

std::chrono::year_month_day SystemClock::today() const {
    const std::time_t now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    if (localtime_r(&now, &local) == nullptr) {
        PLOG(WARNING) << "localtime_r failed, falling back to UTC";
        return std::chrono::year_month_day{
            std::chrono::floor<std::chrono::days>(
                std::chrono::system_clock::now())};
    }
    return std::chrono::year_month_day{
        std::chrono::year{local.tm_year + 1900},
        std::chrono::month{static_cast<unsigned int>(local.tm_mon + 1)},
        std::chrono::day{static_cast<unsigned int>(local.tm_mday)}};
}
