#pragma once

/**
 * Abseil-style logging call sites backed by spdlog.
 * LOG(INFO) << "..." streams the message and emits it through the default
 * spdlog logger when the temporary goes out of scope.
 */

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <ostream>
#include <sstream>

namespace detail {

class LogStream {
    std::ostringstream oss;
    spdlog::level::level_enum level;

   public:
    explicit LogStream(spdlog::level::level_enum l) : level(l) {}

    template <typename T>
    LogStream& operator<<(const T& value) {
        oss << value;
        return *this;
    }

    // std::endl and friends
    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        manip(oss);
        return *this;
    }

    ~LogStream() {
        const std::string msg = oss.str();
        if (!msg.empty()) {
            spdlog::log(level, "{}", msg);
        }
    }
};

}  // namespace detail

#define LOG(severity) ::detail::LogStream(spdlog::level::severity)

#ifdef NDEBUG
#define DLOG(severity) \
    if (false) ::detail::LogStream(spdlog::level::severity)
#else
#define DLOG(severity) ::detail::LogStream(spdlog::level::severity)
#endif

// Log with errno description prepended
#define PLOG(severity) \
    ::detail::LogStream(spdlog::level::severity) << std::strerror(errno) << ": "

// Severity names used as LOG() parameters
#define INFO info
#define WARNING warn
#define ERROR err
#define FATAL critical
#define VERBOSE debug
