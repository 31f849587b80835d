#pragma once

/**
 * Abseil-style stream logging on top of spdlog.
 * LOG(INFO) << "..." writes one message to the spdlog default logger when
 * the temporary stream goes out of scope.
 */

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>

namespace gmshim::detail {

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

}  // namespace gmshim::detail

#define LOG(severity) ::gmshim::detail::LogStream(spdlog::level::severity)

#ifdef NDEBUG
#define DLOG(severity) \
    if (false) ::gmshim::detail::LogStream(spdlog::level::severity)
#else
#define DLOG(severity) ::gmshim::detail::LogStream(spdlog::level::severity)
#endif

// Logs strerror(errno) in front of the streamed message.
#define PLOG(severity)                                         \
    ::gmshim::detail::LogStream(spdlog::level::severity)       \
        << std::strerror(errno) << ": "

// Severity names accepted by LOG()/DLOG()/PLOG().
#define INFO info
#define WARNING warn
#define ERROR err
#define FATAL critical
