#pragma once

// Stream-style logging macros over spdlog's default logger.
// The library never installs sinks or sets levels; the host application does.

#include <spdlog/spdlog.h>

#include <sstream>

namespace hwident {
namespace detail {

class StreamLogger {
  public:
    StreamLogger(spdlog::level::level_enum lvl, spdlog::source_loc loc) : lvl_(lvl), loc_(loc) {}

    // Emits the collected message
    ~StreamLogger() { spdlog::log(loc_, lvl_, oss_.str()); }

    StreamLogger(const StreamLogger&) = delete;
    StreamLogger& operator=(const StreamLogger&) = delete;

    template <typename T> StreamLogger& operator<<(const T& val) {
        oss_ << val;
        return *this;
    }

  private:
    spdlog::level::level_enum lvl_;
    spdlog::source_loc loc_;
    std::ostringstream oss_;
};

// Lets the macro expand to a single expression usable in unbraced if/else
class LogVoidify {
  public:
    void operator&(const StreamLogger&) {}
};

}  // namespace detail
}  // namespace hwident

#define HWIDENT_LOG_STREAM(level)                                    \
    !(spdlog::should_log(level))                                     \
        ? (void)0                                                    \
        : ::hwident::detail::LogVoidify() &                          \
              ::hwident::detail::StreamLogger(                       \
                  level, spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION})

#define LOG_DBG HWIDENT_LOG_STREAM(spdlog::level::debug)
#define LOG_INF HWIDENT_LOG_STREAM(spdlog::level::info)
#define LOG_WAR HWIDENT_LOG_STREAM(spdlog::level::warn)
#define LOG_ERR HWIDENT_LOG_STREAM(spdlog::level::err)
