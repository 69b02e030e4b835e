#pragma once

#include <cstdarg>
#include <cstddef>
#include <functional>
#include <vector>

namespace interactive_piano {

// Process-wide diagnostic logger. Hosts register callbacks to route messages
// into their own logging; with no callbacks registered, messages at or above
// min_level() are written to std::cerr.
//
// The engine is single-threaded, so the logger does no locking.
class Logger {
public:
    enum class LogLevel {
        Diagnostic,
        Info,
        Warning,
        Error,
    };

    using Callback =
        std::function<void(LogLevel level, std::size_t serial, const char* message)>;

    static Logger* global();

    Logger() = default;

    void log(LogLevel level, const char* format, ...);
    void logv(LogLevel level, const char* format, va_list args);

    void log_diagnostic(const char* format, ...);
    void log_info(const char* format, ...);
    void log_warning(const char* format, ...);
    void log_error(const char* format, ...);

    LogLevel min_level() const noexcept { return min_level_; }
    void set_min_level(LogLevel level) noexcept { min_level_ = level; }

    // Number of messages emitted so far (also passed to callbacks).
    std::size_t serial() const noexcept { return serial_; }

    std::vector<Callback> callbacks;

private:
    LogLevel min_level_{LogLevel::Warning};
    std::size_t serial_{0};
};

const char* to_string(Logger::LogLevel level) noexcept;

}  // namespace interactive_piano
