#include "interactive_piano/logger.hpp"

#include <array>
#include <cstdio>
#include <iostream>

namespace interactive_piano {

namespace {

constexpr std::size_t kMaxLogMessageLength = 1024;

}  // namespace

Logger* Logger::global() {
    static Logger instance;
    return &instance;
}

void Logger::log(LogLevel level, const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(level, format, args);
    va_end(args);
}

void Logger::logv(LogLevel level, const char* format, va_list args) {
    std::array<char, kMaxLogMessageLength> buffer{};
    std::vsnprintf(buffer.data(), buffer.size(), format, args);

    std::size_t serial = serial_++;
    if (callbacks.empty()) {
        if (level >= min_level_) {
            std::cerr << "[interactive_piano] " << to_string(level) << ": "
                      << buffer.data() << '\n';
        }
        return;
    }
    for (auto& func : callbacks) {
        if (func) {
            func(level, serial, buffer.data());
        }
    }
}

void Logger::log_diagnostic(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::Diagnostic, format, args);
    va_end(args);
}

void Logger::log_info(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::Info, format, args);
    va_end(args);
}

void Logger::log_warning(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::Warning, format, args);
    va_end(args);
}

void Logger::log_error(const char* format, ...) {
    va_list args;
    va_start(args, format);
    logv(LogLevel::Error, format, args);
    va_end(args);
}

const char* to_string(Logger::LogLevel level) noexcept {
    switch (level) {
    case Logger::LogLevel::Diagnostic:
        return "diagnostic";
    case Logger::LogLevel::Info:
        return "info";
    case Logger::LogLevel::Warning:
        return "warning";
    case Logger::LogLevel::Error:
        return "error";
    }
    return "unknown";
}

}  // namespace interactive_piano
