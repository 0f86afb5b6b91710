#pragma once

#include <string>
#include <cstdarg>
#include "device_config.hpp"

class Logger {
public:
    enum Level { DEBUG, INFO, WARN, ERROR };
    static void begin(const LoggingConfig& cfg);
    static void log(Level level, const char* fmt, ...);
    static void debug(const char* fmt, ...);
    static void info(const char* fmt, ...);
    static void warn(const char* fmt, ...);
    static void error(const char* fmt, ...);
    static Level minLevel() { return min_level_; }
    static bool levelFromString(const std::string& name, Level& level);
private:
    static Level min_level_;
    static bool flush_on_write_;
    static void write_log(Level level, const char* fmt, va_list args);
};
