#pragma once

#include <mutex>
#include <string>

namespace hashid {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Initial level comes from HASHID_LOG (debug|info|warn|error or 3|2|1|0).
 * Error and warn go to stderr, info and debug to stdout.
 * Salts must never be passed to any of the write methods.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    void write(LogLevel at, const char* tag, const std::string& msg) const;

    LogLevel currentLevel;
    mutable std::mutex mtx;
};

}
