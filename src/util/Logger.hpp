#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace saltline {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Level comes from the SALTLINE_LOG environment variable
 * ("error", "warn", "info", "debug" or 0-3) and defaults to warn,
 * so library callers only see corrections and failures.
 *
 * Every level goes to stderr: stdout carries hashes and other command
 * output. Handlers log from whatever thread calls them, so lines are
 * written under a lock and the level may change at any time.
 */
class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level() const;

    /// True if a message at level would be written; lets callers skip building it
    bool enabled(LogLevel level) const;

    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();

    std::atomic<LogLevel> currentLevel;
    mutable std::mutex writeMutex;

    void write(LogLevel level, const char* tag, const std::string& msg) const;
};

}
