#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace saltline {

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("SALTLINE_LOG");
    if (!env) return LogLevel::Warn;
    std::string v(env);
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return LogLevel::Warn;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()) {}

void Logger::setLevel(LogLevel level) { currentLevel.store(level); }
LogLevel Logger::level() const { return currentLevel.load(); }

bool Logger::enabled(LogLevel level) const {
    return currentLevel.load() >= level;
}

void Logger::write(LogLevel level, const char* tag, const std::string& msg) const {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(writeMutex);
    std::cerr << "saltline[" << tag << "] " << msg << "\n";
}

void Logger::error(const std::string& msg) const { write(LogLevel::Error, "error", msg); }
void Logger::warn(const std::string& msg) const { write(LogLevel::Warn, "warn", msg); }
void Logger::info(const std::string& msg) const { write(LogLevel::Info, "info", msg); }
void Logger::debug(const std::string& msg) const { write(LogLevel::Debug, "debug", msg); }

}
