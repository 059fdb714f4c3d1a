#pragma once

#include <iostream>
#include <mutex>
#include <string>

namespace workmem {

/// Process-wide leveled logger. Messages below the threshold are
/// dropped; the rest go to std::clog, one line each.
class Logger {
public:
    enum class Level {
        Debug = 0,
        Info,
        Warning,
        Error,
        Off
    };

    static void setLevel(Level level) { threshold() = level; }
    static Level level() { return threshold(); }

    static bool enabled(Level level) {
        return level >= threshold() && threshold() != Level::Off;
    }

    static void log(Level level, const std::string& component, const std::string& message) {
        if (!enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* tag = "";
        switch (level) {
            case Level::Debug:   tag = "[DEBUG] "; break;
            case Level::Info:    tag = "[INFO ] "; break;
            case Level::Warning: tag = "[WARN ] "; break;
            case Level::Error:   tag = "[ERROR] "; break;
            case Level::Off:     return;
        }
        std::clog << tag << "[" << component << "] " << message << std::endl;
    }

    static void debug(const std::string& component, const std::string& msg) { log(Level::Debug, component, msg); }
    static void info(const std::string& component, const std::string& msg)  { log(Level::Info, component, msg); }
    static void warn(const std::string& component, const std::string& msg)  { log(Level::Warning, component, msg); }
    static void error(const std::string& component, const std::string& msg) { log(Level::Error, component, msg); }

private:
    static Level& threshold() {
        static Level level = Level::Warning;
        return level;
    }
};

/// Log at Error and throw E with the same message.
template <typename E>
[[noreturn]] void logAndThrow(const std::string& component, const std::string& message) {
    Logger::error(component, message);
    throw E(message);
}

} // namespace workmem
