#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <unistd.h>

namespace YangKeys {

/**
 * @brief Thread-safe diagnostic logger.
 *
 * Writes to standard error so standard output stays free for the JSON result.
 * Messages below the configured threshold are dropped.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void set_level(Level level) {
        std::lock_guard<std::mutex> lock(mutex());
        threshold() = level;
    }

    static Level level() {
        std::lock_guard<std::mutex> lock(mutex());
        return threshold();
    }

    static bool enabled(Level level) {
        std::lock_guard<std::mutex> lock(mutex());
        return static_cast<int>(level) >= static_cast<int>(threshold());
    }

    static void log(Level level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex());
        if (static_cast<int>(level) < static_cast<int>(threshold())) return;

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        static const bool colored = ::isatty(STDERR_FILENO) != 0;
        if (colored) {
            std::cerr << color << prefix << message << "\033[0m" << std::endl;
        } else {
            std::cerr << prefix << message << std::endl;
        }
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }

    static Level& threshold() {
        static Level current = Level::Info;
        return current;
    }
};

} // namespace YangKeys
