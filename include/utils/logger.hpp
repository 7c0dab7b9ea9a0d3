#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace Polydoc {

/**
 * @brief Thread-safe logging utility shared by the registries and pipeline.
 *
 * Messages below the configured minimum level are discarded. Output goes to
 * std::cerr unless a different stream is installed with set_sink().
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error,
        Off
    };

    static void log(Level level, const std::string& message) {
        if (level < min_level() || level == Level::Off) return;

        std::lock_guard<std::mutex> lock(mutex());

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;35m"; prefix = "[debug] "; break; // Magenta
            case Level::Info:    color = "\033[0;36m"; prefix = "=== ";     break; // Cyan
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";       break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";       break; // Red
            case Level::Off:     break;
        }

        std::ostream& out = *sink_slot();
        if (colored()) {
            out << color << prefix << message << "\033[0m" << std::endl;
        } else {
            out << prefix << message << std::endl;
        }
    }

    static void debug(const std::string& msg) { log(Level::Debug, msg); }
    static void info(const std::string& msg)  { log(Level::Info, msg); }
    static void warn(const std::string& msg)  { log(Level::Warning, msg); }
    static void error(const std::string& msg) { log(Level::Error, msg); }

    static void set_level(Level level) { level_slot().store(level); }
    static Level min_level() { return level_slot().load(); }

    /// Redirects output. Colors are only emitted on the default stream.
    static void set_sink(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex());
        sink_slot() = out ? out : &std::cerr;
    }

    /// Parses "debug", "info", "warning"/"warn", "error", "off".
    static bool parse_level(std::string_view name, Level& out) {
        if (name == "debug")                        { out = Level::Debug;   return true; }
        if (name == "info")                         { out = Level::Info;    return true; }
        if (name == "warning" || name == "warn")    { out = Level::Warning; return true; }
        if (name == "error")                        { out = Level::Error;   return true; }
        if (name == "off")                          { out = Level::Off;     return true; }
        return false;
    }

private:
    static std::mutex& mutex() {
        static std::mutex m;
        return m;
    }

    static std::atomic<Level>& level_slot() {
        static std::atomic<Level> level{Level::Info};
        return level;
    }

    static std::ostream*& sink_slot() {
        static std::ostream* sink = &std::cerr;
        return sink;
    }

    static bool colored() { return sink_slot() == &std::cerr; }
};

} // namespace Polydoc
