#pragma once

#include <functional>
#include <string>

namespace reasongraph {

/// Process-wide logging utility. Messages below the minimum level are
/// dropped; everything else goes to the installed sink (std::clog by
/// default). Safe to call from multiple threads.
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Sink = std::function<void(Level, const std::string&)>;

    static void log(Level level, const std::string& message);

    static void debug(const std::string& msg) { log(Level::Debug, msg); }
    static void info(const std::string& msg)  { log(Level::Info, msg); }
    static void warn(const std::string& msg)  { log(Level::Warning, msg); }
    static void error(const std::string& msg) { log(Level::Error, msg); }

    static void setLevel(Level level);
    static Level level();

    /// Replace the output sink. An empty sink restores the default.
    static void setSink(Sink sink);

    static const char* levelName(Level level);
};

} // namespace reasongraph
