#include "common/logger.hpp"

#include <iostream>
#include <mutex>

namespace reasongraph {

namespace {

struct LoggerState {
    std::mutex mutex;
    Logger::Level min_level = Logger::Level::Warning;
    Logger::Sink sink;
};

LoggerState& state() {
    static LoggerState s;
    return s;
}

} // namespace

void Logger::log(Level level, const std::string& message) {
    LoggerState& s = state();
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (static_cast<int>(level) < static_cast<int>(s.min_level)) return;
        if (!s.sink) {
            std::clog << "[reasongraph] " << levelName(level) << ": " << message << std::endl;
            return;
        }
        sink = s.sink;
    }
    // Called unlocked so a sink may log or replace itself.
    sink(level, message);
}

void Logger::setLevel(Level level) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.min_level = level;
}

Logger::Level Logger::level() {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.min_level;
}

void Logger::setSink(Sink sink) {
    LoggerState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.sink = std::move(sink);
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error:   return "ERROR";
    }
    return "?";
}

} // namespace reasongraph
