#include "util/log.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

#include "util/time.hpp"

namespace kbindexer::log {
namespace {

std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}

const char* to_string(Level level) {
    switch (level) {
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

Level parse_level(const char* value) {
    if (value == nullptr) {
        return Level::Info;
    }
    const std::string name{value};
    if (name == "warn" || name == "WARN") {
        return Level::Warn;
    }
    if (name == "error" || name == "ERROR") {
        return Level::Error;
    }
    return Level::Info;
}

}  // namespace

Level threshold() {
    static const Level level = parse_level(std::getenv("KBINDEX_LOG_LEVEL"));
    return level;
}

void write(Level level, std::string_view message) {
    if (static_cast<int>(level) < static_cast<int>(threshold())) {
        return;
    }
    const std::string timestamp = time::current_time_iso8601();
    auto& stream = (level == Level::Info) ? std::cout : std::cerr;

    std::lock_guard<std::mutex> lock(log_mutex());
    stream << '[' << timestamp << "][" << to_string(level) << "] " << message << std::endl;
}

void info(std::string_view message) { write(Level::Info, message); }

void warn(std::string_view message) { write(Level::Warn, message); }

void error(std::string_view message) { write(Level::Error, message); }

}  // namespace kbindexer::log
