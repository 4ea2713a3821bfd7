#include "Logging.hh"

#include <array>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Klondike {

using namespace std::string_view_literals;

namespace {

auto globalLoggingStream = std::ref(std::cerr);
auto globalLoggingLevel = LogLevel::WARNING;

constexpr auto LOG_LEVEL_NAMES = std::array {
    std::pair {LogLevel::NONE,    "none"sv},
    std::pair {LogLevel::FATAL,   "fatal"sv},
    std::pair {LogLevel::ERROR,   "error"sv},
    std::pair {LogLevel::WARNING, "warning"sv},
    std::pair {LogLevel::INFO,    "info"sv},
    std::pair {LogLevel::DEBUG,   "debug"sv},
};

// Column in front of every log line, padded to equal width
std::string_view levelColumn(const LogLevel level)
{
    switch (level) {
    case LogLevel::FATAL:
        return "FATAL   "sv;
    case LogLevel::ERROR:
        return "ERROR   "sv;
    case LogLevel::WARNING:
        return "WARNING "sv;
    case LogLevel::INFO:
        return "INFO    "sv;
    case LogLevel::DEBUG:
        return "DEBUG   "sv;
    default:
        return "        "sv;
    }
}

}

namespace Impl {

bool shouldLog(const LogLevel level)
{
    if (level != LogLevel::NONE && level <= globalLoggingLevel) {
        const auto time = std::time(nullptr);
        logStream() << std::put_time(std::localtime(&time), "%c ") <<
            levelColumn(level);
        return true;
    }
    return false;
}

std::ostream& logStream()
{
    return globalLoggingStream;
}

}

LogLevel getLogLevel(const int verbosity)
{
    if (verbosity >= 2) {
        return LogLevel::DEBUG;
    } else if (verbosity == 1) {
        return LogLevel::INFO;
    }
    return LogLevel::WARNING;
}

std::optional<LogLevel> logLevelFromString(const std::string_view name)
{
    for (const auto& [level, level_name] : LOG_LEVEL_NAMES) {
        if (level_name == name) {
            return level;
        }
    }
    return std::nullopt;
}

void setupLogging(const LogLevel level, std::ostream& stream)
{
    globalLoggingLevel = level;
    globalLoggingStream = stream;
}

std::ostream& operator<<(std::ostream& os, const LogLevel level)
{
    for (const auto& [known_level, name] : LOG_LEVEL_NAMES) {
        if (known_level == level) {
            return os << name;
        }
    }
    return os << "unknown";
}

}
