#include "Logging.hh"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <string_view>

namespace Clue {

namespace {

std::mutex loggingMutex;
std::ostream* globalLoggingStream = &std::cerr;
auto globalLoggingLevel = LogLevel::WARNING;

}

namespace Impl {

bool shouldLog(LogLevel level)
{
    const auto lock = std::lock_guard {loggingMutex};
    return level != LogLevel::NONE && level <= globalLoggingLevel;
}

void writeLog(LogLevel level, const std::string& message)
{
    using namespace std::string_view_literals;
    static const std::map<LogLevel, std::string_view> LOG_LEVEL_NAMES {
        { LogLevel::FATAL,   "FATAL   "sv },
        { LogLevel::ERROR,   "ERROR   "sv },
        { LogLevel::WARNING, "WARNING "sv },
        { LogLevel::INFO,    "INFO    "sv },
        { LogLevel::DEBUG,   "DEBUG   "sv },
    };

    const auto time = std::time(nullptr);
    auto tm = std::tm {};
    localtime_r(&time, &tm);
    const auto lock = std::lock_guard {loggingMutex};
    *globalLoggingStream << std::put_time(&tm, "%c ") <<
        LOG_LEVEL_NAMES.at(level) << message << '\n';
}

}

LogLevel getLogLevel(int verbosity)
{
    if (verbosity >= 2) {
        return LogLevel::DEBUG;
    } else if (verbosity == 1) {
        return LogLevel::INFO;
    }
    return LogLevel::WARNING;
}

void setupLogging(LogLevel level, std::ostream& stream)
{
    const auto lock = std::lock_guard {loggingMutex};
    globalLoggingLevel = level;
    globalLoggingStream = &stream;
}

}
