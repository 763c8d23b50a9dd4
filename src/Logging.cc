#include "Logging.hh"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace TypedUuid {

namespace {

std::atomic<LogLevel> globalLoggingLevel {LogLevel::WARNING};
std::ostream* globalLoggingStream = &std::cerr;
std::mutex globalLoggingMutex;

std::string_view levelLabel(LogLevel level)
{
    using namespace std::string_view_literals;
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
        return ""sv;
    }
}

}

namespace Impl {

bool shouldLog(LogLevel level)
{
    return level != LogLevel::NONE && level <= globalLoggingLevel.load();
}

void writeRecord(LogLevel level, std::string_view message)
{
    const auto lock = std::lock_guard {globalLoggingMutex};
    // std::localtime shares a static buffer, hence inside the lock
    const auto time = std::time(nullptr);
    *globalLoggingStream << std::put_time(std::localtime(&time), "%c ") <<
        levelLabel(level) << message << '\n';
}

}

void setupLogging(LogLevel level, std::ostream& stream)
{
    const auto lock = std::lock_guard {globalLoggingMutex};
    globalLoggingLevel = level;
    globalLoggingStream = &stream;
}

}
