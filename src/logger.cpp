#include "graft/logger.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <unistd.h>  // For isatty()

namespace graft {

// ============================================================================
// ANSI Color Codes for Terminal Output
// ============================================================================

namespace colors {
constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* DIM = "\033[2m";
constexpr const char* CYAN = "\033[36m";
constexpr const char* BRIGHT_RED = "\033[91m";
constexpr const char* BRIGHT_GREEN = "\033[92m";
constexpr const char* BRIGHT_YELLOW = "\033[93m";
}  // namespace colors

namespace {

bool isTerminalColorSupported() {
#ifndef _WIN32
    return isatty(fileno(stdout)) != 0;
#else
    return false;
#endif
}

const char* levelColor(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return colors::DIM;
        case LogLevel::DEBUG:
            return colors::CYAN;
        case LogLevel::INFO:
            return colors::BRIGHT_GREEN;
        case LogLevel::WARNING:
            return colors::BRIGHT_YELLOW;
        case LogLevel::ERROR:
        case LogLevel::FATAL:
            return colors::BRIGHT_RED;
    }
    return colors::RESET;
}

std::string formatColored(const LogEntry& entry) {
    std::stringstream ss;
    ss << colors::DIM << entry.timestamp << colors::RESET << " ";
    if (entry.level == LogLevel::FATAL) {
        ss << colors::BOLD;
    }
    ss << levelColor(entry.level) << "[" << toString(entry.level) << "]" << colors::RESET << " ";
    ss << colors::CYAN << "[" << entry.scope << "]" << colors::RESET << " ";
    ss << entry.message << "\n";
    return ss.str();
}

}  // namespace

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
    }
    return "UNKNOWN";
}

// ============================================================================
// Static Member Initialization
// ============================================================================

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables)
std::unordered_map<std::string, std::unique_ptr<Logger>> Logger::sLoggers = {};
std::mutex Logger::sRegistryMutex;
std::mutex Logger::sOutputMutex;
LogLevel Logger::sMinLogLevel = LogLevel::INFO;
LogOutput Logger::sLogOutput = LogOutput::CONSOLE;
std::string Logger::sLogFile;
std::ofstream Logger::sFileStream;
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)

Logger::Logger(std::string scope, LogLevel level) : mScope(std::move(scope)), mLogLevel(level) {}

// ============================================================================
// Static Methods
// ============================================================================

Logger& Logger::getInstance(const std::string& scope, const LogLevel& level) {
    std::lock_guard<std::mutex> lock(sRegistryMutex);
    auto it = sLoggers.find(scope);
    if (it == sLoggers.end()) {
        it = sLoggers.emplace(scope, std::unique_ptr<Logger>(new Logger(scope, level))).first;
        return *it->second;
    }

    it->second->mLogLevel = level;
    return *it->second;
}

void Logger::setMinLogLevel(const LogLevel& level) {
    sMinLogLevel = level;
}

LogLevel Logger::minLogLevel() {
    return sMinLogLevel;
}

void Logger::setLogOutput(const LogOutput& output) {
    std::lock_guard<std::mutex> lock(sOutputMutex);
    sLogOutput = output;
    if (output != LogOutput::CONSOLE && !sFileStream.is_open() && !sLogFile.empty()) {
        openLogFileInternal();
    }
}

void Logger::setLogFile(const std::string& file) {
    std::lock_guard<std::mutex> lock(sOutputMutex);
    if (sFileStream.is_open()) {
        sFileStream.close();
    }

    sLogFile = file;
    openLogFileInternal();

    if (sFileStream.is_open()) {
        sLogOutput = LogOutput::BOTH;
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(sOutputMutex);
    std::cout.flush();
    if (sFileStream.is_open()) {
        sFileStream.flush();
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(sOutputMutex);
    std::cout.flush();
    if (sFileStream.is_open()) {
        sFileStream.close();
    }
    sLogOutput = LogOutput::CONSOLE;
}

std::string Logger::formatPlain(const LogEntry& entry) {
    return entry.timestamp + " [" + toString(entry.level) + "] [" + entry.scope + "] " +
           entry.message + '\n';
}

// ============================================================================
// Private Helper Methods
// ============================================================================

void Logger::openLogFileInternal() {
    sFileStream.open(sLogFile, std::ios::app);
    if (!sFileStream.is_open()) {
        std::cerr << "Error: Failed to open log file: " << sLogFile << std::endl;
    }
}

std::string Logger::currentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_time = std::chrono::system_clock::to_time_t(now);

    std::tm local_tm{};
    localtime_r(&now_time, &local_tm);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local_tm);
    return buffer;
}

// ============================================================================
// Logging Methods
// ============================================================================

void Logger::log(const std::string& message) const {
    if (!enabled(mLogLevel)) {
        return;
    }
    write(message, mLogLevel);
}

void Logger::trace(const std::string& message) const {
    if (!enabled(LogLevel::TRACE)) {
        return;
    }
    write(message, LogLevel::TRACE);
}

void Logger::debug(const std::string& message) const {
    if (!enabled(LogLevel::DEBUG)) {
        return;
    }
    write(message, LogLevel::DEBUG);
}

void Logger::info(const std::string& message) const {
    if (!enabled(LogLevel::INFO)) {
        return;
    }
    write(message, LogLevel::INFO);
}

void Logger::warning(const std::string& message) const {
    if (!enabled(LogLevel::WARNING)) {
        return;
    }
    write(message, LogLevel::WARNING);
}

void Logger::error(const std::string& message) const {
    if (!enabled(LogLevel::ERROR)) {
        return;
    }
    write(message, LogLevel::ERROR);
}

void Logger::fatal(const std::string& message) const {
    write(message, LogLevel::FATAL);
}

void Logger::write(const std::string& message, LogLevel level) const {
    const LogEntry entry{currentTimestamp(), level, mScope, message};

    std::lock_guard<std::mutex> lock(sOutputMutex);

    // Console: colours only on a real terminal
    if (sLogOutput == LogOutput::CONSOLE || sLogOutput == LogOutput::BOTH) {
        static const bool use_color = isTerminalColorSupported();
        std::cout << (use_color ? formatColored(entry) : formatPlain(entry));
    }

    // File: always plain text
    if ((sLogOutput == LogOutput::FILE || sLogOutput == LogOutput::BOTH) &&
        sFileStream.is_open()) {
        sFileStream << formatPlain(entry);
    }
}

}  // namespace graft
