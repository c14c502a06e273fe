#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include <fmt/core.h>

namespace graft {

// ============================================================================
// Log Level Enumeration
// ============================================================================

enum class LogLevel { TRACE, DEBUG, INFO, WARNING, ERROR, FATAL };
enum class LogOutput { CONSOLE, FILE, BOTH };

// ============================================================================
// Log Entry Structure
// ============================================================================

struct LogEntry {
    std::string timestamp;
    LogLevel level;
    std::string scope;    // "Autograd", "NN", ...
    std::string message;  // The actual message
};

// ============================================================================
// Logger Class
// ============================================================================

/**
 * @brief Scoped logger shared by every graft module
 * @details One instance exists per scope name ("Graph", "Autograd", "NN", ...).
 *          Entries below the process-wide minimum level are dropped before any
 *          formatting happens. Surviving entries are written synchronously to
 *          the console (coloured when stdout is a terminal), to a log file, or
 *          to both.
 */
class Logger {
  public:
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // ------------------------------------------------------------------------
    // Logging Methods
    // ------------------------------------------------------------------------

    /// Log a message at the scope's own level
    void log(const std::string& message) const;

    void trace(const std::string& message) const;
    void debug(const std::string& message) const;
    void info(const std::string& message) const;
    void warning(const std::string& message) const;
    void error(const std::string& message) const;
    void fatal(const std::string& message) const;

    /// Formatted logging, "{}" placeholders
    template <typename... Args>
    void trace(fmt::format_string<Args...> pattern, Args&&... args) const {
        if (enabled(LogLevel::TRACE)) {
            trace(fmt::format(pattern, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> pattern, Args&&... args) const {
        if (enabled(LogLevel::DEBUG)) {
            debug(fmt::format(pattern, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> pattern, Args&&... args) const {
        if (enabled(LogLevel::INFO)) {
            info(fmt::format(pattern, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void warning(fmt::format_string<Args...> pattern, Args&&... args) const {
        if (enabled(LogLevel::WARNING)) {
            warning(fmt::format(pattern, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> pattern, Args&&... args) const {
        if (enabled(LogLevel::ERROR)) {
            error(fmt::format(pattern, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void fatal(fmt::format_string<Args...> pattern, Args&&... args) const {
        fatal(fmt::format(pattern, std::forward<Args>(args)...));
    }

    [[nodiscard]] const std::string& scope() const { return mScope; }
    [[nodiscard]] LogLevel level() const { return mLogLevel; }

    // ------------------------------------------------------------------------
    // Static Methods
    // ------------------------------------------------------------------------

    /// Get or create the logger for a scope
    static Logger& getInstance(const std::string& scope, const LogLevel& level = LogLevel::INFO);

    /// Minimum level for all scopes
    static void setMinLogLevel(const LogLevel& level);
    static LogLevel minLogLevel();

    /// Opens (appends to) the file and switches output to BOTH
    static void setLogFile(const std::string& file);

    static void setLogOutput(const LogOutput& output);

    /// Flush console and file streams
    static void flush();

    /// Close the log file and fall back to console output
    static void shutdown();

    /// Plain single-line rendering used for files and non-colour terminals
    static std::string formatPlain(const LogEntry& entry);

  private:
    Logger(std::string scope, LogLevel level);

    // NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables,readability-identifier-naming)
    static std::unordered_map<std::string, std::unique_ptr<Logger>> sLoggers;
    static std::mutex sRegistryMutex;
    static std::mutex sOutputMutex;
    static LogLevel sMinLogLevel;
    static LogOutput sLogOutput;
    static std::string sLogFile;
    static std::ofstream sFileStream;
    // NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables,readability-identifier-naming)

    [[nodiscard]] static bool enabled(LogLevel level) { return level >= sMinLogLevel; }
    [[nodiscard]] static std::string currentTimestamp();

    /// PRECONDITION: caller holds sOutputMutex
    static void openLogFileInternal();

    void write(const std::string& message, LogLevel level) const;

    std::string mScope;
    LogLevel mLogLevel = LogLevel::INFO;
};

/// "INFO", "WARNING", ...
const char* toString(LogLevel level);

}  // namespace graft
