// =================================================================
// include/Warden/Logger.hpp
// =================================================================
// Header for leveled logging and governance audit trails.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Warden {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;    ///< Extra detail printed in parentheses, may be empty

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger for diagnostics and governance audit trails
 *
 * Console output goes to stderr so that command output on stdout (JSON,
 * diffs) stays machine-readable. The file sink writes to
 * <log_dir>/warden.log; once it reaches the size limit it is renamed to
 * warden.1.log, older files shift up by one and the oldest is dropped.
 * Timestamps are UTC, in the same format as audit entries.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief (Re)open the file sink
     * @param log_dir Directory holding warden.log and its rotated siblings
     * @param max_log_size Size in bytes at which the active file is rotated
     * @param max_log_files Files kept, the active one included
     */
    void initialize(const std::string& log_dir = ".warden/logs",
                    size_t max_log_size = 10 * 1024 * 1024,
                    size_t max_log_files = 5);

    void setConsoleLogLevel(LogLevel level);
    void setFileLogLevel(LogLevel level);
    void setConsoleLogging(bool enabled);

    /**
     * @brief Turn the file sink on or off
     *
     * Turning it off closes the active file; initialize() reopens it.
     */
    void setFileLogging(bool enabled);

    void log(LogLevel level, const std::string& component, const std::string& message,
             const std::string& context = "");

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Record which rule decided a path's tier
     */
    void logClassification(const struct Classification& classification);

    /**
     * @brief Record a compare-and-set on a proposal's state
     *
     * Refused transitions are logged as warnings.
     */
    void logTransition(const std::string& proposal_id, const std::string& from,
                       const std::string& to, bool success);

    /**
     * @brief Record the outcome of one apply attempt
     *
     * Failures that end a proposal's life (commit failure, exhausted retry
     * budget) are logged as critical.
     */
    void logPatchResult(const struct PatchResult& result);

    void logSessionStart(const std::string& command, const std::string& argument);
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    void flush();

    /**
     * @brief Short level label used in formatted entries ("WARN", "CRIT", ...)
     */
    static std::string getLevelName(LogLevel level);

    static std::string getLevelColor(LogLevel level);

    /**
     * @brief Parse a level name ("debug", "info", "warn", ...)
     * @return Parsed level, INFO when unknown
     */
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::WARNING;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;
    std::recursive_mutex m_mutex;

    std::unique_ptr<std::ofstream> m_log_file;
    size_t m_log_file_size = 0;

    void write(const LogEntry& entry);

    std::string formatEntry(const LogEntry& entry, bool include_color) const;

    /**
     * @brief Open warden.log for appending, creating the directory
     * @return False if the file cannot be opened; the file sink is then disabled
     */
    bool openLogFile();

    void rotate();

    /**
     * @brief Path of the active file (index 0) or a rotated one
     */
    std::string getLogFilePath(size_t index) const;

    static std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
};

#define LOG_DEBUG(component, message) \
    Warden::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Warden::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Warden::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Warden::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Warden::Logger::getInstance().critical(component, message)

} // namespace Warden
