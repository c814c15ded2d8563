// =================================================================
// src/Warden/Logger.cpp
// =================================================================
// Implementation for leveled logging and governance audit trails.

#include "Warden/Logger.hpp"
#include "Warden/RiskClassifier.hpp"
#include "Warden/PatchApplier.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace Warden {

namespace {

const char* RESET_COLOR = "\033[0m";

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = std::max<size_t>(max_log_files, 1);
    m_initialized = true;

    m_log_file.reset();
    m_log_file_size = 0;
    if (m_file_enabled && openLogFile()) {
        debug("Logger", "Logging to " + getLogFilePath(0));
    }
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::setFileLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file_enabled = enabled;
    if (!enabled) {
        flush();
        m_log_file.reset();
    }
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& context) {
    write(LogEntry(level, component, message, context));
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::INFO, component, message, context);
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::WARNING, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::ERROR, component, message, context);
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    log(LogLevel::CRITICAL, component, message, context);
}

void Logger::logClassification(const Classification& classification) {
    std::string rule = classification.is_default ? "(default)" : classification.matched_pattern;
    debug("RiskClassifier", "Classified " + classification.file_path,
          "Tier: " + classification.label + ", Rule: " + rule);
}

void Logger::logTransition(const std::string& proposal_id, const std::string& from,
                           const std::string& to, bool success) {
    std::string context = from + " -> " + to;
    if (success) {
        info("ProposalStore", "Transition applied: " + proposal_id, context);
    } else {
        warning("ProposalStore", "Transition refused: " + proposal_id, context);
    }
}

void Logger::logPatchResult(const PatchResult& result) {
    std::string context = "Status: " + getPatchStatusName(result.status) +
                          ", Stage: " + getPatchStageName(result.stage) +
                          ", State: " + getProposalStateName(result.final_state);
    if (!result.commit_id.empty()) {
        context += ", Commit: " + result.commit_id;
    }

    if (result.success()) {
        info("PatchApplier", "Proposal applied: " + result.proposal_id, context);
        return;
    }

    LogLevel level;
    switch (result.status) {
        case PatchStatus::COMMIT_FAILED:
        case PatchStatus::RETRY_BUDGET_EXHAUSTED:
            level = LogLevel::CRITICAL;
            break;
        case PatchStatus::INVALID_TRANSITION:
        case PatchStatus::PROPOSAL_NOT_FOUND:
            level = LogLevel::WARNING;
            break;
        default:
            level = LogLevel::ERROR;
            break;
    }

    log(level, "PatchApplier", "Proposal not applied: " + result.proposal_id + " - " + result.diagnostic,
        context);
}

void Logger::logSessionStart(const std::string& command, const std::string& argument) {
    std::string context = "Command: " + command;
    if (!argument.empty()) {
        context += ", Argument: " + argument;
    }
    debug("Session", "Session started", context);
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    debug("Session", "Session completed",
          "Command: " + command + ", Exit code: " + std::to_string(exit_code) +
          ", Duration: " + std::to_string(duration_ms) + "ms");
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_log_file) {
        m_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    static const char* NAMES[] = {"DEBUG", "INFO", "WARN", "ERROR", "CRIT"};
    size_t index = static_cast<size_t>(level);
    return index < 5 ? NAMES[index] : "UNKNOWN";
}

std::string Logger::getLevelColor(LogLevel level) {
    // gray, cyan, yellow, red, bright red
    static const char* COLORS[] = {"\033[90m", "\033[36m", "\033[33m", "\033[31m", "\033[91m"};
    size_t index = static_cast<size_t>(level);
    return index < 5 ? COLORS[index] : RESET_COLOR;
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "crit" || lower == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

void Logger::write(const LogEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (!m_initialized) {
        initialize();
    }

    if (m_console_enabled && entry.level >= m_console_level) {
        std::cerr << formatEntry(entry, true) << std::endl;
    }

    if (!m_file_enabled || !m_log_file || entry.level < m_file_level) {
        return;
    }

    if (m_log_file_size >= m_max_log_size) {
        rotate();
        if (!m_log_file) {
            return;
        }
    }

    std::string line = formatEntry(entry, false) + "\n";
    *m_log_file << line;
    m_log_file_size += line.size();

    if (entry.level >= LogLevel::ERROR) {
        m_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) const {
    std::string level = "[" + getLevelName(entry.level) + "]";
    if (include_color) {
        level = getLevelColor(entry.level) + level + RESET_COLOR;
    }

    std::string formatted = formatTimestamp(entry.timestamp) + " " + level + " " +
                            entry.component + ": " + entry.message;
    if (!entry.context.empty()) {
        formatted += " (" + entry.context + ")";
    }
    return formatted;
}

bool Logger::openLogFile() {
    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory " << m_log_dir << ": " << ec.message() << std::endl;
        m_file_enabled = false;
        return false;
    }

    std::string path = getLogFilePath(0);
    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "[ERROR] Cannot open log file " << path << std::endl;
        m_file_enabled = false;
        return false;
    }

    auto existing = std::filesystem::file_size(path, ec);
    m_log_file_size = ec ? 0 : static_cast<size_t>(existing);
    m_log_file = std::move(file);
    return true;
}

void Logger::rotate() {
    m_log_file.reset();

    std::error_code ec;
    std::filesystem::remove(getLogFilePath(m_max_log_files - 1), ec);
    for (size_t index = m_max_log_files - 1; index > 0; index--) {
        std::string from = getLogFilePath(index - 1);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, getLogFilePath(index), ec);
            if (ec) {
                std::cerr << "[WARN] Log rotation failed for " << from << ": " << ec.message() << std::endl;
            }
        }
    }

    m_log_file_size = 0;
    if (!openLogFile()) {
        std::cerr << "[WARN] File logging disabled after rotation" << std::endl;
    }
}

std::string Logger::getLogFilePath(size_t index) const {
    std::string name = index == 0 ? "warden.log" : "warden." + std::to_string(index) + ".log";
    return (std::filesystem::path(m_log_dir) / name).string();
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto seconds = std::chrono::system_clock::to_time_t(time_point);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()).count() % 1000;

    std::tm utc_tm{};
    gmtime_r(&seconds, &utc_tm);

    std::ostringstream out;
    out << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << millis << "Z";
    return out.str();
}

} // namespace Warden
