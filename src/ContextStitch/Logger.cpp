// =================================================================
// src/ContextStitch/Logger.cpp
// =================================================================
// Implementation for the logging system.

#include "ContextStitch/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdio>

#if defined(_WIN32)
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace ContextStitch {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

bool Logger::initialize(const std::string& log_file) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_console_color = isatty(fileno(stderr)) != 0;
    m_initialized = true;

    if (log_file.empty()) {
        m_log_file.reset();
        return true;
    }

    m_log_file = std::make_unique<std::ofstream>(log_file, std::ios::app);
    if (!m_log_file->is_open()) {
        m_log_file.reset();
        return false;
    }
    return true;
}

void Logger::setConsoleLogLevel(LogLevel level) {
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logWalkSummary(size_t candidates, size_t directories, size_t pruned, size_t skipped) {
    std::ostringstream context;
    context << "Candidates: " << candidates << ", ";
    context << "Directories: " << directories << ", ";
    context << "Pruned: " << pruned << ", ";
    context << "Unreadable entries: " << skipped;

    info("TreeWalker", "Walk completed", context.str());

    if (skipped > 0) {
        warning("TreeWalker", "Some entries could not be read",
                "Entries skipped: " + std::to_string(skipped));
    }
}

void Logger::logClassificationSummary(size_t included, size_t binary, size_t oversize,
                                      size_t unreadable, size_t fallback_decoded) {
    std::ostringstream context;
    context << "Included: " << included << ", ";
    context << "Binary: " << binary << ", ";
    context << "Oversize: " << oversize << ", ";
    context << "Unreadable: " << unreadable;

    info("FileClassifier", "Classification completed", context.str());

    if (fallback_decoded > 0) {
        warning("FileClassifier",
                "Some files contained undecodable bytes and were decoded with replacement characters",
                "Files: " + std::to_string(fallback_decoded));
    }
}

void Logger::logSessionStart(const std::string& root, const std::string& format) {
    std::ostringstream context;
    context << "Root: " << root << ", ";
    context << "Format: " << format;

    debug("Session", "Session started", context.str());
}

void Logger::logSessionEnd(int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        debug("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_log_file && m_log_file->is_open()) {
        m_log_file->flush();
    }
    std::cerr.flush();
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_initialized) {
        // Console-only defaults until the application configures us
        m_console_color = isatty(fileno(stderr)) != 0;
        m_initialized = true;
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    std::cerr << formatEntry(entry, m_console_color) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_log_file || entry.level < m_file_level) {
        return;
    }

    *m_log_file << formatEntry(entry, false) << '\n';

    // Flush error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) const {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_tm{};
#if defined(_WIN32)
    localtime_s(&local_tm, &time_t);
#else
    localtime_r(&time_t, &local_tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

} // namespace ContextStitch
