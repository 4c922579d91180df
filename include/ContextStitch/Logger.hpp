// =================================================================
// include/ContextStitch/Logger.hpp
// =================================================================
// Header for leveled, component-tagged logging.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace ContextStitch {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger
 *
 * Console output goes to stderr so that stdout stays free for the
 * generated artifact. An optional log file receives every entry at or
 * above the file level.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize the logger
     * @param log_file Path of a log file to append to; empty for console only
     * @return false if the log file could not be opened
     */
    bool initialize(const std::string& log_file = "");

    void setConsoleLogLevel(LogLevel level);
    void setFileLogLevel(LogLevel level);
    void setConsoleLogging(bool enabled);

    LogLevel getConsoleLogLevel() const { return m_console_level; }

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a directory walk
     * @param candidates Files that survived filtering
     * @param directories Directories descended into
     * @param pruned Directories pruned by ignore rules
     * @param skipped Entries that could not be read
     */
    void logWalkSummary(size_t candidates, size_t directories, size_t pruned, size_t skipped);

    /**
     * @brief Log classification statistics
     */
    void logClassificationSummary(size_t included, size_t binary, size_t oversize,
                                  size_t unreadable, size_t fallback_decoded);

    /**
     * @brief Log session start
     * @param root Root directory being stitched
     * @param format Output format name
     */
    void logSessionStart(const std::string& root, const std::string& format);

    /**
     * @brief Log session end
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(int exit_code, long duration_ms);

    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_console_color = false;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_log_file;
    std::mutex m_mutex;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color) const;
    static std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
};

// Convenience macros for logging; an optional third argument is the context
#define LOG_DEBUG(component, ...) \
    ContextStitch::Logger::getInstance().debug(component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ContextStitch::Logger::getInstance().info(component, __VA_ARGS__)

#define LOG_WARNING(component, ...) \
    ContextStitch::Logger::getInstance().warning(component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ContextStitch::Logger::getInstance().error(component, __VA_ARGS__)

#define LOG_CRITICAL(component, ...) \
    ContextStitch::Logger::getInstance().critical(component, __VA_ARGS__)

} // namespace ContextStitch
