// =================================================================
// include/Collate/Logger.hpp
// =================================================================
// Header for leveled console and file logging.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>

namespace Collate {

struct SelectionResult;

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
 * @brief Process-wide logger for progress reporting and diagnostics
 *
 * Writes component-tagged entries to the console and, when a log directory
 * is configured, to size-rotated log files.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files; empty disables file logging
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = "",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Enable or disable ANSI colors on the console
     */
    void setConsoleColors(bool enabled);

    /**
     * @brief Whether standard output is a terminal that renders ANSI colors
     */
    static bool consoleSupportsColor();

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a selection run
     *
     * Emits one warning per skipped entry, one info line per section and a
     * summary of the selected files.
     * @param result Selection result to summarize
     */
    void logSelection(const SelectionResult& result);

    /**
     * @brief Log run start
     * @param config_path Configuration file in use
     * @param base_directory Directory being scanned
     * @param output_path Destination of the generated document
     */
    void logRunStart(const std::string& config_path, const std::string& base_directory,
                     const std::string& output_path);

    /**
     * @brief Log run end
     * @param exit_code Exit code
     * @param duration_ms Run duration in milliseconds
     */
    void logRunEnd(int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_colors = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if the current one exceeds the size limit
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);

    /**
     * @brief Ensure log directory exists
     * @return false if the directory cannot be created
     */
    bool ensureLogDirectory();

    std::string generateLogFilename();
};

// Convenience macros for logging
#define COLLATE_LOG_DEBUG(component, message) \
    Collate::Logger::getInstance().debug(component, message)

#define COLLATE_LOG_INFO(component, message) \
    Collate::Logger::getInstance().info(component, message)

#define COLLATE_LOG_WARNING(component, message) \
    Collate::Logger::getInstance().warning(component, message)

#define COLLATE_LOG_ERROR(component, message) \
    Collate::Logger::getInstance().error(component, message)

#define COLLATE_LOG_CRITICAL(component, message) \
    Collate::Logger::getInstance().critical(component, message)

} // namespace Collate
