// =================================================================
// include/Tandem/Logger.hpp
// =================================================================
// Header for engine-wide logging and run audit trails.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Tandem {

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
 * @brief Process-wide logger shared by the engine components
 *
 * Writes coloured lines to the console and plain lines to size-rotated
 * files. Safe to call from the orchestration and agent worker threads.
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
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".tandem/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log workspace scan results
     * @param scanned_files Number of files visited
     * @param included_files Number of files loaded into the task context
     * @param total_bytes Bytes of content loaded
     */
    void logWorkspaceScan(size_t scanned_files, size_t included_files, size_t total_bytes);

    /**
     * @brief Log a model invocation
     * @param role Role that was invoked
     * @param prompt_size Prompt size in characters
     * @param response_size Response size in characters
     * @param duration_ms Invocation duration in milliseconds
     * @param success Whether the invocation succeeded
     */
    void logModelInvocation(const std::string& role, size_t prompt_size, size_t response_size,
                            long duration_ms, bool success);

    /**
     * @brief Log a change of the resident model
     * @param from_role Previously warm role (empty when cold)
     * @param to_role Newly warm role
     * @param duration_ms Time spent loading the new model
     */
    void logModelSwitch(const std::string& from_role, const std::string& to_role, long duration_ms);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param user_prompt User prompt/request
     */
    void logSessionStart(const std::string& command, const std::string& user_prompt);

    /**
     * @brief Log session end
     * @param command Command that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);

    /**
     * @brief Parse a level name such as "debug" or "WARN"
     * @param name Level name, case-insensitive
     * @param fallback Level returned when the name is not recognised
     * @return Parsed level
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
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
    bool m_console_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;
    std::recursive_mutex m_mutex;

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
     * @brief Rotate log files once the current one exceeds the size limit
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define TANDEM_LOG_DEBUG(component, message) \
    Tandem::Logger::getInstance().debug(component, message)

#define TANDEM_LOG_INFO(component, message) \
    Tandem::Logger::getInstance().info(component, message)

#define TANDEM_LOG_WARNING(component, message) \
    Tandem::Logger::getInstance().warning(component, message)

#define TANDEM_LOG_ERROR(component, message) \
    Tandem::Logger::getInstance().error(component, message)

#define TANDEM_LOG_CRITICAL(component, message) \
    Tandem::Logger::getInstance().critical(component, message)

} // namespace Tandem
