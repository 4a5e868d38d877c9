// =================================================================
// include/OpenBerl/Logger.hpp
// =================================================================
// Header for pipeline logging with console and rotating file output.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace OpenBerl {

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
 * @brief Process-wide logger shared by the pipeline, the adapters and the CLI
 *
 * Writes colored lines to the console and, once initialize() has been called,
 * plain lines to size-rotated files. All writes are serialized, since parallel
 * pipeline steps log from worker threads.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Enable file output
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".openberl/logs",
                    size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                    size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     */
    void setFileLogLevel(LogLevel level);

    void setConsoleLogging(bool enabled);

    bool isFileLoggingEnabled() const;

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the start of a pipeline execution
     * @param pipeline_id Pipeline name
     * @param mode Execution mode name
     * @param step_count Number of configured steps
     */
    void logPipelineStart(const std::string& pipeline_id, const std::string& mode, size_t step_count);

    /**
     * @brief Log the end of a pipeline execution
     * @param pipeline_id Pipeline name
     * @param success False when the run ended on a configuration or routing error
     * @param total_cost Cost of this run
     * @param duration_ms Wall time of the run
     */
    void logPipelineEnd(const std::string& pipeline_id, bool success, double total_cost, long duration_ms);

    /**
     * @brief Log one completed step
     * @param step_name Step name
     * @param adapter_name Adapter that served the step
     * @param cost Cost reported by the adapter
     * @param duration_ms Step wall time
     * @param failed Whether the response was error-flagged
     */
    void logStepExecution(const std::string& step_name, const std::string& adapter_name,
                          double cost, long duration_ms, bool failed);

    /**
     * @brief Log a backend call made by an adapter
     * @param adapter_name Adapter name
     * @param model Backend model actually used
     * @param tokens Tokens reported by the backend
     * @param duration_ms Call duration
     * @param success Whether the call succeeded
     */
    void logAdapterCall(const std::string& adapter_name, const std::string& model,
                        size_t tokens, long duration_ms, bool success);

    /**
     * @brief Log a retry decision
     * @param component Adapter or component name
     * @param attempt One-based retry number
     * @param max_retries Retry budget
     * @param reason Error kind that triggered the retry
     * @param delay_ms Backoff before the retry
     */
    void logRetry(const std::string& component, size_t attempt, size_t max_retries,
                  const std::string& reason, long long delay_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);

    /**
     * @brief Parse a level name ("debug", "info", "warning", "error", "critical")
     * @throws std::invalid_argument on unknown names
     */
    static LogLevel parseLevel(const std::string& name);

    /**
     * @brief Get log level color for console output
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    mutable std::mutex m_mutex;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false) const;

    /**
     * @brief Start a new file once the current one is full and prune old files
     */
    void rotateLogsIfNeeded();

    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point) const;
    bool ensureLogDirectory();
    std::string generateLogFilename() const;
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    OpenBerl::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    OpenBerl::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    OpenBerl::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    OpenBerl::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    OpenBerl::Logger::getInstance().critical(component, message)

} // namespace OpenBerl
