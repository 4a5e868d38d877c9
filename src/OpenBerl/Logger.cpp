// =================================================================
// src/OpenBerl/Logger.cpp
// =================================================================
// Implementation for the pipeline logging system.

#include "OpenBerl/Logger.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <vector>
#include <stdexcept>
#include <cctype>

namespace OpenBerl {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_log_dir = log_dir;
        m_max_log_size = max_log_size;
        m_max_log_files = max_log_files;
        m_current_log_size = 0;

        if (!ensureLogDirectory()) {
            m_current_log_file.reset();
            return;
        }

        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
        if (!m_current_log_file->is_open()) {
            std::cerr << "[ERROR] Cannot open log file: " << m_current_log_filename << std::endl;
            m_current_log_file.reset();
            return;
        }
    }

    info("Logger", "Logging system initialized", log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

bool Logger::isFileLoggingEnabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_log_file != nullptr;
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

void Logger::logPipelineStart(const std::string& pipeline_id, const std::string& mode, size_t step_count) {
    std::ostringstream context;
    context << "Mode: " << mode << ", ";
    context << "Steps: " << step_count;

    info("Pipeline", "Starting pipeline " + pipeline_id, context.str());
}

void Logger::logPipelineEnd(const std::string& pipeline_id, bool success, double total_cost, long duration_ms) {
    std::ostringstream context;
    context << "Cost: $" << std::fixed << std::setprecision(6) << total_cost << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (success) {
        info("Pipeline", "Pipeline " + pipeline_id + " completed", context.str());
    } else {
        error("Pipeline", "Pipeline " + pipeline_id + " failed", context.str());
    }
}

void Logger::logStepExecution(const std::string& step_name, const std::string& adapter_name,
                              double cost, long duration_ms, bool failed) {
    std::ostringstream context;
    context << "Adapter: " << adapter_name << ", ";
    context << "Cost: $" << std::fixed << std::setprecision(6) << cost << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (failed) {
        warning("Pipeline", "Step '" + step_name + "' returned an error response", context.str());
    } else {
        info("Pipeline", "Step '" + step_name + "' completed", context.str());
    }
}

void Logger::logAdapterCall(const std::string& adapter_name, const std::string& model,
                            size_t tokens, long duration_ms, bool success) {
    std::ostringstream context;
    context << "Model: " << model << ", ";
    context << "Tokens: " << tokens << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (success) {
        debug(adapter_name, "Backend call succeeded", context.str());
    } else {
        error(adapter_name, "Backend call failed", context.str());
    }

    if (duration_ms > 30000) {
        warning(adapter_name, "Slow response detected", "Duration: " + std::to_string(duration_ms) + "ms");
    }
}

void Logger::logRetry(const std::string& component, size_t attempt, size_t max_retries,
                      const std::string& reason, long long delay_ms) {
    std::ostringstream context;
    context << "Retry " << attempt << "/" << max_retries << ", ";
    context << "Reason: " << reason << ", ";
    context << "Backoff: " << delay_ms << "ms";

    warning(component, "Backend call failed, retrying", context.str());
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
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

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical" || lowered == "crit") return LogLevel::CRITICAL;

    throw std::invalid_argument("Unknown log level: " + name);
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";
    }
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    // Diagnostics go to stderr so that command output on stdout stays clean
    std::cerr << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();
    if (!m_current_log_file) {
        return;
    }

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << '\n';
    m_current_log_size += formatted.length() + 1;

    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
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

    formatted << entry.component << ": " << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;
    if (!m_current_log_file->is_open()) {
        std::cerr << "[ERROR] Cannot open log file: " << m_current_log_filename << std::endl;
        m_current_log_file.reset();
        return;
    }

    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // File names embed a sortable timestamp and sequence number; newest first
        std::sort(log_files.begin(), log_files.end(),
                  [](const std::filesystem::path& a, const std::filesystem::path& b) {
                      return a.filename().string() > b.filename().string();
                  });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) const {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

bool Logger::ensureLogDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory " << m_log_dir << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

std::string Logger::generateLogFilename() const {
    static size_t sequence = 0;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream filename;
    filename << m_log_dir << "/openberl_";
    filename << std::put_time(&local_tm, "%Y%m%d_%H%M%S");
    filename << "_" << std::setfill('0') << std::setw(4) << (sequence++ % 10000);
    filename << ".log";

    return filename.str();
}

} // namespace OpenBerl
