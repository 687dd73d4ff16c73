// =================================================================
// include/Quorum/Logger.hpp
// =================================================================
// Leveled, component-tagged logging to the console and rotating files.

#pragma once

#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Quorum {

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
 * @brief One record as handed to the sinks
 */
struct LogRecord {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;
};

/**
 * @brief Process-wide logging system
 *
 * Entries go to stderr (colored) and to a log file that is replaced once it
 * reaches the size limit; only the newest files are kept. Extraction and
 * health-check threads log concurrently, so every write holds one mutex.
 * Logging before initialize() opens the default directory.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Open the log directory and start a new log file
     * @param log_dir Directory for log files
     * @param max_log_size Size in bytes after which a new file is started
     * @param max_log_files Number of log files kept in the directory
     */
    void initialize(const std::string& log_dir = ".quorum/logs",
                    size_t max_log_size = 10 * 1024 * 1024,
                    size_t max_log_files = 5);

    void setConsoleLogLevel(LogLevel level);
    void setFileLogLevel(LogLevel level);
    void setConsoleLogging(bool enabled);

    /**
     * @brief Write one entry
     * @param level Severity
     * @param component Subsystem name, e.g. "ConnectionManager"
     * @param message Message text
     * @param context Optional details, printed in parentheses
     */
    void log(LogLevel level, const std::string& component, const std::string& message,
             const std::string& context = "");

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of one call to an LLM endpoint
     *
     * Calls slower than 30 seconds get an extra warning.
     */
    void logEndpointCall(const std::string& endpoint_id, long duration_ms,
                         bool success, const std::string& error_message = "");

    void logHealthCheck(const std::string& endpoint_id, const std::string& status, long duration_ms);

    /**
     * @brief Log the summary of one extraction run
     * @param failed_fields Fields that fell back to defaults
     */
    void logExtractionSummary(const std::string& status, double confidence, long duration_ms,
                              const std::vector<std::string>& failed_fields);

    void logSessionStart(const std::string& command, const std::string& input);
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    void flush();

    /**
     * @brief Path of the file currently written to, empty before the first entry
     */
    std::string getCurrentLogFile() const;

    /// Short upper-case tag printed in brackets, e.g. "WARN"
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Parse a level name such as "debug" or "WARNING"
     * @param name Level name, case-insensitive; "warn" and "crit" accepted
     * @return Log level, or std::nullopt if unrecognized
     */
    static std::optional<LogLevel> parseLevel(const std::string& name);

    /// ANSI color sequence used for a level on the console
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void openLocked(const std::string& log_dir, size_t max_log_size, size_t max_log_files);
    void startNewFile();
    void removeOldFiles();
    std::string nextFilePath();

    void emitToConsole(const LogRecord& record) const;
    void emitToFile(const LogRecord& record);

    static std::string render(const LogRecord& record, bool colored);
    static std::string localTimestamp(const std::chrono::system_clock::time_point& time_point);

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;

    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_opened = false;

    std::ofstream m_file;
    std::string m_file_path;
    size_t m_file_bytes = 0;
    size_t m_file_sequence = 0;

    mutable std::mutex m_mutex;
};

// Convenience macros for logging
#define QUORUM_LOG_DEBUG(component, message) \
    Quorum::Logger::getInstance().debug(component, message)

#define QUORUM_LOG_INFO(component, message) \
    Quorum::Logger::getInstance().info(component, message)

#define QUORUM_LOG_WARNING(component, message) \
    Quorum::Logger::getInstance().warning(component, message)

#define QUORUM_LOG_ERROR(component, message) \
    Quorum::Logger::getInstance().error(component, message)

#define QUORUM_LOG_CRITICAL(component, message) \
    Quorum::Logger::getInstance().critical(component, message)

} // namespace Quorum
