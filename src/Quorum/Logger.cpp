// =================================================================
// src/Quorum/Logger.cpp
// =================================================================

#include "Quorum/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Quorum {

namespace {

struct LevelStyle {
    const char* tag;
    const char* color;
};

LevelStyle styleOf(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return {"DEBUG", "\033[90m"};     // dark gray
        case LogLevel::INFO: return {"INFO", "\033[36m"};       // cyan
        case LogLevel::WARNING: return {"WARN", "\033[33m"};    // yellow
        case LogLevel::ERROR: return {"ERROR", "\033[31m"};     // red
        case LogLevel::CRITICAL: return {"CRIT", "\033[91m"};   // bright red
    }
    return {"UNKNOWN", "\033[0m"};
}

const char* const COLOR_RESET = "\033[0m";
const long SLOW_CALL_MS = 30000;

} // anonymous namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.close();
    }
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        openLocked(log_dir, max_log_size, max_log_files);
    }
    info("Logger", "Logging system initialized", log_dir);
}

void Logger::openLocked(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = std::max<size_t>(1, max_log_files);
    m_opened = true;

    std::error_code ec;
    std::filesystem::create_directories(m_log_dir, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create log directory " << m_log_dir << ": " << ec.message()
                  << ", logging to the working directory" << std::endl;
        m_log_dir = ".";
    }

    startNewFile();
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

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& context) {
    LogRecord record{std::chrono::system_clock::now(), level, component, message, context};

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_opened) {
        openLocked(".quorum/logs", m_max_log_size, m_max_log_files);
    }
    emitToConsole(record);
    emitToFile(record);
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

// =================================================================
// Structured helpers
// =================================================================

void Logger::logEndpointCall(const std::string& endpoint_id, long duration_ms,
                             bool success, const std::string& error_message) {
    std::string context = "Endpoint: " + endpoint_id + ", Duration: " + std::to_string(duration_ms) + "ms";
    if (success) {
        debug("LLM", "Request completed successfully", context);
    } else {
        warning("LLM", "Request failed", context + ", Error: " + error_message);
    }

    if (duration_ms > SLOW_CALL_MS) {
        warning("LLM", "Slow response detected", endpoint_id + " took " + std::to_string(duration_ms) + "ms");
    }
}

void Logger::logHealthCheck(const std::string& endpoint_id, const std::string& status, long duration_ms) {
    std::string context = "Status: " + status + ", Duration: " + std::to_string(duration_ms) + "ms";
    LogLevel level = status == "healthy" ? LogLevel::DEBUG : LogLevel::WARNING;
    std::string message = status == "healthy" ? "Endpoint " + endpoint_id + " checked"
                                              : "Endpoint " + endpoint_id + " is " + status;
    log(level, "HealthCheck", message, context);
}

void Logger::logExtractionSummary(const std::string& status, double confidence, long duration_ms,
                                  const std::vector<std::string>& failed_fields) {
    std::ostringstream context;
    context << "Status: " << status
            << ", Confidence: " << std::fixed << std::setprecision(2) << confidence
            << ", Duration: " << duration_ms << "ms";

    if (failed_fields.empty()) {
        info("Extractor", "Extraction finished", context.str());
        return;
    }

    context << ", Defaulted: ";
    for (size_t i = 0; i < failed_fields.size(); ++i) {
        context << (i > 0 ? ", " : "") << failed_fields[i];
    }
    warning("Extractor", "Extraction finished with defaulted fields", context.str());
}

void Logger::logSessionStart(const std::string& command, const std::string& input) {
    std::string context = "Command: " + command;
    if (!input.empty()) {
        context += ", Input: " + input;
    }
    info("Session", "Session started", context);
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::string context = "Command: " + command + ", Exit code: " + std::to_string(exit_code) +
                          ", Duration: " + std::to_string(duration_ms) + "ms";
    if (exit_code == 0) {
        info("Session", "Session completed successfully", context);
    } else {
        error("Session", "Session completed with errors", context);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.flush();
    }
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_file_path;
}

// =================================================================
// Levels
// =================================================================

std::string Logger::getLevelName(LogLevel level) {
    return styleOf(level).tag;
}

std::string Logger::getLevelColor(LogLevel level) {
    return styleOf(level).color;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warning" || lowered == "warn") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical" || lowered == "crit") return LogLevel::CRITICAL;
    return std::nullopt;
}

// =================================================================
// Sinks
// =================================================================

void Logger::emitToConsole(const LogRecord& record) const {
    if (!m_console_enabled || record.level < m_console_level) {
        return;
    }
    // stdout carries command output only
    std::cerr << render(record, true) << std::endl;
}

void Logger::emitToFile(const LogRecord& record) {
    if (record.level < m_file_level) {
        return;
    }

    if (m_file_bytes >= m_max_log_size) {
        startNewFile();
        removeOldFiles();
    }
    if (!m_file.is_open()) {
        return;
    }

    std::string line = render(record, false);
    m_file << line << '\n';
    m_file_bytes += line.size() + 1;

    if (record.level >= LogLevel::ERROR) {
        m_file.flush();
    }
}

std::string Logger::render(const LogRecord& record, bool colored) {
    LevelStyle style = styleOf(record.level);

    std::string line = localTimestamp(record.timestamp) + " ";
    line += colored ? std::string(style.color) + "[" + style.tag + "]" + COLOR_RESET
                    : std::string("[") + style.tag + "]";
    line += " " + record.component + ": " + record.message;
    if (!record.context.empty()) {
        line += " (" + record.context + ")";
    }
    return line;
}

std::string Logger::localTimestamp(const std::chrono::system_clock::time_point& time_point) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

// =================================================================
// Files
// =================================================================

std::string Logger::nextFilePath() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream path;
    path << m_log_dir << "/quorum_" << std::put_time(&local, "%Y%m%d_%H%M%S");
    if (m_file_sequence > 0) {
        path << "_" << m_file_sequence;
    }
    path << ".log";
    ++m_file_sequence;
    return path.str();
}

void Logger::startNewFile() {
    if (m_file.is_open()) {
        m_file.close();
    }
    m_file.clear();

    m_file_path = nextFilePath();
    m_file_bytes = 0;
    m_file.open(m_file_path, std::ios::app);
    if (!m_file.is_open()) {
        std::cerr << "[WARN] Cannot open log file " << m_file_path << ", file logging disabled" << std::endl;
    }
}

void Logger::removeOldFiles() {
    std::error_code ec;
    std::vector<std::filesystem::path> previous;
    for (std::filesystem::directory_iterator it(m_log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() == ".log" && path != std::filesystem::path(m_file_path) &&
            it->is_regular_file(ec)) {
            previous.push_back(path);
        }
    }
    if (ec) {
        std::cerr << "[WARN] Cannot list log directory " << m_log_dir << ": " << ec.message() << std::endl;
        return;
    }

    // The current file always counts as one of the kept files
    size_t keep = m_max_log_files - 1;
    if (previous.size() <= keep) {
        return;
    }

    auto modified = [](const std::filesystem::path& path) {
        std::error_code time_ec;
        return std::filesystem::last_write_time(path, time_ec);
    };
    std::sort(previous.begin(), previous.end(),
              [&modified](const std::filesystem::path& a, const std::filesystem::path& b) {
                  return modified(a) > modified(b);
              });

    for (size_t i = keep; i < previous.size(); ++i) {
        std::filesystem::remove(previous[i], ec);
    }
}

} // namespace Quorum
