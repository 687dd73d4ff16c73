// =================================================================
// src/Quorum/ErrorRecovery.cpp
// =================================================================

#include "Quorum/ErrorRecovery.hpp"
#include "Quorum/TimeFormat.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <new>
#include <random>
#include <sstream>
#include <system_error>

namespace Quorum {

namespace {

bool containsAny(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

RetryConfig makeConfig(RetryStrategy strategy, size_t attempts, long base_ms, long max_ms, double factor) {
    RetryConfig config;
    config.strategy = strategy;
    config.max_attempts = attempts;
    config.base_delay = std::chrono::milliseconds(base_ms);
    config.max_delay = std::chrono::milliseconds(max_ms);
    config.backoff_factor = factor;
    config.jitter = true;
    return config;
}

} // anonymous namespace

std::string errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "low";
        case ErrorSeverity::MEDIUM: return "medium";
        case ErrorSeverity::HIGH: return "high";
        case ErrorSeverity::CRITICAL: return "critical";
    }
    return "medium";
}

std::string retryStrategyToString(RetryStrategy strategy) {
    switch (strategy) {
        case RetryStrategy::EXPONENTIAL_BACKOFF: return "exponential_backoff";
        case RetryStrategy::LINEAR_BACKOFF: return "linear_backoff";
        case RetryStrategy::FIXED_DELAY: return "fixed_delay";
        case RetryStrategy::IMMEDIATE: return "immediate";
        case RetryStrategy::NO_RETRY: return "no_retry";
    }
    return "no_retry";
}

nlohmann::json ErrorInfo::toJson() const {
    return {
        {"error_id", error_id},
        {"error_type", errorTypeToString(error_type)},
        {"message", message},
        {"exception_type", exception_type},
        {"context", context},
        {"timestamp", formatIsoTimestamp(timestamp)},
        {"severity", errorSeverityToString(severity)},
        {"recoverable", recoverable},
        {"suggested_action", suggested_action}
    };
}

nlohmann::json ErrorStatistics::toJson() const {
    return {
        {"total_errors", total_errors},
        {"errors_by_type", errors_by_type},
        {"severity_distribution", severity_distribution},
        {"recovery_actions_available", recovery_actions_available},
        {"history_keys", history_keys}
    };
}

// =================================================================
// Construction and defaults
// =================================================================

ErrorRecoveryManager::ErrorRecoveryManager() {
    for (ErrorType type : {ErrorType::NETWORK, ErrorType::TIMEOUT, ErrorType::VALIDATION,
                           ErrorType::AI_SERVICE, ErrorType::FILESYSTEM, ErrorType::PROCESSING,
                           ErrorType::RESOURCE, ErrorType::USER, ErrorType::UNKNOWN}) {
        m_retry_configs[type] = defaultRetryConfig(type);
    }

    RecoveryAction disk_space;
    disk_space.action_id = "check_disk_space";
    disk_space.description = "Check available disk space";
    disk_space.priority = 9;
    disk_space.handler = [](const ErrorInfo& info) {
        auto it = info.context.find("path");
        std::filesystem::path target = it != info.context.end() ? std::filesystem::path(it->second)
                                                                 : std::filesystem::current_path();
        if (!std::filesystem::exists(target)) {
            target = target.parent_path().empty() ? std::filesystem::current_path() : target.parent_path();
        }

        std::error_code ec;
        auto info_space = std::filesystem::space(target, ec);
        if (ec) {
            return RecoveryOutcome::failed("Cannot query disk space: " + ec.message());
        }

        const std::uintmax_t min_free = 100ULL * 1024 * 1024;
        if (info_space.available < min_free) {
            return RecoveryOutcome::failed("Less than 100MB free at " + target.string());
        }
        return RecoveryOutcome::succeeded("Disk space available");
    };
    registerRecoveryAction(ErrorType::FILESYSTEM, disk_space);

    RecoveryAction create_dirs;
    create_dirs.action_id = "create_missing_dirs";
    create_dirs.description = "Create missing parent directories";
    create_dirs.priority = 8;
    create_dirs.handler = [](const ErrorInfo& info) {
        auto it = info.context.find("path");
        if (it == info.context.end()) {
            return RecoveryOutcome::failed("No path in error context");
        }

        std::filesystem::path parent = std::filesystem::path(it->second).parent_path();
        if (parent.empty() || std::filesystem::exists(parent)) {
            return RecoveryOutcome::failed("Nothing to create");
        }

        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return RecoveryOutcome::failed("Cannot create " + parent.string() + ": " + ec.message());
        }
        return RecoveryOutcome::succeeded("Created " + parent.string());
    };
    registerRecoveryAction(ErrorType::FILESYSTEM, create_dirs);
}

RetryConfig ErrorRecoveryManager::defaultRetryConfig(ErrorType type) {
    switch (type) {
        case ErrorType::NETWORK:
            return makeConfig(RetryStrategy::EXPONENTIAL_BACKOFF, 5, 2000, 120000, 2.0);
        case ErrorType::TIMEOUT:
            return makeConfig(RetryStrategy::LINEAR_BACKOFF, 3, 5000, 30000, 1.5);
        case ErrorType::AI_SERVICE:
            return makeConfig(RetryStrategy::EXPONENTIAL_BACKOFF, 4, 3000, 60000, 2.5);
        case ErrorType::FILESYSTEM:
            return makeConfig(RetryStrategy::FIXED_DELAY, 2, 1000, 5000, 2.0);
        case ErrorType::PROCESSING:
            return makeConfig(RetryStrategy::IMMEDIATE, 2, 1000, 60000, 2.0);
        case ErrorType::RESOURCE:
            return makeConfig(RetryStrategy::LINEAR_BACKOFF, 3, 10000, 60000, 2.0);
        case ErrorType::VALIDATION:
        case ErrorType::USER:
            return makeConfig(RetryStrategy::NO_RETRY, 0, 0, 0, 1.0);
        case ErrorType::UNKNOWN:
            break;
    }
    return makeConfig(RetryStrategy::EXPONENTIAL_BACKOFF, 3, 1000, 60000, 2.0);
}

ErrorSeverity ErrorRecoveryManager::severityFor(ErrorType type, bool allocation_failure) {
    switch (type) {
        case ErrorType::RESOURCE:
            return allocation_failure ? ErrorSeverity::CRITICAL : ErrorSeverity::MEDIUM;
        case ErrorType::AI_SERVICE:
        case ErrorType::FILESYSTEM:
            return ErrorSeverity::HIGH;
        case ErrorType::VALIDATION:
        case ErrorType::USER:
            return ErrorSeverity::LOW;
        case ErrorType::NETWORK:
        case ErrorType::TIMEOUT:
        case ErrorType::PROCESSING:
        case ErrorType::UNKNOWN:
            break;
    }
    return ErrorSeverity::MEDIUM;
}

std::string ErrorRecoveryManager::suggestedActionFor(ErrorType type) {
    switch (type) {
        case ErrorType::NETWORK:
            return "Check network connectivity and that the inference endpoints are reachable";
        case ErrorType::TIMEOUT:
            return "Retry later or raise the endpoint timeout";
        case ErrorType::VALIDATION:
            return "Check the input data format and required fields";
        case ErrorType::AI_SERVICE:
            return "Check that the inference service is running and the model is pulled";
        case ErrorType::FILESYSTEM:
            return "Check file permissions and available disk space";
        case ErrorType::PROCESSING:
            return "Inspect the model output; a retry may produce well-formed JSON";
        case ErrorType::RESOURCE:
            return "Free memory or reduce the input size";
        case ErrorType::USER:
            return "Review the request parameters";
        case ErrorType::UNKNOWN:
            break;
    }
    return "Check the logs for details";
}

// =================================================================
// Classification
// =================================================================

ErrorInfo ErrorRecoveryManager::classify(std::exception_ptr error, const ErrorContext& context) const {
    ErrorInfo info;
    info.timestamp = std::chrono::system_clock::now();
    info.error_id = generateErrorId(info.timestamp);
    info.context = context;

    bool typed = false;
    bool allocation_failure = false;
    std::optional<ErrorType> by_class;

    try {
        if (error) {
            std::rethrow_exception(error);
        }
        info.message = "Unknown error";
        info.exception_type = "unknown";
    } catch (const QuorumError& e) {
        typed = true;
        info.error_type = e.getType();
        info.message = e.what();
        info.exception_type = e.getName();
    } catch (const std::bad_alloc& e) {
        allocation_failure = true;
        by_class = ErrorType::RESOURCE;
        info.message = e.what();
        info.exception_type = "std::bad_alloc";
    } catch (const std::length_error& e) {
        by_class = ErrorType::RESOURCE;
        info.message = e.what();
        info.exception_type = "std::length_error";
    } catch (const std::filesystem::filesystem_error& e) {
        by_class = ErrorType::FILESYSTEM;
        info.message = e.what();
        info.exception_type = "std::filesystem::filesystem_error";
    } catch (const nlohmann::json::exception& e) {
        by_class = ErrorType::PROCESSING;
        info.message = e.what();
        info.exception_type = "nlohmann::json::exception";
    } catch (const std::invalid_argument& e) {
        by_class = ErrorType::VALIDATION;
        info.message = e.what();
        info.exception_type = "std::invalid_argument";
    } catch (const std::domain_error& e) {
        by_class = ErrorType::VALIDATION;
        info.message = e.what();
        info.exception_type = "std::domain_error";
    } catch (const std::system_error& e) {
        // The system message reads "Connection timed out", keep it out of keyword matching
        if (e.code() == std::errc::timed_out) {
            typed = true;
            info.error_type = ErrorType::TIMEOUT;
        }
        info.message = e.what();
        info.exception_type = "std::system_error";
    } catch (const std::exception& e) {
        info.message = e.what();
        info.exception_type = "std::exception";
    } catch (...) {
        info.message = "Non-standard exception";
        info.exception_type = "unknown";
    }

    if (!typed) {
        std::string lowered = toLower(info.message);
        if (containsAny(lowered, {"ollama", "llm"})) {
            info.error_type = ErrorType::AI_SERVICE;
        } else if (containsAny(lowered, {"connection", "network", "dns", "ssl"})) {
            info.error_type = ErrorType::NETWORK;
        } else if (by_class) {
            info.error_type = *by_class;
        } else {
            info.error_type = ErrorType::UNKNOWN;
        }
    }

    info.severity = severityFor(info.error_type, allocation_failure && info.error_type == ErrorType::RESOURCE);
    info.recoverable = info.error_type != ErrorType::VALIDATION && info.error_type != ErrorType::USER;
    info.suggested_action = suggestedActionFor(info.error_type);
    return info;
}

std::string ErrorRecoveryManager::generateErrorId(std::chrono::system_clock::time_point timestamp) {
    static std::atomic<unsigned> sequence{0};

    std::ostringstream oss;
    oss << "err_" << formatUtc(timestamp, "%Y%m%d_%H%M%S") << "_"
        << std::setfill('0') << std::setw(4) << (sequence.fetch_add(1) % 10000);
    return oss.str();
}

// =================================================================
// Retry policy
// =================================================================

bool ErrorRecoveryManager::shouldRetry(const ErrorInfo& info, const RetryConfig& config) const {
    if (!info.recoverable) {
        return false;
    }
    if (config.strategy == RetryStrategy::NO_RETRY) {
        return false;
    }
    return config.stop_on.count(info.error_type) == 0;
}

std::chrono::milliseconds ErrorRecoveryManager::computeDelay(const RetryConfig& config, size_t attempt) {
    if (attempt == 0) {
        attempt = 1;
    }

    double base = static_cast<double>(config.base_delay.count());
    double delay = 0.0;

    switch (config.strategy) {
        case RetryStrategy::IMMEDIATE:
        case RetryStrategy::NO_RETRY:
            return std::chrono::milliseconds(0);
        case RetryStrategy::FIXED_DELAY:
            delay = base;
            break;
        case RetryStrategy::LINEAR_BACKOFF:
            delay = base * static_cast<double>(attempt);
            break;
        case RetryStrategy::EXPONENTIAL_BACKOFF:
            delay = base * std::pow(config.backoff_factor, static_cast<double>(attempt - 1));
            break;
    }

    delay = std::min(delay, static_cast<double>(config.max_delay.count()));

    if (config.jitter) {
        thread_local std::mt19937 generator(std::random_device{}());
        std::uniform_real_distribution<double> distribution(0.5, 1.5);
        delay *= distribution(generator);
    }

    return std::chrono::milliseconds(static_cast<long long>(std::llround(std::max(0.0, delay))));
}

void ErrorRecoveryManager::setRetryConfig(ErrorType type, const RetryConfig& config) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_retry_configs[type] = config;
}

RetryConfig ErrorRecoveryManager::getRetryConfig(ErrorType type) const {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    auto it = m_retry_configs.find(type);
    if (it == m_retry_configs.end()) {
        return defaultRetryConfig(ErrorType::UNKNOWN);
    }
    return it->second;
}

void ErrorRecoveryManager::logRetry(const ErrorInfo& info, size_t attempt, const RetryConfig& config) const {
    Logger::getInstance().warning("ErrorRecovery",
        "Attempt " + std::to_string(attempt) + "/" + std::to_string(config.max_attempts) +
        " failed: " + info.message,
        errorTypeToString(info.error_type) + ", " + retryStrategyToString(config.strategy));
}

// =================================================================
// Recovery actions
// =================================================================

void ErrorRecoveryManager::registerRecoveryAction(ErrorType type, const RecoveryAction& action) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    auto& actions = m_recovery_actions[type];
    actions.push_back(action);
    std::stable_sort(actions.begin(), actions.end(),
                     [](const RecoveryAction& a, const RecoveryAction& b) { return a.priority > b.priority; });
}

std::vector<RecoveryAction> ErrorRecoveryManager::getRecoveryActions(ErrorType type) const {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    auto it = m_recovery_actions.find(type);
    if (it == m_recovery_actions.end()) {
        return {};
    }
    return it->second;
}

bool ErrorRecoveryManager::attemptRecovery(const ErrorInfo& info) {
    for (const auto& action : getRecoveryActions(info.error_type)) {
        if (!action.automated || !action.handler) {
            continue;
        }

        RecoveryOutcome outcome = runRecoveryAction(action, info);
        if (outcome.success) {
            Logger::getInstance().info("ErrorRecovery",
                "Recovery action succeeded: " + action.action_id, outcome.message);
            return true;
        }

        Logger::getInstance().debug("ErrorRecovery",
            "Recovery action did not help: " + action.action_id, outcome.message);
    }
    return false;
}

RecoveryOutcome ErrorRecoveryManager::runRecoveryAction(const RecoveryAction& action, const ErrorInfo& info) {
    try {
        return action.handler(info);
    } catch (const std::exception& e) {
        Logger::getInstance().warning("ErrorRecovery",
            "Recovery action threw: " + action.action_id, e.what());
        return RecoveryOutcome::failed(e.what());
    } catch (...) {
        Logger::getInstance().warning("ErrorRecovery",
            "Recovery action threw: " + action.action_id, "non-standard exception");
        return RecoveryOutcome::failed("Recovery action threw a non-standard exception");
    }
}

// =================================================================
// History and reporting
// =================================================================

void ErrorRecoveryManager::recordError(const ErrorInfo& info) noexcept {
    try {
        std::string key = errorTypeToString(info.error_type) + "_" + formatUtc(info.timestamp, "%Y%m%d");

        std::lock_guard<std::mutex> lock(m_history_mutex);
        auto& bucket = m_error_history[key];
        bucket.push_back(info);
        if (bucket.size() > MAX_HISTORY_PER_BUCKET) {
            bucket.erase(bucket.begin(), bucket.begin() + (bucket.size() - MAX_HISTORY_PER_BUCKET));
        }
    } catch (const std::exception& e) {
        try {
            Logger::getInstance().error("ErrorRecovery", "Failed to record error", e.what());
        } catch (const std::exception&) {
            return;
        }
    }
}

std::vector<ErrorInfo> ErrorRecoveryManager::getErrorHistory() const {
    std::vector<ErrorInfo> all;
    {
        std::lock_guard<std::mutex> lock(m_history_mutex);
        for (const auto& [key, bucket] : m_error_history) {
            all.insert(all.end(), bucket.begin(), bucket.end());
        }
    }

    std::stable_sort(all.begin(), all.end(),
                     [](const ErrorInfo& a, const ErrorInfo& b) { return a.timestamp < b.timestamp; });
    return all;
}

ErrorStatistics ErrorRecoveryManager::getErrorStatistics() const {
    ErrorStatistics stats;
    {
        std::lock_guard<std::mutex> lock(m_history_mutex);
        for (const auto& [key, bucket] : m_error_history) {
            stats.history_keys.push_back(key);
            for (const auto& info : bucket) {
                ++stats.total_errors;
                ++stats.errors_by_type[errorTypeToString(info.error_type)];
                ++stats.severity_distribution[errorSeverityToString(info.severity)];
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(m_config_mutex);
        for (const auto& [type, actions] : m_recovery_actions) {
            stats.recovery_actions_available += actions.size();
        }
    }
    return stats;
}

nlohmann::json ErrorRecoveryManager::exportErrorReport(
    std::optional<std::chrono::system_clock::time_point> start,
    std::optional<std::chrono::system_clock::time_point> end) const {

    auto now = std::chrono::system_clock::now();
    auto window_start = start.value_or(now - std::chrono::hours(24 * 7));
    auto window_end = end.value_or(now);

    nlohmann::json errors = nlohmann::json::array();
    for (const auto& info : getErrorHistory()) {
        if (info.timestamp >= window_start && info.timestamp <= window_end) {
            errors.push_back(info.toJson());
        }
    }

    return {
        {"report_period", {
            {"start", formatIsoTimestamp(window_start)},
            {"end", formatIsoTimestamp(window_end)}
        }},
        {"error_count", errors.size()},
        {"errors", errors},
        {"statistics", getErrorStatistics().toJson()},
        {"generated_at", formatIsoTimestamp(now)}
    };
}

void ErrorRecoveryManager::clearHistory() {
    std::lock_guard<std::mutex> lock(m_history_mutex);
    m_error_history.clear();
}

} // namespace Quorum
