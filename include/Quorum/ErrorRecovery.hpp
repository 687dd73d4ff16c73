// =================================================================
// include/Quorum/ErrorRecovery.hpp
// =================================================================
// Error classification, retry policies and recovery actions.

#pragma once

#include "Quorum/CancellationToken.hpp"
#include "Quorum/Errors.hpp"
#include "Quorum/Logger.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Quorum {

/**
 * @brief Error severity levels
 */
enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

std::string errorSeverityToString(ErrorSeverity severity);

/**
 * @brief Delay policy between attempts
 */
enum class RetryStrategy {
    EXPONENTIAL_BACKOFF,    ///< base * factor^(attempt-1)
    LINEAR_BACKOFF,         ///< base * attempt
    FIXED_DELAY,            ///< base
    IMMEDIATE,              ///< no delay
    NO_RETRY                ///< fail on first error
};

std::string retryStrategyToString(RetryStrategy strategy);

/**
 * @brief Caller-supplied key/value context attached to error records
 */
using ErrorContext = std::map<std::string, std::string>;

/**
 * @brief Immutable record of one classified failure
 */
struct ErrorInfo {
    std::string error_id;                         ///< err_YYYYMMDD_HHMMSS_NNNN
    ErrorType error_type = ErrorType::UNKNOWN;
    std::string message;
    std::string exception_type;                   ///< Name of the raised exception class
    ErrorContext context;
    std::chrono::system_clock::time_point timestamp;
    ErrorSeverity severity = ErrorSeverity::MEDIUM;
    bool recoverable = true;
    std::string suggested_action;

    nlohmann::json toJson() const;
};

/**
 * @brief Retry policy for one error type
 */
struct RetryConfig {
    RetryStrategy strategy = RetryStrategy::EXPONENTIAL_BACKOFF;
    size_t max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{60000};
    double backoff_factor = 2.0;
    bool jitter = true;                           ///< Multiply the delay by uniform [0.5, 1.5]
    std::set<ErrorType> stop_on;                  ///< Error types never retried under this policy
};

/**
 * @brief Outcome of one recovery action
 */
struct RecoveryOutcome {
    bool success = false;
    std::string message;

    static RecoveryOutcome succeeded(const std::string& message = "") { return {true, message}; }
    static RecoveryOutcome failed(const std::string& message) { return {false, message}; }
};

/**
 * @brief Best-effort action run before retrying an error
 */
struct RecoveryAction {
    std::string action_id;
    std::string description;
    int priority = 5;                             ///< Higher runs first
    bool automated = true;                        ///< Only automated actions run inside the retry loop
    std::function<RecoveryOutcome(const ErrorInfo&)> handler;
};

/**
 * @brief Aggregated view of the error history
 */
struct ErrorStatistics {
    size_t total_errors = 0;
    std::map<std::string, size_t> errors_by_type;
    std::map<std::string, size_t> severity_distribution;
    size_t recovery_actions_available = 0;
    std::vector<std::string> history_keys;

    nlohmann::json toJson() const;
};

/**
 * @brief Classifies failures, drives retries and runs recovery actions
 *
 * Terminal failures go to a history bucketed by error type and UTC day,
 * each bucket keeping its newest MAX_HISTORY_PER_BUCKET records.
 */
class ErrorRecoveryManager {
public:
    static constexpr size_t MAX_HISTORY_PER_BUCKET = 100;

    ErrorRecoveryManager();

    /**
     * @brief Classify an exception
     * @param error Captured exception
     * @param context Context copied into the record
     * @return Error record
     */
    ErrorInfo classify(std::exception_ptr error, const ErrorContext& context = {}) const;

    /**
     * @brief Decide whether an error may be retried under a policy
     */
    bool shouldRetry(const ErrorInfo& info, const RetryConfig& config) const;

    /**
     * @brief Compute the back-off before the next attempt
     * @param config Retry policy
     * @param attempt Attempt that just failed, starting at 1
     * @return Delay, clamped to max_delay before jitter is applied
     */
    static std::chrono::milliseconds computeDelay(const RetryConfig& config, size_t attempt);

    /**
     * @brief Run automated recovery actions for the error's type
     *
     * Actions run by descending priority until one succeeds. Failing or
     * throwing actions are logged and skipped.
     * @return True if an action succeeded
     */
    bool attemptRecovery(const ErrorInfo& info);

    /**
     * @brief Run an operation with classification, recovery and back-off
     * @param operation Operation to run
     * @param context Context attached to error records
     * @param config_override Policy used instead of the per-type default
     * @param token Cancels the back-off sleep
     * @return The operation's result
     * @throws The last error once retries are exhausted or not allowed;
     *         CancelledError if cancelled
     */
    template<typename T>
    T handleWithRetry(const std::function<T()>& operation,
                      const ErrorContext& context = {},
                      const std::optional<RetryConfig>& config_override = std::nullopt,
                      const CancellationToken& token = CancellationToken());

    /**
     * @brief Register a recovery action for an error type
     */
    void registerRecoveryAction(ErrorType type, const RecoveryAction& action);

    std::vector<RecoveryAction> getRecoveryActions(ErrorType type) const;

    void setRetryConfig(ErrorType type, const RetryConfig& config);
    RetryConfig getRetryConfig(ErrorType type) const;

    /**
     * @brief Store a terminal failure in the history; never throws
     */
    void recordError(const ErrorInfo& info) noexcept;

    /**
     * @brief Copy of the history, oldest first
     */
    std::vector<ErrorInfo> getErrorHistory() const;

    ErrorStatistics getErrorStatistics() const;

    /**
     * @brief Report of the errors recorded in a time window
     * @param start Window start, defaults to seven days ago
     * @param end Window end, defaults to now
     */
    nlohmann::json exportErrorReport(
        std::optional<std::chrono::system_clock::time_point> start = std::nullopt,
        std::optional<std::chrono::system_clock::time_point> end = std::nullopt) const;

    void clearHistory();

    /**
     * @brief Default policy for an error type
     */
    static RetryConfig defaultRetryConfig(ErrorType type);

    static ErrorSeverity severityFor(ErrorType type, bool allocation_failure);
    static std::string suggestedActionFor(ErrorType type);

private:
    RecoveryOutcome runRecoveryAction(const RecoveryAction& action, const ErrorInfo& info);
    void logRetry(const ErrorInfo& info, size_t attempt, const RetryConfig& config) const;
    static std::string generateErrorId(std::chrono::system_clock::time_point timestamp);

    std::map<ErrorType, RetryConfig> m_retry_configs;
    std::map<ErrorType, std::vector<RecoveryAction>> m_recovery_actions;
    std::map<std::string, std::vector<ErrorInfo>> m_error_history;

    mutable std::mutex m_config_mutex;
    mutable std::mutex m_history_mutex;
};

// =================================================================
// Template implementation
// =================================================================

template<typename T>
T ErrorRecoveryManager::handleWithRetry(const std::function<T()>& operation,
                                        const ErrorContext& context,
                                        const std::optional<RetryConfig>& config_override,
                                        const CancellationToken& token) {
    size_t attempt = 0;

    while (true) {
        token.throwIfCancelled("retry loop");
        ++attempt;

        try {
            return operation();
        } catch (const CancelledError&) {
            throw;
        } catch (...) {
            ErrorInfo info = classify(std::current_exception(), context);
            RetryConfig config = config_override ? *config_override : getRetryConfig(info.error_type);

            if (attempt >= config.max_attempts || !shouldRetry(info, config)) {
                recordError(info);
                Logger::getInstance().error("ErrorRecovery",
                    "Giving up after " + std::to_string(attempt) + " attempt(s): " + info.message,
                    info.error_id + ", " + errorTypeToString(info.error_type));
                throw;
            }

            logRetry(info, attempt, config);

            if (attemptRecovery(info)) {
                continue;
            }

            if (token.waitFor(computeDelay(config, attempt))) {
                throw CancelledError("Operation cancelled during retry back-off");
            }
        }
    }
}

} // namespace Quorum
