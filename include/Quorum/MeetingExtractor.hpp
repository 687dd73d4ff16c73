// =================================================================
// include/Quorum/MeetingExtractor.hpp
// =================================================================
// Concurrent per-field extraction of meeting minutes.

#pragma once

#include "Quorum/CancellationToken.hpp"
#include "Quorum/ConnectionManager.hpp"
#include "Quorum/ErrorRecovery.hpp"
#include "Quorum/ExtractionPrompts.hpp"
#include "Quorum/MeetingMinutes.hpp"
#include "Quorum/TextPreprocessor.hpp"
#include "Quorum/WorkerPool.hpp"
#include "nlohmann/json.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Quorum {

enum class ExtractionStatus {
    COMPLETED,
    VALIDATION_FAILED,
    FAILED
};

std::string extractionStatusToString(ExtractionStatus status);

/**
 * @brief Per-run extraction settings
 */
struct ExtractionOptions {
    std::string pool_id;                          ///< Empty for the current pool
    std::string model;                            ///< Empty for each endpoint's own model
    std::optional<RetryConfig> retry_override;    ///< Replaces the per-type retry defaults
    CancellationToken cancellation;
};

/**
 * @brief What happened to one field
 */
struct FieldOutcome {
    ExtractionField field = ExtractionField::BASIC_INFO;
    bool extracted = false;                       ///< False when the typed default was substituted
    size_t item_count = 0;
    std::string error_type;
    std::string error_message;
    std::chrono::milliseconds duration{0};

    nlohmann::json toJson() const;
};

struct ValidationResults {
    bool basic_info = false;
    bool attendees = false;
    bool agenda = false;
    bool action_items = false;
    bool decisions = false;
    bool key_outcomes = false;
    bool overall = false;

    /// Number of passing flags among the six fields and overall
    size_t passedCount() const;

    static constexpr size_t TOTAL_CHECKS = 7;

    nlohmann::json toJson() const;
};

/**
 * @brief Confidence score weights
 */
struct ConfidenceWeights {
    static constexpr double VALIDATION_SHARE = 0.6;
    static constexpr double RICHNESS_SHARE = 0.4;

    static constexpr double BASIC_INFO = 0.20;
    static constexpr double ATTENDEES = 0.20;
    static constexpr double AGENDA = 0.20;
    static constexpr double ACTION_ITEMS = 0.15;
    static constexpr double DECISIONS = 0.15;
    static constexpr double KEY_OUTCOMES = 0.10;
};

struct ExtractorConfig {
    size_t worker_threads = 6;
    size_t context_window_chars = 2000;
};

/**
 * @brief Outcome of one extraction run; built once and never mutated
 */
struct ExtractionResult {
    ExtractionStatus status = ExtractionStatus::FAILED;
    std::optional<MeetingMinutes> minutes;        ///< Absent when status is FAILED
    ValidationResults validation;
    std::vector<FieldOutcome> field_outcomes;
    double confidence_score = 0.0;
    std::chrono::milliseconds processing_time{0};
    std::string error_message;
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json toJson() const;

    /**
     * @brief Compact summary: status, confidence, item counts and validation flags
     */
    nlohmann::json getSummary() const;
};

/**
 * @brief Extracts the six minutes fields concurrently
 *
 * Each field runs on the worker pool inside the retry engine and is routed
 * through the connection manager's failover. A field that still fails is
 * replaced by its empty default and marked invalid; the other fields are
 * unaffected. Preprocessing failure or cancellation fails the whole run.
 */
class MeetingExtractor {
public:
    MeetingExtractor(ConnectionManager& connections,
                     ErrorRecoveryManager& recovery,
                     std::shared_ptr<TextPreprocessor> preprocessor,
                     const ExtractorConfig& config = ExtractorConfig());

    MeetingExtractor(const MeetingExtractor&) = delete;
    MeetingExtractor& operator=(const MeetingExtractor&) = delete;

    /**
     * @brief Extract structured minutes from a transcript
     * @param transcript Raw transcript
     * @param preprocessing Preprocessing switches
     * @param options Pool, model, retry and cancellation settings
     * @return Result; never throws for extraction failures
     */
    ExtractionResult extract(const std::string& transcript,
                             const PreprocessingOptions& preprocessing = PreprocessingOptions(),
                             const ExtractionOptions& options = ExtractionOptions());

    /**
     * @brief Validate extracted minutes
     * @param minutes Extracted minutes
     * @param failed_fields Fields that failed terminally; always invalid
     */
    static ValidationResults validate(const MeetingMinutes& minutes,
                                      const std::set<ExtractionField>& failed_fields = {});

    /**
     * @brief Confidence in [0, 1], rounded to two decimals
     */
    static double computeConfidence(const MeetingMinutes& minutes, const ValidationResults& validation);

    /**
     * @brief Parse a model reply as JSON of the shape a field expects
     *
     * Markdown code fences are stripped first. A list field wrapped in an
     * object under its own name is unwrapped.
     * @throws ProcessingError if the reply is not JSON of the expected shape
     */
    static nlohmann::json parseFieldResponse(ExtractionField field, const std::string& content);

    const ExtractorConfig& getConfig() const { return m_config; }

private:
    struct FieldTaskResult {
        FieldOutcome outcome;
        nlohmann::json data;
    };

    FieldTaskResult runField(ExtractionField field,
                             const std::string& text,
                             const ExtractionOptions& options);

    static void applyField(MeetingMinutes& minutes, ExtractionField field, const nlohmann::json& data);
    static size_t countItems(const MeetingMinutes& minutes, ExtractionField field);

    ConnectionManager& m_connections;
    ErrorRecoveryManager& m_recovery;
    std::shared_ptr<TextPreprocessor> m_preprocessor;
    ExtractorConfig m_config;
    WorkerPool m_workers;
};

} // namespace Quorum
