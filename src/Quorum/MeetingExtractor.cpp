// =================================================================
// src/Quorum/MeetingExtractor.cpp
// =================================================================

#include "Quorum/MeetingExtractor.hpp"
#include "Quorum/Errors.hpp"
#include "Quorum/Logger.hpp"
#include "Quorum/TimeFormat.hpp"
#include <algorithm>
#include <cmath>
#include <future>

namespace Quorum {

namespace {

bool hasText(const std::optional<std::string>& value) {
    return value && !value->empty();
}

// Keep only the body of a fenced block when the reply contains one
std::string stripCodeFences(const std::string& output) {
    const std::string fence = "```";
    size_t first_fence_pos = output.find(fence);
    size_t last_fence_pos = output.rfind(fence);

    if (first_fence_pos == std::string::npos || last_fence_pos == std::string::npos ||
        last_fence_pos <= first_fence_pos) {
        return output;
    }

    std::string header = output.substr(0, first_fence_pos);
    std::string footer = output.substr(last_fence_pos + fence.length());
    if (header.find_first_not_of(" \t\r\n") != std::string::npos ||
        footer.find_first_not_of(" \t\r\n") != std::string::npos) {
        Logger::getInstance().debug("MeetingExtractor", "Discarding text around fenced reply",
                                    "header=" + std::to_string(header.size()) +
                                    " footer=" + std::to_string(footer.size()));
    }

    size_t content_start_pos = output.find('\n', first_fence_pos);
    if (content_start_pos == std::string::npos || content_start_pos >= last_fence_pos) {
        return output.substr(first_fence_pos + fence.length(), last_fence_pos - first_fence_pos - fence.length());
    }
    return output.substr(content_start_pos + 1, last_fence_pos - (content_start_pos + 1));
}

long toMillis(std::chrono::steady_clock::duration duration) {
    return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

} // anonymous namespace

std::string extractionStatusToString(ExtractionStatus status) {
    switch (status) {
        case ExtractionStatus::COMPLETED: return "completed";
        case ExtractionStatus::VALIDATION_FAILED: return "validation_failed";
        case ExtractionStatus::FAILED: return "failed";
    }
    return "failed";
}

nlohmann::json FieldOutcome::toJson() const {
    nlohmann::json j = {
        {"field", extractionFieldToString(field)},
        {"extracted", extracted},
        {"item_count", item_count},
        {"duration_ms", duration.count()}
    };
    if (!extracted) {
        j["error_type"] = error_type;
        j["error_message"] = error_message;
    }
    return j;
}

size_t ValidationResults::passedCount() const {
    size_t passed = 0;
    for (bool flag : {basic_info, attendees, agenda, action_items, decisions, key_outcomes, overall}) {
        if (flag) {
            ++passed;
        }
    }
    return passed;
}

nlohmann::json ValidationResults::toJson() const {
    return {
        {"basic_info", basic_info},
        {"attendees", attendees},
        {"agenda", agenda},
        {"action_items", action_items},
        {"decisions", decisions},
        {"key_outcomes", key_outcomes},
        {"overall", overall}
    };
}

nlohmann::json ExtractionResult::toJson() const {
    nlohmann::json outcomes = nlohmann::json::array();
    for (const auto& outcome : field_outcomes) {
        outcomes.push_back(outcome.toJson());
    }

    nlohmann::json j = {
        {"status", extractionStatusToString(status)},
        {"minutes", nullptr},
        {"validation_results", validation.toJson()},
        {"field_outcomes", outcomes},
        {"confidence_score", confidence_score},
        {"processing_time_ms", processing_time.count()},
        {"error_message", nullptr},
        {"metadata", metadata}
    };

    if (minutes) {
        j["minutes"] = *minutes;
    }
    if (!error_message.empty()) {
        j["error_message"] = error_message;
    }
    return j;
}

nlohmann::json ExtractionResult::getSummary() const {
    nlohmann::json summary = {
        {"status", extractionStatusToString(status)},
        {"confidence_score", confidence_score},
        {"processing_time_ms", processing_time.count()},
        {"validation_results", validation.toJson()}
    };

    if (minutes) {
        summary["title"] = minutes->basic_info.title ? nlohmann::json(*minutes->basic_info.title) : nlohmann::json();
        summary["counts"] = {
            {"attendees", minutes->attendees.size()},
            {"agenda_items", minutes->agenda.size()},
            {"action_items", minutes->action_items.size()},
            {"decisions", minutes->decisions.size()},
            {"key_outcomes", minutes->key_outcomes.size()}
        };
    }

    nlohmann::json defaulted = nlohmann::json::array();
    for (const auto& outcome : field_outcomes) {
        if (!outcome.extracted) {
            defaulted.push_back(extractionFieldToString(outcome.field));
        }
    }
    summary["fields_defaulted"] = defaulted;

    if (!error_message.empty()) {
        summary["error_message"] = error_message;
    }
    return summary;
}

// =================================================================
// MeetingExtractor
// =================================================================

MeetingExtractor::MeetingExtractor(ConnectionManager& connections,
                                   ErrorRecoveryManager& recovery,
                                   std::shared_ptr<TextPreprocessor> preprocessor,
                                   const ExtractorConfig& config)
    : m_connections(connections),
      m_recovery(recovery),
      m_preprocessor(std::move(preprocessor)),
      m_config(config),
      m_workers(config.worker_threads) {
    if (!m_preprocessor) {
        throw std::invalid_argument("MeetingExtractor requires a text preprocessor");
    }
}

ExtractionResult MeetingExtractor::extract(const std::string& transcript,
                                           const PreprocessingOptions& preprocessing,
                                           const ExtractionOptions& options) {
    auto started = std::chrono::steady_clock::now();
    ExtractionResult result;

    Logger::getInstance().info("MeetingExtractor", "Starting extraction",
                               std::to_string(transcript.size()) + " characters");

    try {
        options.cancellation.throwIfCancelled("extraction");

        PreprocessedText preprocessed = m_preprocessor->preprocess(transcript, preprocessing);
        auto text = std::make_shared<const std::string>(preprocessed.cleaned_text);

        std::vector<std::future<FieldTaskResult>> futures;
        for (ExtractionField field : ALL_EXTRACTION_FIELDS) {
            futures.push_back(m_workers.enqueue([this, field, text, options]() {
                return runField(field, *text, options);
            }));
        }

        // Join every task before deciding, so no slot outlives the run
        std::vector<FieldTaskResult> field_results;
        std::optional<std::string> cancellation;
        for (auto& future : futures) {
            try {
                field_results.push_back(future.get());
            } catch (const CancelledError& e) {
                cancellation = e.what();
            }
        }

        if (cancellation) {
            throw CancelledError(*cancellation);
        }

        MeetingMinutes minutes;
        std::set<ExtractionField> failed_fields;
        std::vector<std::string> defaulted_names;

        for (auto& field_result : field_results) {
            if (field_result.outcome.extracted) {
                applyField(minutes, field_result.outcome.field, field_result.data);
                field_result.outcome.item_count = countItems(minutes, field_result.outcome.field);
            } else {
                failed_fields.insert(field_result.outcome.field);
                defaulted_names.push_back(extractionFieldToString(field_result.outcome.field));
            }
            result.field_outcomes.push_back(field_result.outcome);
        }

        result.validation = validate(minutes, failed_fields);
        result.confidence_score = computeConfidence(minutes, result.validation);
        result.status = result.validation.overall ? ExtractionStatus::COMPLETED
                                                  : ExtractionStatus::VALIDATION_FAILED;
        result.minutes = std::move(minutes);

        result.metadata = {
            {"model_used", options.model.empty() ? "endpoint default" : options.model},
            {"pool_id", options.pool_id.empty() ? m_connections.getCurrentPool() : options.pool_id},
            {"segment_count", preprocessed.segments.size()},
            {"preprocessing_stats", preprocessed.stats.toJson()},
            {"content_markers", preprocessed.metadata.value("content_markers", nlohmann::json::object())},
            {"fields_defaulted", defaulted_names},
            {"extraction_timestamp", formatIsoTimestamp(std::chrono::system_clock::now())}
        };
    } catch (const CancelledError& e) {
        result = ExtractionResult();
        result.status = ExtractionStatus::FAILED;
        result.error_message = e.what();
        Logger::getInstance().warning("MeetingExtractor", "Extraction cancelled", e.what());
    } catch (const std::exception& e) {
        result = ExtractionResult();
        result.status = ExtractionStatus::FAILED;
        result.error_message = e.what();
        Logger::getInstance().error("MeetingExtractor", "Extraction failed", e.what());
    } catch (...) {
        result = ExtractionResult();
        result.status = ExtractionStatus::FAILED;
        result.error_message = "Extraction failed with a non-standard exception";
        Logger::getInstance().error("MeetingExtractor", "Extraction failed", result.error_message);
    }

    result.processing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    std::vector<std::string> failed_names;
    for (const auto& outcome : result.field_outcomes) {
        if (!outcome.extracted) {
            failed_names.push_back(extractionFieldToString(outcome.field));
        }
    }
    Logger::getInstance().logExtractionSummary(extractionStatusToString(result.status),
                                               result.confidence_score,
                                               static_cast<long>(result.processing_time.count()),
                                               failed_names);
    return result;
}

MeetingExtractor::FieldTaskResult MeetingExtractor::runField(ExtractionField field,
                                                             const std::string& text,
                                                             const ExtractionOptions& options) {
    FieldTaskResult result;
    result.outcome.field = field;
    const std::string field_name = extractionFieldToString(field);
    auto started = std::chrono::steady_clock::now();

    ErrorContext context = {
        {"field", field_name},
        {"pool_id", options.pool_id.empty() ? m_connections.getCurrentPool() : options.pool_id}
    };

    try {
        result.data = m_recovery.handleWithRetry<nlohmann::json>([&]() {
            GenerationRequest request = buildExtractionRequest(field, text, m_config.context_window_chars,
                                                               options.model);
            GenerationResponse response = m_connections.callWithFailover(request, options.pool_id,
                                                                         options.cancellation);
            return parseFieldResponse(field, response.content);
        }, context, options.retry_override, options.cancellation);

        result.outcome.extracted = true;
        Logger::getInstance().debug("MeetingExtractor", "Field extracted: " + field_name,
                                    std::to_string(toMillis(std::chrono::steady_clock::now() - started)) + "ms");
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        ErrorInfo info = m_recovery.classify(std::current_exception(), context);
        result.outcome.extracted = false;
        result.outcome.error_type = errorTypeToString(info.error_type);
        result.outcome.error_message = e.what();
        Logger::getInstance().warning("MeetingExtractor", "Field defaulted: " + field_name, e.what());
    } catch (...) {
        ErrorInfo info = m_recovery.classify(std::current_exception(), context);
        result.outcome.extracted = false;
        result.outcome.error_type = errorTypeToString(info.error_type);
        result.outcome.error_message = info.message;
        Logger::getInstance().warning("MeetingExtractor", "Field defaulted: " + field_name, info.message);
    }

    result.outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

// =================================================================
// Parsing
// =================================================================

nlohmann::json MeetingExtractor::parseFieldResponse(ExtractionField field, const std::string& content) {
    const std::string field_name = extractionFieldToString(field);

    nlohmann::json data;
    try {
        data = nlohmann::json::parse(stripCodeFences(content));
    } catch (const nlohmann::json::parse_error& e) {
        throw ProcessingError("Model reply for " + field_name + " is not valid JSON: " + e.what());
    }

    if (field == ExtractionField::BASIC_INFO) {
        if (data.is_array() && !data.empty() && data.front().is_object()) {
            data = data.front();
        }
        if (!data.is_object()) {
            throw ProcessingError("Model reply for basic_info is not a JSON object");
        }
        return data;
    }

    if (data.is_object()) {
        auto named = data.find(field_name);
        if (named != data.end() && named->is_array()) {
            data = *named;
        } else if (data.size() == 1 && data.begin()->is_array()) {
            data = *data.begin();
        }
    }

    if (!data.is_array()) {
        throw ProcessingError("Model reply for " + field_name + " is not a JSON array");
    }
    return data;
}

void MeetingExtractor::applyField(MeetingMinutes& minutes, ExtractionField field, const nlohmann::json& data) {
    switch (field) {
        case ExtractionField::BASIC_INFO:
            minutes.basic_info = data.get<MeetingBasicInfo>();
            break;
        case ExtractionField::ATTENDEES:
            for (const auto& item : data) {
                if (item.is_object()) {
                    minutes.attendees.push_back(item.get<Attendee>());
                }
            }
            break;
        case ExtractionField::AGENDA:
            for (const auto& item : data) {
                if (item.is_object()) {
                    minutes.agenda.push_back(item.get<DiscussionTopic>());
                }
            }
            break;
        case ExtractionField::ACTION_ITEMS:
            for (const auto& item : data) {
                if (item.is_object()) {
                    minutes.action_items.push_back(item.get<ActionItem>());
                }
            }
            break;
        case ExtractionField::DECISIONS:
            for (const auto& item : data) {
                if (item.is_object()) {
                    minutes.decisions.push_back(item.get<Decision>());
                }
            }
            break;
        case ExtractionField::KEY_OUTCOMES:
            for (const auto& item : data) {
                if (item.is_string()) {
                    if (!item.get<std::string>().empty()) {
                        minutes.key_outcomes.push_back(item.get<std::string>());
                    }
                } else if (!item.is_null()) {
                    minutes.key_outcomes.push_back(item.dump());
                }
            }
            break;
    }
}

size_t MeetingExtractor::countItems(const MeetingMinutes& minutes, ExtractionField field) {
    switch (field) {
        case ExtractionField::BASIC_INFO:
            return (hasText(minutes.basic_info.title) || hasText(minutes.basic_info.meeting_type)) ? 1 : 0;
        case ExtractionField::ATTENDEES: return minutes.attendees.size();
        case ExtractionField::AGENDA: return minutes.agenda.size();
        case ExtractionField::ACTION_ITEMS: return minutes.action_items.size();
        case ExtractionField::DECISIONS: return minutes.decisions.size();
        case ExtractionField::KEY_OUTCOMES: return minutes.key_outcomes.size();
    }
    return 0;
}

// =================================================================
// Validation and confidence
// =================================================================

ValidationResults MeetingExtractor::validate(const MeetingMinutes& minutes,
                                             const std::set<ExtractionField>& failed_fields) {
    auto ok = [&failed_fields](ExtractionField field) { return failed_fields.count(field) == 0; };

    ValidationResults v;
    v.basic_info = ok(ExtractionField::BASIC_INFO) &&
                   (hasText(minutes.basic_info.title) || hasText(minutes.basic_info.meeting_type));

    v.attendees = ok(ExtractionField::ATTENDEES) &&
                  std::any_of(minutes.attendees.begin(), minutes.attendees.end(),
                              [](const Attendee& a) { return !a.name.empty(); });

    v.agenda = ok(ExtractionField::AGENDA) &&
               std::all_of(minutes.agenda.begin(), minutes.agenda.end(),
                           [](const DiscussionTopic& t) { return !t.title.empty(); });

    v.action_items = ok(ExtractionField::ACTION_ITEMS) &&
                     std::all_of(minutes.action_items.begin(), minutes.action_items.end(),
                                 [](const ActionItem& a) { return !a.task.empty(); });

    v.decisions = ok(ExtractionField::DECISIONS) &&
                  std::all_of(minutes.decisions.begin(), minutes.decisions.end(),
                              [](const Decision& d) { return !d.decision.empty(); });

    v.key_outcomes = ok(ExtractionField::KEY_OUTCOMES);

    v.overall = v.basic_info && v.attendees && v.agenda && v.action_items && v.decisions && v.key_outcomes;
    return v;
}

double MeetingExtractor::computeConfidence(const MeetingMinutes& minutes, const ValidationResults& validation) {
    double validation_ratio = static_cast<double>(validation.passedCount()) /
                              static_cast<double>(ValidationResults::TOTAL_CHECKS);

    double richness = 0.0;
    if (hasText(minutes.basic_info.title) || hasText(minutes.basic_info.meeting_type)) {
        richness += ConfidenceWeights::BASIC_INFO;
    }
    if (!minutes.attendees.empty()) {
        richness += ConfidenceWeights::ATTENDEES;
    }
    if (!minutes.agenda.empty()) {
        richness += ConfidenceWeights::AGENDA;
    }
    if (!minutes.action_items.empty()) {
        richness += ConfidenceWeights::ACTION_ITEMS;
    }
    if (!minutes.decisions.empty()) {
        richness += ConfidenceWeights::DECISIONS;
    }
    if (!minutes.key_outcomes.empty()) {
        richness += ConfidenceWeights::KEY_OUTCOMES;
    }

    double confidence = ConfidenceWeights::VALIDATION_SHARE * validation_ratio +
                        ConfidenceWeights::RICHNESS_SHARE * richness;
    confidence = std::max(0.0, std::min(1.0, confidence));
    return std::round(confidence * 100.0) / 100.0;
}

} // namespace Quorum
