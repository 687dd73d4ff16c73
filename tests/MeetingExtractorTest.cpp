// =================================================================
// tests/MeetingExtractorTest.cpp
// =================================================================
// Unit tests for concurrent field extraction, validation and confidence.

#include "MockLlmInteraction.hpp"
#include "Quorum/ConnectionManager.hpp"
#include "Quorum/ErrorRecovery.hpp"
#include "Quorum/ExtractionPrompts.hpp"
#include "Quorum/Logger.hpp"
#include "Quorum/MeetingExtractor.hpp"
#include "Quorum/TextPreprocessor.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <thread>

using QuorumTest::MockClientRegistry;
using QuorumTest::makeEndpointConfig;

namespace {

const char* TRANSCRIPT =
    "Sprint review meeting, held online.\n\n"
    "Alice Johnson opened the meeting and walked through the agenda. Bob Lee presented the "
    "release status and the open defects.\n\n"
    "We made a decision to ship version two next Friday. Action: Bob will update the release "
    "notes by Wednesday.\n\n"
    "Key outcome: the team agreed the release is on track.";

const char* BASIC_INFO_REPLY = R"({"title": "Sprint Review", "date": "2025-03-14", "time": null,
    "duration": "45 minutes", "location": "online", "meeting_type": "review", "organizer": "Alice Johnson"})";

const char* ATTENDEES_REPLY = R"([{"name": "Alice Johnson", "role": "Product Manager"},
    {"name": "Bob Lee", "role": "Engineer", "present": true}])";

const char* AGENDA_REPLY = "```json\n"
    R"([{"title": "Release status", "presenter": "Bob Lee", "key_points": ["Two open defects"]}])"
    "\n```";

const char* ACTION_ITEMS_REPLY = R"({"action_items": [{"task": "Update the release notes",
    "assignee": "Bob Lee", "due_date": "2025-03-19", "priority": "high"}]})";

const char* DECISIONS_REPLY = R"([{"decision": "Ship version two next Friday",
    "rationale": "All blockers are resolved"}])";

const char* KEY_OUTCOMES_REPLY = R"(["Release is on track", "Version two ships next Friday"])";

// Which template a prompt was built from
Quorum::ExtractionField fieldOf(const std::string& prompt) {
    if (prompt.find("basic meeting information") != std::string::npos) return Quorum::ExtractionField::BASIC_INFO;
    if (prompt.find("everyone who attended") != std::string::npos) return Quorum::ExtractionField::ATTENDEES;
    if (prompt.find("agenda items and discussion topics") != std::string::npos) return Quorum::ExtractionField::AGENDA;
    if (prompt.find("every action item") != std::string::npos) return Quorum::ExtractionField::ACTION_ITEMS;
    if (prompt.find("decisions that were made") != std::string::npos) return Quorum::ExtractionField::DECISIONS;
    return Quorum::ExtractionField::KEY_OUTCOMES;
}

} // anonymous namespace

class MeetingExtractorTest {
private:
    std::unique_ptr<MockClientRegistry> m_clients;
    std::unique_ptr<Quorum::ConnectionManager> m_connections;
    std::unique_ptr<Quorum::ErrorRecoveryManager> m_recovery;
    std::unique_ptr<Quorum::MeetingExtractor> m_extractor;

    void setupExtractor() {
        m_extractor.reset();
        m_recovery.reset();
        m_connections.reset();

        m_clients = std::make_unique<MockClientRegistry>();
        m_connections = std::make_unique<Quorum::ConnectionManager>(Quorum::HealthCheckConfig(),
                                                                    m_clients->factory());
        Quorum::PoolConfig pool;
        pool.pool_id = "test";
        pool.max_retries = 2;
        pool.health_check_enabled = false;
        pool.failover_delay_step = std::chrono::milliseconds(5);
        m_connections->addPool(pool);
        m_connections->setCurrentPool("test");
        m_connections->addEndpoint(makeEndpointConfig("llm", 5, 6));

        m_recovery = std::make_unique<Quorum::ErrorRecoveryManager>();
        m_extractor = std::make_unique<Quorum::MeetingExtractor>(
            *m_connections, *m_recovery, std::make_shared<Quorum::RegexTextPreprocessor>());
    }

    // Answers each field with its reply; fields missing from the map get an unusable reply
    void scriptReplies(const std::map<Quorum::ExtractionField, std::string>& replies) {
        m_clients->get("llm")->setResponder([replies](const Quorum::GenerationRequest& request) {
            auto it = replies.find(fieldOf(request.prompt));
            if (it == replies.end()) {
                return std::string("I could not find anything relevant in this transcript.");
            }
            return it->second;
        });
    }

    std::map<Quorum::ExtractionField, std::string> allReplies() {
        return {
            {Quorum::ExtractionField::BASIC_INFO, BASIC_INFO_REPLY},
            {Quorum::ExtractionField::ATTENDEES, ATTENDEES_REPLY},
            {Quorum::ExtractionField::AGENDA, AGENDA_REPLY},
            {Quorum::ExtractionField::ACTION_ITEMS, ACTION_ITEMS_REPLY},
            {Quorum::ExtractionField::DECISIONS, DECISIONS_REPLY},
            {Quorum::ExtractionField::KEY_OUTCOMES, KEY_OUTCOMES_REPLY}
        };
    }

    Quorum::ExtractionOptions singleAttempt() {
        Quorum::RetryConfig retry;
        retry.strategy = Quorum::RetryStrategy::IMMEDIATE;
        retry.max_attempts = 1;
        retry.jitter = false;

        Quorum::ExtractionOptions options;
        options.retry_override = retry;
        return options;
    }

public:
    MeetingExtractorTest() {
        Quorum::Logger::getInstance().setConsoleLogLevel(Quorum::LogLevel::CRITICAL);
        setupExtractor();
    }

    void testPromptConstruction() {
        std::cout << "Testing prompt construction..." << std::endl;

        assert(Quorum::textWindowFor(Quorum::ExtractionField::BASIC_INFO) == Quorum::TextWindow::HEAD);
        assert(Quorum::textWindowFor(Quorum::ExtractionField::ATTENDEES) == Quorum::TextWindow::HEAD);
        assert(Quorum::textWindowFor(Quorum::ExtractionField::KEY_OUTCOMES) == Quorum::TextWindow::TAIL);
        assert(Quorum::textWindowFor(Quorum::ExtractionField::DECISIONS) == Quorum::TextWindow::FULL);

        std::string text = "HEAD-PART middle section of the meeting TAIL-PART";
        assert(Quorum::sliceForWindow(text, Quorum::TextWindow::HEAD, 9) == "HEAD-PART" && "Head slice");
        assert(Quorum::sliceForWindow(text, Quorum::TextWindow::TAIL, 9) == "TAIL-PART" && "Tail slice");
        assert(Quorum::sliceForWindow(text, Quorum::TextWindow::FULL, 9) == text && "Full text kept");
        assert(Quorum::sliceForWindow("short", Quorum::TextWindow::HEAD, 100) == "short" && "Short text kept");

        // "caf\xC3\xA9" cut inside the two-byte sequence backs off to a whole character
        std::string accented = "caf\xC3\xA9 talk";
        assert(Quorum::sliceForWindow(accented, Quorum::TextWindow::HEAD, 4) == "caf" &&
               "Head slice never splits a UTF-8 sequence");
        assert(Quorum::sliceForWindow(accented, Quorum::TextWindow::TAIL, 6) == " talk" &&
               "Tail slice never starts inside a UTF-8 sequence");

        auto request = Quorum::buildExtractionRequest(Quorum::ExtractionField::BASIC_INFO, text, 9, "");
        assert(request.prompt.find("HEAD-PART") != std::string::npos && "Prompt carries the head window");
        assert(request.prompt.find("TAIL-PART") == std::string::npos && "Prompt omits text past the window");
        assert(request.prompt.find("{text}") == std::string::npos && "Placeholder replaced");
        assert(request.prompt.rfind("JSON Response:") == request.prompt.size() - 14 && "Prompt ends with the cue");
        assert(request.format_hint == "json" && "JSON output requested");
        assert(request.options["temperature"] == 0.1 && request.options["top_p"] == 0.9 && "Basic info sampling");

        auto agenda = Quorum::buildExtractionRequest(Quorum::ExtractionField::AGENDA, text, 9, "llama3.1:8b");
        assert(agenda.prompt.find("middle section") != std::string::npos && "Agenda sees the full text");
        assert(agenda.options["temperature"] == 0.2 && "Agenda sampling");
        assert(agenda.model == "llama3.1:8b" && "Model override carried");

        std::cout << "✓ Prompt construction test passed" << std::endl;
    }

    void testParseFieldResponse() {
        std::cout << "Testing reply parsing..." << std::endl;

        using Quorum::ExtractionField;
        using Quorum::MeetingExtractor;

        auto fenced = MeetingExtractor::parseFieldResponse(ExtractionField::AGENDA, AGENDA_REPLY);
        assert(fenced.is_array() && fenced.size() == 1 && "Fenced reply should be unwrapped");

        auto wrapped = MeetingExtractor::parseFieldResponse(ExtractionField::ACTION_ITEMS, ACTION_ITEMS_REPLY);
        assert(wrapped.is_array() && wrapped[0]["task"] == "Update the release notes" &&
               "List wrapped under its field name should be unwrapped");

        auto single = MeetingExtractor::parseFieldResponse(ExtractionField::DECISIONS, R"({"items": []})");
        assert(single.is_array() && single.empty() && "Single-array object should be unwrapped");

        auto info = MeetingExtractor::parseFieldResponse(ExtractionField::BASIC_INFO, R"([{"title": "Sync"}])");
        assert(info.is_object() && info["title"] == "Sync" && "Basic info array should give its first object");

        auto expectProcessingError = [](ExtractionField field, const std::string& reply) {
            try {
                MeetingExtractor::parseFieldResponse(field, reply);
            } catch (const Quorum::ProcessingError&) {
                return true;
            }
            return false;
        };

        assert(expectProcessingError(ExtractionField::ATTENDEES, "Here are the attendees: Alice, Bob") &&
               "Prose reply is a processing error");
        assert(expectProcessingError(ExtractionField::BASIC_INFO, R"(["Sync"])") &&
               "Basic info must be an object");
        assert(expectProcessingError(ExtractionField::KEY_OUTCOMES, R"({"summary": "fine", "count": 2})") &&
               "List field must be an array");

        std::cout << "✓ Reply parsing test passed" << std::endl;
    }

    void testValidation() {
        std::cout << "Testing validation..." << std::endl;

        Quorum::MeetingMinutes minutes;
        minutes.basic_info.meeting_type = "standup";
        minutes.attendees.push_back(Quorum::Attendee{"", std::nullopt, std::nullopt, std::nullopt, true});
        minutes.attendees.push_back(Quorum::Attendee{"Dana", std::nullopt, std::nullopt, std::nullopt, true});

        auto results = Quorum::MeetingExtractor::validate(minutes);
        assert(results.basic_info && "Meeting type alone satisfies basic info");
        assert(results.attendees && "One named attendee is enough");
        assert(results.agenda && results.action_items && results.decisions && "Empty lists are valid");
        assert(results.key_outcomes && results.overall && "All checks pass");
        assert(results.passedCount() == Quorum::ValidationResults::TOTAL_CHECKS && "Seven checks passed");

        minutes.action_items.push_back(Quorum::ActionItem{"", std::string("Dana"), std::nullopt,
                                                          std::nullopt, std::nullopt, std::nullopt});
        results = Quorum::MeetingExtractor::validate(minutes);
        assert(!results.action_items && !results.overall && "Action item without a task is invalid");

        results = Quorum::MeetingExtractor::validate(Quorum::MeetingMinutes(),
                                                     {Quorum::ExtractionField::KEY_OUTCOMES});
        assert(!results.basic_info && !results.attendees && "Empty minutes fail the required fields");
        assert(!results.key_outcomes && "A failed field is never valid");

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testConfidenceScore() {
        std::cout << "Testing confidence score..." << std::endl;

        Quorum::MeetingMinutes empty;
        auto empty_validation = Quorum::MeetingExtractor::validate(empty);
        // Four of seven checks pass on empty lists, no richness: 0.6 * 4/7 = 0.342...
        assert(Quorum::MeetingExtractor::computeConfidence(empty, empty_validation) == 0.34 &&
               "Empty minutes score 0.34");

        Quorum::ValidationResults none;
        assert(Quorum::MeetingExtractor::computeConfidence(empty, none) == 0.0 && "Nothing valid scores zero");

        Quorum::MeetingMinutes partial;
        partial.basic_info.title = "Weekly sync";
        partial.attendees.push_back(Quorum::Attendee{"Frank", std::nullopt, std::nullopt, std::nullopt, true});
        auto partial_validation = Quorum::MeetingExtractor::validate(partial);
        assert(partial_validation.overall && "Empty lists are vacuously valid");
        // All checks pass, richness 0.4 from basic info and attendees: 0.6 + 0.16
        assert(Quorum::MeetingExtractor::computeConfidence(partial, partial_validation) == 0.76 &&
               "Basic info and attendees alone score 0.76");

        Quorum::MeetingMinutes full;
        full.basic_info.title = "Planning";
        full.attendees.push_back(Quorum::Attendee{"Eve", std::nullopt, std::nullopt, std::nullopt, true});
        full.agenda.push_back(Quorum::DiscussionTopic{"Roadmap", std::nullopt, std::nullopt, std::nullopt, {}});
        full.action_items.push_back(Quorum::ActionItem{"Draft plan", std::nullopt, std::nullopt,
                                                       std::nullopt, std::nullopt, std::nullopt});
        full.decisions.push_back(Quorum::Decision{"Adopt plan", std::nullopt, std::nullopt,
                                                  std::nullopt, std::nullopt});
        full.key_outcomes.push_back("Plan adopted");
        auto full_validation = Quorum::MeetingExtractor::validate(full);
        assert(Quorum::MeetingExtractor::computeConfidence(full, full_validation) == 1.0 &&
               "Complete valid minutes score 1.0");

        std::cout << "✓ Confidence score test passed" << std::endl;
    }

    void testSuccessfulExtraction() {
        std::cout << "Testing successful extraction..." << std::endl;

        setupExtractor();
        scriptReplies(allReplies());

        auto result = m_extractor->extract(TRANSCRIPT);
        assert(result.status == Quorum::ExtractionStatus::COMPLETED && "Every field valid completes the run");
        assert(result.minutes.has_value() && "Minutes present");
        assert(result.validation.overall && "Overall validation passes");
        assert(result.confidence_score == 1.0 && "Fully populated minutes score 1.0");
        assert(result.error_message.empty() && "No error message");

        const auto& minutes = *result.minutes;
        assert(minutes.basic_info.title == std::string("Sprint Review") && "Title extracted");
        assert(!minutes.basic_info.time && "Null field stays empty");
        assert(minutes.attendees.size() == 2 && minutes.attendees[0].present && "Attendees extracted");
        assert(minutes.agenda.size() == 1 && minutes.agenda[0].key_points.size() == 1 && "Fenced agenda parsed");
        assert(minutes.action_items.size() == 1 && "Wrapped action items parsed");
        assert(minutes.action_items[0].assignee == std::string("Bob Lee") && "Assignee extracted");
        assert(minutes.decisions.size() == 1 && "Decisions extracted");
        assert(minutes.key_outcomes.size() == 2 && "Key outcomes extracted");

        assert(result.field_outcomes.size() == 6 && "One outcome per field");
        for (const auto& outcome : result.field_outcomes) {
            assert(outcome.extracted && "Every field extracted");
        }
        assert(result.field_outcomes[1].item_count == 2 && "Attendee count recorded");

        assert(result.metadata["pool_id"] == "test" && "Current pool recorded");
        assert(result.metadata["model_used"] == "endpoint default" && "Endpoint model used");
        assert(result.metadata["fields_defaulted"].empty() && "Nothing defaulted");
        assert(result.metadata["segment_count"].get<size_t>() >= 3 && "Segments recorded");
        assert(result.metadata.contains("preprocessing_stats") && "Preprocessing stats recorded");

        assert(m_clients->get("llm")->getCallCount() == 6 && "One call per field");
        assert(m_clients->get("llm")->getLastRequest().format_hint == "json" && "JSON output requested");

        auto json = result.toJson();
        assert(json["status"] == "completed" && json["minutes"]["basic_info"]["title"] == "Sprint Review" &&
               "Result serializes");
        assert(json["error_message"].is_null() && "No error in JSON");

        auto summary = result.getSummary();
        assert(summary["title"] == "Sprint Review" && summary["counts"]["decisions"] == 1 && "Summary counts");

        std::cout << "✓ Successful extraction test passed" << std::endl;
    }

    void testPartialFailure() {
        std::cout << "Testing partial failure..." << std::endl;

        setupExtractor();
        auto replies = allReplies();
        replies.erase(Quorum::ExtractionField::DECISIONS);
        replies[Quorum::ExtractionField::BASIC_INFO] = R"({"title": "Sprint Review"})";
        replies[Quorum::ExtractionField::ATTENDEES] = R"([{"name": "Alice Johnson"}])";
        replies[Quorum::ExtractionField::KEY_OUTCOMES] = R"(["Release is on track"])";
        scriptReplies(replies);

        auto result = m_extractor->extract(TRANSCRIPT, Quorum::PreprocessingOptions(), singleAttempt());
        assert(result.status == Quorum::ExtractionStatus::VALIDATION_FAILED && "Defaulted field fails validation");
        assert(result.minutes.has_value() && "Other fields still delivered");
        assert(result.minutes->decisions.empty() && "Failed field gets its empty default");
        assert(result.minutes->attendees.size() == 1 && "Other fields unaffected");
        assert(!result.validation.decisions && !result.validation.overall && "Decisions check fails");
        assert(result.validation.basic_info && result.validation.key_outcomes && "Other checks pass");

        // Five of seven checks, richness 0.85 without decisions: 0.6 * 5/7 + 0.4 * 0.85 = 0.7686
        assert(result.confidence_score == 0.77 && "Confidence reflects the defaulted field");

        const auto& decisions = result.field_outcomes[4];
        assert(decisions.field == Quorum::ExtractionField::DECISIONS && "Outcomes follow field order");
        assert(!decisions.extracted && decisions.error_type == "processing" && "Failure classified");
        assert(!decisions.error_message.empty() && "Failure message kept");

        auto defaulted = result.metadata["fields_defaulted"];
        assert(defaulted.size() == 1 && defaulted[0] == "decisions" && "Defaulted field listed");
        assert(result.getSummary()["fields_defaulted"][0] == "decisions" && "Summary lists it too");

        std::cout << "✓ Partial failure test passed" << std::endl;
    }

    void testProcessingErrorRetried() {
        std::cout << "Testing retry of malformed replies..." << std::endl;

        setupExtractor();
        auto replies = allReplies();
        auto mock = m_clients->get("llm");
        auto decision_calls = std::make_shared<std::atomic<int>>(0);
        mock->setResponder([replies, decision_calls](const Quorum::GenerationRequest& request) {
            auto field = fieldOf(request.prompt);
            if (field == Quorum::ExtractionField::DECISIONS && (*decision_calls)++ == 0) {
                return std::string("Sure! The decisions were:");
            }
            return replies.at(field);
        });

        // Default processing policy retries immediately once
        auto result = m_extractor->extract(TRANSCRIPT);
        assert(result.status == Quorum::ExtractionStatus::COMPLETED && "Second attempt should recover the field");
        assert(decision_calls->load() == 2 && "Decisions asked twice");
        assert(m_recovery->getErrorHistory().empty() && "Recovered failures are not recorded");

        std::cout << "✓ Processing error retry test passed" << std::endl;
    }

    void testNonStandardException() {
        std::cout << "Testing non-standard exceptions from a client..." << std::endl;

        setupExtractor();
        auto replies = allReplies();
        m_clients->get("llm")->setResponder([replies](const Quorum::GenerationRequest& request) -> std::string {
            auto field = fieldOf(request.prompt);
            if (field == Quorum::ExtractionField::DECISIONS) {
                throw 42;
            }
            return replies.at(field);
        });

        auto result = m_extractor->extract(TRANSCRIPT, Quorum::PreprocessingOptions(), singleAttempt());
        assert(result.status == Quorum::ExtractionStatus::VALIDATION_FAILED && "Run completes despite the throw");
        assert(result.minutes.has_value() && result.minutes->decisions.empty() && "Field defaulted");

        const auto& decisions = result.field_outcomes[4];
        assert(!decisions.extracted && decisions.error_type == "unknown" && "Non-standard throw classified unknown");
        assert(result.field_outcomes[0].extracted && "Other fields unaffected");

        auto stats = m_connections->getConnectionStats();
        assert(stats.pools.at("test").endpoints[0].active_connections == 0 && "Slot released after the throw");

        std::cout << "✓ Non-standard exception test passed" << std::endl;
    }

    void testNoEndpointAvailable() {
        std::cout << "Testing extraction without endpoints..." << std::endl;

        setupExtractor();
        scriptReplies(allReplies());
        m_connections->disableEndpoint("llm");

        auto result = m_extractor->extract(TRANSCRIPT, Quorum::PreprocessingOptions(), singleAttempt());
        assert(result.status == Quorum::ExtractionStatus::VALIDATION_FAILED &&
               "Field failures do not fail the whole run");
        assert(result.minutes.has_value() && "Default minutes delivered");
        assert(result.confidence_score == 0.0 && "Nothing extracted scores zero");
        for (const auto& outcome : result.field_outcomes) {
            assert(!outcome.extracted && outcome.error_type == "network" && "Every field fails on the network");
        }
        assert(m_clients->get("llm")->getCallCount() == 0 && "Disabled endpoint never called");
        assert(m_recovery->getErrorHistory().size() == 6 && "Each terminal field failure recorded");

        std::cout << "✓ No endpoint test passed" << std::endl;
    }

    void testEmptyTranscript() {
        std::cout << "Testing empty transcript..." << std::endl;

        setupExtractor();
        scriptReplies(allReplies());

        auto result = m_extractor->extract("   \n  ");
        assert(result.status == Quorum::ExtractionStatus::FAILED && "Empty transcript fails the run");
        assert(!result.minutes && "No minutes on failure");
        assert(result.error_message.find("empty") != std::string::npos && "Reason reported");
        assert(m_clients->get("llm")->getCallCount() == 0 && "No model calls");
        assert(result.toJson()["minutes"].is_null() && "JSON minutes null on failure");

        std::cout << "✓ Empty transcript test passed" << std::endl;
    }

    void testCancellation() {
        std::cout << "Testing cancellation..." << std::endl;

        setupExtractor();
        scriptReplies(allReplies());

        Quorum::ExtractionOptions cancelled;
        cancelled.cancellation.cancel();
        auto early = m_extractor->extract(TRANSCRIPT, Quorum::PreprocessingOptions(), cancelled);
        assert(early.status == Quorum::ExtractionStatus::FAILED && "Cancelled run fails");
        assert(!early.minutes && "No minutes for a cancelled run");
        assert(m_clients->get("llm")->getCallCount() == 0 && "No calls after cancellation");

        // Fields stuck in a long back-off are interrupted
        m_clients->get("llm")->setResponder([](const Quorum::GenerationRequest&) -> std::string {
            throw Quorum::AiServiceError("Model is loading", 503);
        });

        Quorum::RetryConfig slow;
        slow.strategy = Quorum::RetryStrategy::FIXED_DELAY;
        slow.max_attempts = 5;
        slow.base_delay = std::chrono::milliseconds(5000);
        slow.jitter = false;

        Quorum::ExtractionOptions options;
        options.retry_override = slow;
        Quorum::CancellationToken token = options.cancellation;

        std::thread canceller([token]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            token.cancel();
        });

        auto started = std::chrono::steady_clock::now();
        auto result = m_extractor->extract(TRANSCRIPT, Quorum::PreprocessingOptions(), options);
        auto elapsed = std::chrono::steady_clock::now() - started;
        canceller.join();

        assert(result.status == Quorum::ExtractionStatus::FAILED && "Cancellation fails the run");
        assert(!result.minutes && "No partial minutes after cancellation");
        assert(!result.error_message.empty() && "Cancellation reason reported");
        assert(elapsed < std::chrono::milliseconds(3000) && "Back-off interrupted promptly");
        assert(m_connections->getEndpointSnapshot("llm")->active_connections == 0 && "No slot left reserved");

        std::cout << "✓ Cancellation test passed" << std::endl;
    }

    void testConcurrentFields() {
        std::cout << "Testing concurrent field extraction..." << std::endl;

        setupExtractor();
        scriptReplies(allReplies());
        auto mock = m_clients->get("llm");
        mock->setDelay(std::chrono::milliseconds(150));

        Quorum::ExtractionOptions options;
        options.model = "custom-model";

        auto started = std::chrono::steady_clock::now();
        auto result = m_extractor->extract(TRANSCRIPT, Quorum::PreprocessingOptions(), options);
        auto elapsed = std::chrono::steady_clock::now() - started;

        assert(result.status == Quorum::ExtractionStatus::COMPLETED && "Slow replies still complete");
        assert(mock->getMaxConcurrentCalls() >= 2 && "Fields should run concurrently");
        assert(mock->getMaxConcurrentCalls() <= 6 && "Endpoint capacity respected");
        assert(elapsed < std::chrono::milliseconds(6 * 150) && "Run faster than six sequential calls");
        assert(mock->getLastRequest().model == "custom-model" && "Model override routed to the endpoint");
        assert(result.metadata["model_used"] == "custom-model" && "Model override recorded");

        std::cout << "✓ Concurrent fields test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running MeetingExtractor unit tests..." << std::endl;
        std::cout << "=====================================" << std::endl;

        testPromptConstruction();
        std::cout << std::endl;

        testParseFieldResponse();
        std::cout << std::endl;

        testValidation();
        std::cout << std::endl;

        testConfidenceScore();
        std::cout << std::endl;

        testSuccessfulExtraction();
        std::cout << std::endl;

        testPartialFailure();
        std::cout << std::endl;

        testProcessingErrorRetried();
        std::cout << std::endl;

        testNonStandardException();
        std::cout << std::endl;

        testNoEndpointAvailable();
        std::cout << std::endl;

        testEmptyTranscript();
        std::cout << std::endl;

        testCancellation();
        std::cout << std::endl;

        testConcurrentFields();
        std::cout << std::endl;

        std::cout << "All MeetingExtractor tests passed!" << std::endl;
    }
};

int main() {
    try {
        MeetingExtractorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All MeetingExtractor component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
