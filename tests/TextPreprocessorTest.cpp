// =================================================================
// tests/TextPreprocessorTest.cpp
// =================================================================
// Unit tests for transcript cleaning, segmentation and metadata.

#include "Quorum/Errors.hpp"
#include "Quorum/Logger.hpp"
#include "Quorum/TextPreprocessor.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

class TextPreprocessorTest {
private:
    Quorum::RegexTextPreprocessor m_preprocessor;

    std::string clean(const std::string& text,
                      const Quorum::PreprocessingOptions& options = Quorum::PreprocessingOptions()) {
        return m_preprocessor.preprocess(text, options).cleaned_text;
    }

    bool contains(const std::vector<std::string>& values, const std::string& value) {
        return std::find(values.begin(), values.end(), value) != values.end();
    }

public:
    TextPreprocessorTest() {
        Quorum::Logger::getInstance().setConsoleLogLevel(Quorum::LogLevel::WARNING);
    }

    void testEmptyInput() {
        std::cout << "Testing empty input..." << std::endl;

        bool threw = false;
        try {
            m_preprocessor.preprocess("", Quorum::PreprocessingOptions());
        } catch (const Quorum::ValidationError&) {
            threw = true;
        }
        assert(threw && "Empty transcript should be rejected");

        threw = false;
        try {
            m_preprocessor.preprocess("  \n\t  \n", Quorum::PreprocessingOptions());
        } catch (const Quorum::ValidationError&) {
            threw = true;
        }
        assert(threw && "Whitespace-only transcript should be rejected");

        std::cout << "✓ Empty input test passed" << std::endl;
    }

    void testFillerRemoval() {
        std::cout << "Testing filler removal..." << std::endl;

        std::string text = "So um we need to uh finalize the budget.";
        assert(clean(text) == "So we need to finalize the budget." && "Fillers should be removed");

        Quorum::PreprocessingOptions keep;
        keep.remove_fillers = false;
        assert(clean(text, keep) == text && "Fillers kept when removal is off");

        std::cout << "✓ Filler removal test passed" << std::endl;
    }

    void testRepetitionRemoval() {
        std::cout << "Testing repetition removal..." << std::endl;

        assert(clean("We need need to ship the the release.") == "We need to ship the release." &&
               "Immediate word repetitions should collapse");

        Quorum::PreprocessingOptions keep;
        keep.remove_repetitions = false;
        assert(clean("We need need to ship.", keep) == "We need need to ship." &&
               "Repetitions kept when removal is off");

        std::cout << "✓ Repetition removal test passed" << std::endl;
    }

    void testMarkersAndTimestamps() {
        std::cout << "Testing transcription markers and timestamps..." << std::endl;

        std::string cleaned = clean("[inaudible] Alice said (laughs) hello at 10:30 AM.");
        assert(cleaned == "Alice said hello at ." && "Markers and timestamps should be stripped");

        std::cout << "✓ Markers and timestamps test passed" << std::endl;
    }

    void testLongSingleLineTranscript() {
        std::cout << "Testing a long single-line transcript..." << std::endl;

        std::string text = "Alice: (note ";
        for (int i = 0; i < 5000; ++i) {
            text += "we discussed the budget and the roadmap ";
        }
        text += "[crosstalk] and closed the meeting.";
        assert(text.size() > 200000 && "Transcript is over 200 KB");
        assert(text.find('\n') == std::string::npos && "Transcript is one line");

        auto result = m_preprocessor.preprocess(text, Quorum::PreprocessingOptions());
        assert(result.cleaned_text.find("(note") != std::string::npos && "Unclosed parenthesis is kept");
        assert(result.cleaned_text.find("[crosstalk]") == std::string::npos && "Closed marker still stripped");
        assert(result.cleaned_text.find("closed the meeting.") != std::string::npos && "Tail of the line kept");
        assert(!result.segments.empty() && "Long line segmented");

        std::cout << "✓ Long single-line transcript test passed" << std::endl;
    }

    void testSpeakerLabels() {
        std::cout << "Testing speaker labels..." << std::endl;

        std::string text = "Alice: Hello everyone, thanks for joining.\nSpeaker 2: Happy to be here today.";
        std::string kept = clean(text);
        assert(kept.find("Alice:") != std::string::npos && "Labels kept by default");

        Quorum::PreprocessingOptions strip;
        strip.remove_speaker_labels = true;
        std::string stripped = clean(text, strip);
        assert(stripped.find("Alice:") == std::string::npos && "First label should be removed");
        assert(stripped.find("Speaker 2:") == std::string::npos && "Label on a later line should be removed");
        assert(stripped.find("Happy to be here today.") != std::string::npos && "Spoken text should remain");

        std::cout << "✓ Speaker labels test passed" << std::endl;
    }

    void testNormalization() {
        std::cout << "Testing normalization..." << std::endl;

        assert(clean("We can't stop and we won't wait, we're gonna ship.") ==
               "We cannot stop and we will not wait, we're going to ship." && "Contractions expanded");

        assert(clean("Really!!! Why?? Fine..") == "Really! Why? Fine." && "Repeated punctuation collapsed");

        assert(clean("Done.Next item is here.") == "Done. Next item is here." &&
               "Space inserted after sentence punctuation");

        std::string interrupted = clean("We should--actually wait... let me think");
        assert(interrupted.find("--") == std::string::npos && "Dashes replaced");
        assert(interrupted.find("..") == std::string::npos && "Ellipses replaced");

        std::string unicode = clean("Well\xE2\x80\xA6 that is settled now.");
        assert(unicode.find("\xE2\x80\xA6") == std::string::npos && "Unicode ellipsis replaced");

        std::cout << "✓ Normalization test passed" << std::endl;
    }

    void testParagraphSegmentation() {
        std::cout << "Testing paragraph segmentation..." << std::endl;

        std::string text =
            "First paragraph about the roadmap.\r\n\r\n"
            "Second paragraph covers    the budget.\n\n\n\n"
            "Ok.\n\n"
            "Third paragraph lists the risks.";

        auto result = m_preprocessor.preprocess(text, Quorum::PreprocessingOptions());
        assert(result.cleaned_text.find("\r") == std::string::npos && "Carriage returns normalized");
        assert(result.cleaned_text.find("\n\n\n") == std::string::npos && "Blank line runs collapsed");
        assert(result.cleaned_text.find("covers the budget") != std::string::npos && "Spaces collapsed");

        assert(result.segments.size() == 3 && "Short paragraph should be dropped");
        assert(result.segments[0] == "First paragraph about the roadmap." && "Segments keep their order");
        assert(result.segments[2] == "Third paragraph lists the risks." && "Last paragraph kept");
        assert(result.stats.segments_created == 3 && "Stats count the segments");

        std::cout << "✓ Paragraph segmentation test passed" << std::endl;
    }

    void testSentenceSegmentation() {
        std::cout << "Testing sentence segmentation..." << std::endl;

        Quorum::PreprocessingOptions options;
        options.segment_by = Quorum::SegmentationMode::SENTENCE;
        auto result = m_preprocessor.preprocess(
            "The first sentence is here. A second sentence follows! Is this the third one? Yes.", options);

        assert(result.segments.size() == 3 && "Three long sentences, the short one dropped");
        assert(result.segments[0] == "The first sentence is here" && "Boundary punctuation is consumed");

        std::cout << "✓ Sentence segmentation test passed" << std::endl;
    }

    void testTopicSegmentation() {
        std::cout << "Testing topic segmentation..." << std::endl;

        std::string text = "Welcome everyone to the weekly sync. Moving on to the budget review now. "
                           "Next we cover the hiring plans.";
        auto segments = m_preprocessor.segment(text, Quorum::SegmentationMode::TOPIC);
        assert(segments.size() == 3 && "Segments should start at each topic marker");
        assert(segments[1].rfind("Moving on", 0) == 0 && "Second segment starts at its marker");
        assert(segments[2].rfind("Next", 0) == 0 && "Third segment starts at its marker");

        std::string plain = "Welcome everyone to the weekly sync.\n\nWe will keep this short today.";
        auto fallback = m_preprocessor.segment(plain, Quorum::SegmentationMode::TOPIC);
        assert(fallback.size() == 2 && "Without markers topic mode splits by paragraph");

        std::cout << "✓ Topic segmentation test passed" << std::endl;
    }

    void testSegmentationModeNames() {
        std::cout << "Testing segmentation mode names..." << std::endl;

        assert(Quorum::parseSegmentationMode("paragraph") == Quorum::SegmentationMode::PARAGRAPH);
        assert(Quorum::parseSegmentationMode("sentence") == Quorum::SegmentationMode::SENTENCE);
        assert(Quorum::parseSegmentationMode("topic") == Quorum::SegmentationMode::TOPIC);
        assert(Quorum::segmentationModeToString(Quorum::SegmentationMode::TOPIC) == "topic");

        bool threw = false;
        try {
            Quorum::parseSegmentationMode("chapter");
        } catch (const Quorum::ValidationError&) {
            threw = true;
        }
        assert(threw && "Unknown mode should be rejected");

        std::cout << "✓ Segmentation mode names test passed" << std::endl;
    }

    void testMetadata() {
        std::cout << "Testing metadata extraction..." << std::endl;

        std::string text =
            "please contact Jane Smith at jane.smith@example.com or 555-123-4567 before 12/05/2024.\n\n"
            "We made a decision to move forward. Action: Bob will follow up on the vendor contract.\n\n"
            "Next topic is the launch plan on March 3, 2025.";

        auto result = m_preprocessor.preprocess(text, Quorum::PreprocessingOptions());
        const auto& metadata = result.metadata;

        auto names = metadata["entities"]["names"].get<std::vector<std::string>>();
        auto emails = metadata["entities"]["email_addresses"].get<std::vector<std::string>>();
        auto phones = metadata["entities"]["phone_numbers"].get<std::vector<std::string>>();
        auto dates = metadata["entities"]["dates"].get<std::vector<std::string>>();

        assert(contains(names, "Jane Smith") && "Full name should be found");
        assert(contains(emails, "jane.smith@example.com") && "Email should be found");
        assert(contains(phones, "555-123-4567") && "Phone number should be found");
        assert(contains(dates, "12/05/2024") && "Numeric date should be found");
        assert(contains(dates, "March 3, 2025") && "Written date should be found");

        assert(metadata["content_markers"]["decision_markers"].get<size_t>() >= 1 && "Decision marker counted");
        assert(metadata["content_markers"]["action_markers"].get<size_t>() >= 2 && "Action markers counted");
        assert(metadata["content_markers"]["topic_markers"].get<size_t>() >= 2 && "Topic markers counted");

        assert(metadata["original_length"].get<size_t>() == text.size() && "Original length recorded");
        assert(metadata["cleaned_length"].get<size_t>() == result.cleaned_text.size() && "Cleaned length recorded");
        assert(metadata.contains("processing_timestamp") && "Timestamp recorded");

        const auto& quality = metadata["quality_metrics"];
        double readability = quality["readability"].get<double>();
        double coherence = quality["coherence"].get<double>();
        assert(readability >= 0.0 && readability <= 100.0 && "Readability is clamped to 0..100");
        assert(coherence > 0.0 && coherence <= 100.0 && "Coherence is a percentage");
        assert(quality.contains("avg_word_length") && quality.contains("avg_sentence_length"));

        std::cout << "✓ Metadata test passed" << std::endl;
    }

    void testStatistics() {
        std::cout << "Testing statistics..." << std::endl;

        std::string text = "Um so we we need to, uh, review the the roadmap today.\n\nThat is all for now folks.";
        auto result = m_preprocessor.preprocess(text, Quorum::PreprocessingOptions());
        const auto& stats = result.stats;

        assert(stats.original_chars == text.size() && "Original size recorded");
        assert(stats.cleaned_chars == result.cleaned_text.size() && "Cleaned size recorded");
        assert(stats.chars_removed > 0 && "Cleaning removes characters");
        assert(stats.words_removed > 0 && "Cleaning removes words");
        assert(stats.segments_created == result.segments.size() && "Segment count recorded");
        assert(stats.avg_segment_length > 0 && "Average segment length recorded");

        auto json = stats.toJson();
        assert(json["segments_created"] == result.segments.size() && "Stats serialize");

        std::cout << "✓ Statistics test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TextPreprocessor unit tests..." << std::endl;
        std::cout << "=====================================" << std::endl;

        testEmptyInput();
        std::cout << std::endl;

        testFillerRemoval();
        std::cout << std::endl;

        testRepetitionRemoval();
        std::cout << std::endl;

        testMarkersAndTimestamps();
        std::cout << std::endl;

        testLongSingleLineTranscript();
        std::cout << std::endl;

        testSpeakerLabels();
        std::cout << std::endl;

        testNormalization();
        std::cout << std::endl;

        testParagraphSegmentation();
        std::cout << std::endl;

        testSentenceSegmentation();
        std::cout << std::endl;

        testTopicSegmentation();
        std::cout << std::endl;

        testSegmentationModeNames();
        std::cout << std::endl;

        testMetadata();
        std::cout << std::endl;

        testStatistics();
        std::cout << std::endl;

        std::cout << "All TextPreprocessor tests passed!" << std::endl;
    }
};

int main() {
    try {
        TextPreprocessorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All TextPreprocessor component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
