// =================================================================
// src/Quorum/TextPreprocessor.cpp
// =================================================================

#include "Quorum/TextPreprocessor.hpp"
#include "Quorum/Errors.hpp"
#include "Quorum/Logger.hpp"
#include "Quorum/TimeFormat.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

namespace Quorum {

namespace {

const auto ICASE = std::regex_constants::ECMAScript | std::regex_constants::icase;

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::string replaceAll(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::vector<std::string> splitBy(const std::string& text, const std::regex& boundary) {
    std::vector<std::string> parts;
    std::sregex_token_iterator iter(text.begin(), text.end(), boundary, -1);
    std::sregex_token_iterator end;
    for (; iter != end; ++iter) {
        parts.push_back(iter->str());
    }
    return parts;
}

std::vector<std::string> uniqueMatches(const std::string& text, const std::regex& pattern) {
    std::set<std::string> found;
    std::sregex_iterator iter(text.begin(), text.end(), pattern);
    std::sregex_iterator end;
    for (; iter != end; ++iter) {
        found.insert(iter->str());
    }
    return std::vector<std::string>(found.begin(), found.end());
}

size_t countMatches(const std::string& text, const std::regex& pattern) {
    return static_cast<size_t>(std::distance(
        std::sregex_iterator(text.begin(), text.end(), pattern), std::sregex_iterator()));
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // anonymous namespace

std::string segmentationModeToString(SegmentationMode mode) {
    switch (mode) {
        case SegmentationMode::PARAGRAPH: return "paragraph";
        case SegmentationMode::SENTENCE: return "sentence";
        case SegmentationMode::TOPIC: return "topic";
    }
    return "paragraph";
}

SegmentationMode parseSegmentationMode(const std::string& name) {
    if (name == "paragraph") return SegmentationMode::PARAGRAPH;
    if (name == "sentence") return SegmentationMode::SENTENCE;
    if (name == "topic") return SegmentationMode::TOPIC;
    throw ValidationError("Unknown segmentation mode: " + name);
}

nlohmann::json PreprocessingStats::toJson() const {
    return {
        {"original_chars", original_chars},
        {"cleaned_chars", cleaned_chars},
        {"chars_removed", chars_removed},
        {"original_words", original_words},
        {"cleaned_words", cleaned_words},
        {"words_removed", words_removed},
        {"segments_created", segments_created},
        {"avg_segment_length", avg_segment_length}
    };
}

// =================================================================
// RegexTextPreprocessor
// =================================================================

RegexTextPreprocessor::RegexTextPreprocessor()
    : m_filler_words(R"(\b(um|uh|ah|er|hmm|like|you know|sort of|kind of)\b)", ICASE),
      m_repeated_words(R"(\b(\w+)\s+\1\b)", ICASE),
      // Markers stay on one line and under 200 characters; std::regex recurses per matched character
      m_transcription_markers(R"(\[[^\]\n]{0,200}\]|\([^)\n]{0,200}\))"),
      m_horizontal_whitespace(R"([ \t]{2,})"),
      m_blank_line_runs(R"(\n{3,})"),
      m_speaker_labels(R"(^(Speaker\s*\d+|[A-Z][a-z]+):[ \t]*)", std::regex_constants::ECMAScript | std::regex_constants::multiline),
      m_timestamps(R"(\d{1,2}:\d{2}(?::\d{2})?(?:\s*[AP]M)?)"),
      m_interruptions(R"(--+|\.{3,})"),
      m_sentence_boundary(R"([.!?]+\s+)"),
      m_paragraph_boundary(R"(\n\s*\n)"),
      m_topic_markers(R"(\b(next|moving on|agenda|topic|item|discussion)\b)", ICASE),
      m_action_markers(R"(\b(action|task|todo|follow.?up|assign)\b)", ICASE),
      m_decision_markers(R"(\b(decide|decision|agree|resolved|conclusion)\b)", ICASE),
      m_names(R"(\b[A-Z][a-z]+ [A-Z][a-z]+\b)"),
      m_emails(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)"),
      m_phone_numbers(R"(\b(?:\+?1[-.\s]?)?(?:\(?[0-9]{3}\)?[-.\s]?)?[0-9]{3}[-.\s]?[0-9]{4}\b)"),
      m_dates(R"(\b\d{1,2}[/-]\d{1,2}[/-]\d{2,4}\b|\b(?:January|February|March|April|May|June|July|August|September|October|November|December)\s+\d{1,2}(?:,\s*\d{4})?\b)", ICASE) {

    const std::vector<std::pair<std::string, std::string>> replacements = {
        {"gonna", "going to"},
        {"wanna", "want to"},
        {"gotta", "got to"},
        {"shoulda", "should have"},
        {"coulda", "could have"},
        {"wouldve", "would have"},
        {"don't", "do not"},
        {"won't", "will not"},
        {"can't", "cannot"},
        {"isn't", "is not"},
        {"aren't", "are not"},
        {"wasn't", "was not"},
        {"weren't", "were not"},
        {"haven't", "have not"},
        {"hasn't", "has not"},
        {"hadn't", "had not"},
        {"shouldn't", "should not"},
        {"wouldn't", "would not"},
        {"couldn't", "could not"}
    };

    for (const auto& [from, to] : replacements) {
        m_replacements.emplace_back(std::regex("\\b" + from + "\\b", ICASE), to);
    }
}

PreprocessedText RegexTextPreprocessor::preprocess(const std::string& text,
                                                   const PreprocessingOptions& options) const {
    if (trim(text).empty()) {
        throw ValidationError("Transcript text is empty");
    }

    Logger::getInstance().info("TextPreprocessor",
        "Starting text preprocessing",
        std::to_string(text.size()) + " characters, segment_by=" + segmentationModeToString(options.segment_by));

    std::string cleaned = initialCleaning(text);
    cleaned = removeNoise(cleaned, options);
    cleaned = normalize(cleaned);

    PreprocessedText result;
    result.original_text = text;
    result.cleaned_text = cleaned;
    result.segments = segment(cleaned, options.segment_by);
    result.metadata = extractMetadata(text, cleaned);
    result.stats = buildStats(text, cleaned, result.segments);

    Logger::getInstance().info("TextPreprocessor",
        "Preprocessing completed",
        std::to_string(text.size()) + " -> " + std::to_string(cleaned.size()) + " characters, " +
        std::to_string(result.segments.size()) + " segments");

    return result;
}

std::string RegexTextPreprocessor::initialCleaning(const std::string& text) const {
    std::string result = replaceAll(text, "\r\n", "\n");
    result = replaceAll(result, "\r", "\n");
    result = std::regex_replace(result, m_horizontal_whitespace, " ");
    result = std::regex_replace(result, m_transcription_markers, "");
    result = std::regex_replace(result, m_timestamps, "");
    return trim(result);
}

std::string RegexTextPreprocessor::removeNoise(const std::string& text,
                                               const PreprocessingOptions& options) const {
    std::string result = text;

    if (options.remove_fillers) {
        result = std::regex_replace(result, m_filler_words, "");
    }

    if (options.remove_repetitions) {
        result = std::regex_replace(result, m_repeated_words, "$1");
    }

    if (options.remove_speaker_labels) {
        result = std::regex_replace(result, m_speaker_labels, "");
    }

    result = replaceAll(result, "\xE2\x80\xA6", ".");
    result = std::regex_replace(result, m_interruptions, ".");
    return result;
}

std::string RegexTextPreprocessor::normalize(const std::string& text) const {
    std::string result = text;

    for (const auto& [pattern, replacement] : m_replacements) {
        result = std::regex_replace(result, pattern, replacement);
    }

    result = std::regex_replace(result, std::regex(R"(\.{2,})"), ".");
    result = std::regex_replace(result, std::regex(R"(!{2,})"), "!");
    result = std::regex_replace(result, std::regex(R"(\?{2,})"), "?");
    result = std::regex_replace(result, std::regex(R"(([.!?])[ \t]*([A-Z]))"), "$1 $2");

    // Paragraph breaks survive; only runs of spaces and tabs collapse
    result = std::regex_replace(result, m_horizontal_whitespace, " ");
    result = std::regex_replace(result, std::regex(R"([ \t]+\n)"), "\n");
    result = std::regex_replace(result, std::regex(R"(\n[ \t]+)"), "\n");
    result = std::regex_replace(result, m_blank_line_runs, "\n\n");

    return trim(result);
}

// =================================================================
// Segmentation
// =================================================================

std::vector<std::string> RegexTextPreprocessor::segment(const std::string& text, SegmentationMode mode) const {
    std::vector<std::string> raw;
    switch (mode) {
        case SegmentationMode::SENTENCE:
            raw = splitBy(text, m_sentence_boundary);
            break;
        case SegmentationMode::TOPIC:
            raw = segmentByTopic(text);
            break;
        case SegmentationMode::PARAGRAPH:
            raw = splitBy(text, m_paragraph_boundary);
            break;
    }

    std::vector<std::string> segments;
    for (const auto& part : raw) {
        std::string trimmed = trim(part);
        if (trimmed.size() > 10) {
            segments.push_back(trimmed);
        }
    }
    return segments;
}

std::vector<std::string> RegexTextPreprocessor::segmentByTopic(const std::string& text) const {
    std::vector<size_t> marker_positions;
    std::sregex_iterator iter(text.begin(), text.end(), m_topic_markers);
    std::sregex_iterator end;
    for (; iter != end; ++iter) {
        marker_positions.push_back(static_cast<size_t>(iter->position()));
    }

    if (marker_positions.empty()) {
        return splitBy(text, m_paragraph_boundary);
    }

    std::vector<std::string> segments;
    size_t start = 0;
    for (size_t position : marker_positions) {
        if (start < position) {
            segments.push_back(text.substr(start, position - start));
        }
        start = position;
    }

    if (start < text.size()) {
        segments.push_back(text.substr(start));
    }
    return segments;
}

// =================================================================
// Metadata and statistics
// =================================================================

nlohmann::json RegexTextPreprocessor::extractMetadata(const std::string& original,
                                                      const std::string& cleaned) const {
    nlohmann::json metadata;
    metadata["processing_timestamp"] = formatIsoTimestamp(std::chrono::system_clock::now());
    metadata["original_length"] = original.size();
    metadata["cleaned_length"] = cleaned.size();
    metadata["compression_ratio"] = original.empty()
        ? 0.0
        : static_cast<double>(cleaned.size()) / static_cast<double>(original.size());

    metadata["entities"] = {
        {"names", uniqueMatches(cleaned, m_names)},
        {"email_addresses", uniqueMatches(cleaned, m_emails)},
        {"phone_numbers", uniqueMatches(cleaned, m_phone_numbers)},
        {"dates", uniqueMatches(cleaned, m_dates)}
    };

    metadata["content_markers"] = {
        {"topic_markers", countMatches(cleaned, m_topic_markers)},
        {"action_markers", countMatches(cleaned, m_action_markers)},
        {"decision_markers", countMatches(cleaned, m_decision_markers)}
    };

    metadata["quality_metrics"] = qualityMetrics(cleaned);
    return metadata;
}

nlohmann::json RegexTextPreprocessor::qualityMetrics(const std::string& text) const {
    std::vector<std::string> words = splitWords(text);
    if (words.empty()) {
        return {{"readability", 0.0}, {"coherence", 0.0}};
    }

    size_t sentence_count = splitBy(text, m_sentence_boundary).size();
    size_t total_word_chars = 0;
    std::set<std::string> unique_words;

    for (const auto& word : words) {
        total_word_chars += word.size();
        bool alpha = std::all_of(word.begin(), word.end(),
                                 [](unsigned char c) { return std::isalpha(c) != 0; });
        if (alpha) {
            std::string lowered = word;
            std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            unique_words.insert(lowered);
        }
    }

    double avg_word_length = static_cast<double>(total_word_chars) / static_cast<double>(words.size());
    double avg_sentence_length = sentence_count > 0
        ? static_cast<double>(words.size()) / static_cast<double>(sentence_count)
        : 0.0;

    double readability = 50.0;
    if (avg_sentence_length > 0.0) {
        readability = 206.835 - (1.015 * avg_sentence_length) - (84.6 * (avg_word_length / avg_sentence_length));
        readability = std::max(0.0, std::min(100.0, readability));
    }

    double coherence = static_cast<double>(unique_words.size()) / static_cast<double>(words.size()) * 100.0;

    return {
        {"readability", round2(readability)},
        {"coherence", round2(coherence)},
        {"avg_word_length", round2(avg_word_length)},
        {"avg_sentence_length", round2(avg_sentence_length)}
    };
}

PreprocessingStats RegexTextPreprocessor::buildStats(const std::string& original, const std::string& cleaned,
                                                     const std::vector<std::string>& segments) const {
    PreprocessingStats stats;
    stats.original_chars = original.size();
    stats.cleaned_chars = cleaned.size();
    stats.chars_removed = static_cast<long long>(original.size()) - static_cast<long long>(cleaned.size());
    stats.original_words = splitWords(original).size();
    stats.cleaned_words = splitWords(cleaned).size();
    stats.words_removed = static_cast<long long>(stats.original_words) - static_cast<long long>(stats.cleaned_words);
    stats.segments_created = segments.size();

    if (!segments.empty()) {
        size_t total = 0;
        for (const auto& seg : segments) {
            total += seg.size();
        }
        stats.avg_segment_length = total / segments.size();
    }

    return stats;
}

} // namespace Quorum
