// =================================================================
// include/Quorum/TextPreprocessor.hpp
// =================================================================
// Transcript cleaning and segmentation ahead of extraction.

#pragma once

#include "nlohmann/json.hpp"
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace Quorum {

/**
 * @brief Segmentation modes
 */
enum class SegmentationMode {
    PARAGRAPH,
    SENTENCE,
    TOPIC
};

std::string segmentationModeToString(SegmentationMode mode);

/**
 * @brief Parse "paragraph", "sentence" or "topic"
 * @throws ValidationError on any other name
 */
SegmentationMode parseSegmentationMode(const std::string& name);

struct PreprocessingOptions {
    bool remove_fillers = true;
    bool remove_repetitions = true;
    bool remove_speaker_labels = false;
    SegmentationMode segment_by = SegmentationMode::PARAGRAPH;
};

struct PreprocessingStats {
    size_t original_chars = 0;
    size_t cleaned_chars = 0;
    long long chars_removed = 0;
    size_t original_words = 0;
    size_t cleaned_words = 0;
    long long words_removed = 0;
    size_t segments_created = 0;
    size_t avg_segment_length = 0;

    nlohmann::json toJson() const;
};

struct PreprocessedText {
    std::string original_text;
    std::string cleaned_text;
    std::vector<std::string> segments;
    nlohmann::json metadata;                      ///< Lengths, entities, content markers, quality metrics
    PreprocessingStats stats;
};

/**
 * @brief Abstract transcript preprocessor
 *
 * Implementations are pure: the same input and options always produce
 * the same cleaned text and segments.
 */
class TextPreprocessor {
public:
    virtual ~TextPreprocessor() = default;

    /**
     * @brief Clean and segment a raw transcript
     * @param text Raw transcript
     * @param options Cleaning switches and segmentation mode
     * @return Cleaned text, segments, metadata and statistics
     * @throws ValidationError if the text is empty after trimming
     */
    virtual PreprocessedText preprocess(const std::string& text,
                                        const PreprocessingOptions& options) const = 0;
};

/**
 * @brief Regex-driven default preprocessor
 */
class RegexTextPreprocessor : public TextPreprocessor {
public:
    RegexTextPreprocessor();

    PreprocessedText preprocess(const std::string& text,
                                const PreprocessingOptions& options) const override;

    /**
     * @brief Segment already cleaned text
     * @return Trimmed segments longer than ten characters
     */
    std::vector<std::string> segment(const std::string& text, SegmentationMode mode) const;

private:
    std::string initialCleaning(const std::string& text) const;
    std::string removeNoise(const std::string& text, const PreprocessingOptions& options) const;
    std::string normalize(const std::string& text) const;
    std::vector<std::string> segmentByTopic(const std::string& text) const;
    nlohmann::json extractMetadata(const std::string& original, const std::string& cleaned) const;
    nlohmann::json qualityMetrics(const std::string& text) const;
    PreprocessingStats buildStats(const std::string& original, const std::string& cleaned,
                                  const std::vector<std::string>& segments) const;

    std::regex m_filler_words;
    std::regex m_repeated_words;
    std::regex m_transcription_markers;
    std::regex m_horizontal_whitespace;
    std::regex m_blank_line_runs;
    std::regex m_speaker_labels;
    std::regex m_timestamps;
    std::regex m_interruptions;

    std::regex m_sentence_boundary;
    std::regex m_paragraph_boundary;
    std::regex m_topic_markers;
    std::regex m_action_markers;
    std::regex m_decision_markers;

    std::regex m_names;
    std::regex m_emails;
    std::regex m_phone_numbers;
    std::regex m_dates;

    std::vector<std::pair<std::regex, std::string>> m_replacements;
};

} // namespace Quorum
