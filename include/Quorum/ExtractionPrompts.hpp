// =================================================================
// include/Quorum/ExtractionPrompts.hpp
// =================================================================
// Prompt templates and generation settings for each minutes field.

#pragma once

#include "Quorum/LlmInteraction.hpp"
#include <array>
#include <string>

namespace Quorum {

/**
 * @brief The six independently extracted minutes fields
 */
enum class ExtractionField {
    BASIC_INFO,
    ATTENDEES,
    AGENDA,
    ACTION_ITEMS,
    DECISIONS,
    KEY_OUTCOMES
};

constexpr std::array<ExtractionField, 6> ALL_EXTRACTION_FIELDS = {
    ExtractionField::BASIC_INFO,
    ExtractionField::ATTENDEES,
    ExtractionField::AGENDA,
    ExtractionField::ACTION_ITEMS,
    ExtractionField::DECISIONS,
    ExtractionField::KEY_OUTCOMES
};

std::string extractionFieldToString(ExtractionField field);

/**
 * @brief Which part of the transcript a field's prompt sees
 */
enum class TextWindow {
    HEAD,       ///< First N characters
    TAIL,       ///< Last N characters
    FULL        ///< Whole transcript
};

TextWindow textWindowFor(ExtractionField field);

/**
 * @brief Cut the transcript down to a field's window
 *
 * Cuts never split a UTF-8 sequence.
 * @param text Cleaned transcript
 * @param window Window kind
 * @param window_chars Window size in bytes
 */
std::string sliceForWindow(const std::string& text, TextWindow window, size_t window_chars);

/**
 * @brief Raw template of a field, with a {text} placeholder
 */
const std::string& promptTemplateFor(ExtractionField field);

/**
 * @brief Build the generation request for one field
 * @param field Field to extract
 * @param text Cleaned transcript
 * @param window_chars Size of the head and tail windows
 * @param model Model override, empty for the endpoint's model
 * @return Request with the prompt, a "json" format hint and sampling options
 */
GenerationRequest buildExtractionRequest(ExtractionField field,
                                         const std::string& text,
                                         size_t window_chars,
                                         const std::string& model = "");

} // namespace Quorum
