// =================================================================
// src/Quorum/ExtractionPrompts.cpp
// =================================================================

#include "Quorum/ExtractionPrompts.hpp"

namespace Quorum {

namespace {

const std::string PROMPT_PREAMBLE =
    "You are an expert meeting minutes analyzer. ";

const std::string PROMPT_SUFFIX =
    "\n\nText to analyze:\n{text}\n\nJSON Response:";

const std::string BASIC_INFO_TEMPLATE = PROMPT_PREAMBLE +
    "Extract the basic meeting information from the text below.\n"
    "Return ONLY a JSON object with exactly these fields, using null when the text does not say:\n"
    "{\n"
    "    \"title\": \"meeting title or subject\",\n"
    "    \"date\": \"meeting date as YYYY-MM-DD\",\n"
    "    \"time\": \"start time\",\n"
    "    \"duration\": \"how long the meeting lasted\",\n"
    "    \"location\": \"room or online platform\",\n"
    "    \"meeting_type\": \"kind of meeting\",\n"
    "    \"organizer\": \"name of the organizer\"\n"
    "}" + PROMPT_SUFFIX;

const std::string ATTENDEES_TEMPLATE = PROMPT_PREAMBLE +
    "List everyone who attended the meeting described below.\n"
    "Return ONLY a JSON array of objects with exactly these fields:\n"
    "[\n"
    "    {\n"
    "        \"name\": \"full name\",\n"
    "        \"role\": \"job title or role\",\n"
    "        \"organization\": \"company or department\",\n"
    "        \"email\": \"email address if mentioned\",\n"
    "        \"present\": true\n"
    "    }\n"
    "]" + PROMPT_SUFFIX;

const std::string AGENDA_TEMPLATE = PROMPT_PREAMBLE +
    "Identify the agenda items and discussion topics in the text below.\n"
    "Return ONLY a JSON array of objects with exactly these fields:\n"
    "[\n"
    "    {\n"
    "        \"title\": \"topic title\",\n"
    "        \"description\": \"short summary of the discussion\",\n"
    "        \"presenter\": \"who led the topic\",\n"
    "        \"duration\": \"time spent, if mentioned\",\n"
    "        \"key_points\": [\"point\", \"point\"]\n"
    "    }\n"
    "]" + PROMPT_SUFFIX;

const std::string ACTION_ITEMS_TEMPLATE = PROMPT_PREAMBLE +
    "Find every action item or task assigned in the text below.\n"
    "Return ONLY a JSON array of objects with exactly these fields:\n"
    "[\n"
    "    {\n"
    "        \"task\": \"what has to be done\",\n"
    "        \"assignee\": \"person responsible\",\n"
    "        \"due_date\": \"deadline as YYYY-MM-DD, if mentioned\",\n"
    "        \"priority\": \"high, medium or low, if mentioned\",\n"
    "        \"status\": \"current status, if mentioned\",\n"
    "        \"notes\": \"anything else about the task\"\n"
    "    }\n"
    "]" + PROMPT_SUFFIX;

const std::string DECISIONS_TEMPLATE = PROMPT_PREAMBLE +
    "Find the decisions that were made in the text below.\n"
    "Return ONLY a JSON array of objects with exactly these fields:\n"
    "[\n"
    "    {\n"
    "        \"decision\": \"what was decided\",\n"
    "        \"rationale\": \"why it was decided\",\n"
    "        \"impact\": \"expected consequences\",\n"
    "        \"responsible_party\": \"person or team carrying it out\",\n"
    "        \"implementation_date\": \"effective date as YYYY-MM-DD\"\n"
    "    }\n"
    "]" + PROMPT_SUFFIX;

const std::string KEY_OUTCOMES_TEMPLATE = PROMPT_PREAMBLE +
    "Summarize the key outcomes of the meeting described below.\n"
    "Return ONLY a JSON array of strings, one per outcome:\n"
    "[\"outcome\", \"outcome\"]" + PROMPT_SUFFIX;

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // anonymous namespace

std::string extractionFieldToString(ExtractionField field) {
    switch (field) {
        case ExtractionField::BASIC_INFO: return "basic_info";
        case ExtractionField::ATTENDEES: return "attendees";
        case ExtractionField::AGENDA: return "agenda";
        case ExtractionField::ACTION_ITEMS: return "action_items";
        case ExtractionField::DECISIONS: return "decisions";
        case ExtractionField::KEY_OUTCOMES: return "key_outcomes";
    }
    return "unknown";
}

TextWindow textWindowFor(ExtractionField field) {
    switch (field) {
        case ExtractionField::BASIC_INFO:
        case ExtractionField::ATTENDEES:
            return TextWindow::HEAD;
        case ExtractionField::KEY_OUTCOMES:
            return TextWindow::TAIL;
        case ExtractionField::AGENDA:
        case ExtractionField::ACTION_ITEMS:
        case ExtractionField::DECISIONS:
            break;
    }
    return TextWindow::FULL;
}

std::string sliceForWindow(const std::string& text, TextWindow window, size_t window_chars) {
    if (window == TextWindow::FULL || text.size() <= window_chars) {
        return text;
    }

    if (window == TextWindow::HEAD) {
        size_t end = window_chars;
        while (end > 0 && isContinuationByte(text[end])) {
            --end;
        }
        return text.substr(0, end);
    }

    size_t start = text.size() - window_chars;
    while (start < text.size() && isContinuationByte(text[start])) {
        ++start;
    }
    return text.substr(start);
}

const std::string& promptTemplateFor(ExtractionField field) {
    switch (field) {
        case ExtractionField::BASIC_INFO: return BASIC_INFO_TEMPLATE;
        case ExtractionField::ATTENDEES: return ATTENDEES_TEMPLATE;
        case ExtractionField::AGENDA: return AGENDA_TEMPLATE;
        case ExtractionField::ACTION_ITEMS: return ACTION_ITEMS_TEMPLATE;
        case ExtractionField::DECISIONS: return DECISIONS_TEMPLATE;
        case ExtractionField::KEY_OUTCOMES: return KEY_OUTCOMES_TEMPLATE;
    }
    return KEY_OUTCOMES_TEMPLATE;
}

GenerationRequest buildExtractionRequest(ExtractionField field,
                                         const std::string& text,
                                         size_t window_chars,
                                         const std::string& model) {
    std::string prompt = promptTemplateFor(field);
    const std::string placeholder = "{text}";
    size_t pos = prompt.find(placeholder);
    if (pos != std::string::npos) {
        prompt.replace(pos, placeholder.size(), sliceForWindow(text, textWindowFor(field), window_chars));
    }

    GenerationRequest request;
    request.prompt = prompt;
    request.model = model;
    request.format_hint = "json";

    switch (field) {
        case ExtractionField::BASIC_INFO:
            request.options = {{"temperature", 0.1}, {"top_p", 0.9}};
            break;
        case ExtractionField::AGENDA:
        case ExtractionField::KEY_OUTCOMES:
            request.options = {{"temperature", 0.2}};
            break;
        case ExtractionField::ATTENDEES:
        case ExtractionField::ACTION_ITEMS:
        case ExtractionField::DECISIONS:
            request.options = {{"temperature", 0.1}};
            break;
    }

    return request;
}

} // namespace Quorum
