// =================================================================
// src/Quorum/MeetingMinutes.cpp
// =================================================================

#include "Quorum/MeetingMinutes.hpp"

namespace Quorum {

namespace {

std::optional<std::string> readOptional(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        std::string value = it->get<std::string>();
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
    return it->dump();
}

std::string readString(const nlohmann::json& j, const char* key) {
    return readOptional(j, key).value_or("");
}

void writeOptional(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

} // anonymous namespace

void to_json(nlohmann::json& j, const MeetingBasicInfo& info) {
    j = nlohmann::json::object();
    writeOptional(j, "title", info.title);
    writeOptional(j, "date", info.date);
    writeOptional(j, "time", info.time);
    writeOptional(j, "duration", info.duration);
    writeOptional(j, "location", info.location);
    writeOptional(j, "meeting_type", info.meeting_type);
    writeOptional(j, "organizer", info.organizer);
}

void from_json(const nlohmann::json& j, MeetingBasicInfo& info) {
    info.title = readOptional(j, "title");
    info.date = readOptional(j, "date");
    info.time = readOptional(j, "time");
    info.duration = readOptional(j, "duration");
    info.location = readOptional(j, "location");
    info.meeting_type = readOptional(j, "meeting_type");
    info.organizer = readOptional(j, "organizer");
}

void to_json(nlohmann::json& j, const Attendee& attendee) {
    j = {{"name", attendee.name}, {"present", attendee.present}};
    writeOptional(j, "role", attendee.role);
    writeOptional(j, "organization", attendee.organization);
    writeOptional(j, "email", attendee.email);
}

void from_json(const nlohmann::json& j, Attendee& attendee) {
    attendee.name = readString(j, "name");
    attendee.role = readOptional(j, "role");
    attendee.organization = readOptional(j, "organization");
    attendee.email = readOptional(j, "email");

    auto it = j.find("present");
    attendee.present = (it == j.end() || !it->is_boolean()) ? true : it->get<bool>();
}

void to_json(nlohmann::json& j, const DiscussionTopic& topic) {
    j = {{"title", topic.title}, {"key_points", topic.key_points}};
    writeOptional(j, "description", topic.description);
    writeOptional(j, "presenter", topic.presenter);
    writeOptional(j, "duration", topic.duration);
}

void from_json(const nlohmann::json& j, DiscussionTopic& topic) {
    topic.title = readString(j, "title");
    topic.description = readOptional(j, "description");
    topic.presenter = readOptional(j, "presenter");
    topic.duration = readOptional(j, "duration");

    topic.key_points.clear();
    auto it = j.find("key_points");
    if (it != j.end() && it->is_array()) {
        for (const auto& point : *it) {
            if (point.is_string()) {
                topic.key_points.push_back(point.get<std::string>());
            }
        }
    }
}

void to_json(nlohmann::json& j, const ActionItem& item) {
    j = {{"task", item.task}};
    writeOptional(j, "assignee", item.assignee);
    writeOptional(j, "due_date", item.due_date);
    writeOptional(j, "priority", item.priority);
    writeOptional(j, "status", item.status);
    writeOptional(j, "notes", item.notes);
}

void from_json(const nlohmann::json& j, ActionItem& item) {
    item.task = readString(j, "task");
    item.assignee = readOptional(j, "assignee");
    item.due_date = readOptional(j, "due_date");
    item.priority = readOptional(j, "priority");
    item.status = readOptional(j, "status");
    item.notes = readOptional(j, "notes");
}

void to_json(nlohmann::json& j, const Decision& decision) {
    j = {{"decision", decision.decision}};
    writeOptional(j, "rationale", decision.rationale);
    writeOptional(j, "impact", decision.impact);
    writeOptional(j, "responsible_party", decision.responsible_party);
    writeOptional(j, "implementation_date", decision.implementation_date);
}

void from_json(const nlohmann::json& j, Decision& decision) {
    decision.decision = readString(j, "decision");
    decision.rationale = readOptional(j, "rationale");
    decision.impact = readOptional(j, "impact");
    decision.responsible_party = readOptional(j, "responsible_party");
    decision.implementation_date = readOptional(j, "implementation_date");
}

void to_json(nlohmann::json& j, const MeetingMinutes& minutes) {
    j = {
        {"basic_info", minutes.basic_info},
        {"attendees", minutes.attendees},
        {"agenda", minutes.agenda},
        {"action_items", minutes.action_items},
        {"decisions", minutes.decisions},
        {"key_outcomes", minutes.key_outcomes}
    };
}

} // namespace Quorum
