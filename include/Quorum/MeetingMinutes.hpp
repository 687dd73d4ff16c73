// =================================================================
// include/Quorum/MeetingMinutes.hpp
// =================================================================
// Typed meeting minutes and their JSON mapping.

#pragma once

#include "nlohmann/json.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Quorum {

struct MeetingBasicInfo {
    std::optional<std::string> title;
    std::optional<std::string> date;              ///< YYYY-MM-DD when the model could tell
    std::optional<std::string> time;
    std::optional<std::string> duration;
    std::optional<std::string> location;
    std::optional<std::string> meeting_type;
    std::optional<std::string> organizer;
};

struct Attendee {
    std::string name;
    std::optional<std::string> role;
    std::optional<std::string> organization;
    std::optional<std::string> email;
    bool present = true;
};

struct DiscussionTopic {
    std::string title;
    std::optional<std::string> description;
    std::optional<std::string> presenter;
    std::optional<std::string> duration;
    std::vector<std::string> key_points;
};

struct ActionItem {
    std::string task;
    std::optional<std::string> assignee;
    std::optional<std::string> due_date;
    std::optional<std::string> priority;
    std::optional<std::string> status;
    std::optional<std::string> notes;
};

struct Decision {
    std::string decision;
    std::optional<std::string> rationale;
    std::optional<std::string> impact;
    std::optional<std::string> responsible_party;
    std::optional<std::string> implementation_date;
};

struct MeetingMinutes {
    MeetingBasicInfo basic_info;
    std::vector<Attendee> attendees;
    std::vector<DiscussionTopic> agenda;
    std::vector<ActionItem> action_items;
    std::vector<Decision> decisions;
    std::vector<std::string> key_outcomes;
};

// JSON mapping. Missing or null optional fields stay empty; scalar
// values of another type are kept as their JSON text.
void to_json(nlohmann::json& j, const MeetingBasicInfo& info);
void from_json(const nlohmann::json& j, MeetingBasicInfo& info);

void to_json(nlohmann::json& j, const Attendee& attendee);
void from_json(const nlohmann::json& j, Attendee& attendee);

void to_json(nlohmann::json& j, const DiscussionTopic& topic);
void from_json(const nlohmann::json& j, DiscussionTopic& topic);

void to_json(nlohmann::json& j, const ActionItem& item);
void from_json(const nlohmann::json& j, ActionItem& item);

void to_json(nlohmann::json& j, const Decision& decision);
void from_json(const nlohmann::json& j, Decision& decision);

void to_json(nlohmann::json& j, const MeetingMinutes& minutes);

} // namespace Quorum
