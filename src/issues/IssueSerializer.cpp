#include "issues/IssueSerializer.hpp"
#include <stdexcept>

namespace issues {

namespace {

template<class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

// =============================================================================
// Helpers
// =============================================================================

json IssueSerializer::optionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> IssueSerializer::optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string IssueSerializer::requireString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw std::runtime_error(std::string("Missing or non-string field '") + key + "'");
    }
    return it->get<std::string>();
}

// =============================================================================
// Issue
// =============================================================================

json IssueSerializer::issueToJson(const Issue& issue) {
    json j;
    j["id"] = issue.id;
    j["title"] = issue.title;
    j["description"] = issue.description;
    j["status"] = statusToString(issue.status);
    j["priority"] = issue.priority;
    j["issue_type"] = issueTypeToString(issue.issueType);
    j["assignee"] = optionalToJson(issue.assignee);
    j["created_at"] = util::formatTimestamp(issue.createdAt);
    j["updated_at"] = util::formatTimestamp(issue.updatedAt);
    j["closed_at"] = issue.closedAt ? json(util::formatTimestamp(*issue.closedAt)) : json(nullptr);
    j["parent_id"] = optionalToJson(issue.parentId);
    j["discovered_from"] = optionalToJson(issue.discoveredFrom);
    j["blocking_notes"] = optionalToJson(issue.blockingNotes);
    j["metadata"] = issue.metadata;
    return j;
}

Issue IssueSerializer::issueFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Issue record is not a JSON object");
    }

    Issue issue;
    issue.id = requireString(j, "id");
    issue.title = requireString(j, "title");
    issue.description = j.value("description", "");
    issue.status = parseStatus(requireString(j, "status"));
    issue.priority = priorityFromJson(j.at("priority"));
    issue.issueType = parseIssueType(requireString(j, "issue_type"));
    issue.assignee = optionalString(j, "assignee");
    issue.createdAt = util::parseTimestamp(requireString(j, "created_at"));
    issue.updatedAt = util::parseTimestamp(requireString(j, "updated_at"));
    if (auto closedAt = optionalString(j, "closed_at")) {
        issue.closedAt = util::parseTimestamp(*closedAt);
    }
    issue.parentId = optionalString(j, "parent_id");
    issue.discoveredFrom = optionalString(j, "discovered_from");
    issue.blockingNotes = optionalString(j, "blocking_notes");

    auto metaIt = j.find("metadata");
    if (metaIt != j.end() && !metaIt->is_null()) {
        if (!metaIt->is_object()) {
            throw std::runtime_error("Issue metadata is not a JSON object");
        }
        issue.metadata = *metaIt;
    }
    return issue;
}

// =============================================================================
// Dependency
// =============================================================================

json IssueSerializer::dependencyToJson(const Dependency& dep) {
    return json{
        {"from_id", dep.fromId},
        {"to_id", dep.toId},
        {"dep_type", dependencyTypeToString(dep.depType)},
        {"created_at", util::formatTimestamp(dep.createdAt)}
    };
}

Dependency IssueSerializer::dependencyFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Dependency record is not a JSON object");
    }

    Dependency dep;
    dep.fromId = requireString(j, "from_id");
    dep.toId = requireString(j, "to_id");
    dep.depType = parseDependencyType(j.value("dep_type", "blocks"));
    dep.createdAt = util::parseTimestamp(requireString(j, "created_at"));
    return dep;
}

// =============================================================================
// Change payloads
// =============================================================================

json IssueSerializer::changeToJson(const EventChange& change) {
    return std::visit(Overloaded{
        [](const CreatedChange& c) {
            return json{{"issue", issueToJson(c.issue)}};
        },
        [](const UpdatedChange& c) {
            json j = json::object();
            for (const auto& [field, pair] : c.fields) {
                j[field] = json{{"old", pair.oldValue}, {"new", pair.newValue}};
            }
            return j;
        },
        [](const ReasonChange& c) {
            return json{{"reason", c.reason}};
        },
        [](const DependencyChange& c) {
            json j{{"from_id", c.fromId}, {"to_id", c.toId}};
            if (c.depType) {
                j["dep_type"] = dependencyTypeToString(*c.depType);
            }
            return j;
        },
        [](const OpaqueChange& c) {
            return c.payload;
        }
    }, change);
}

EventChange IssueSerializer::changeFromJson(const std::string& eventType, const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Event changes are not a JSON object");
    }

    if (eventType == event_types::kCreated) {
        return CreatedChange{issueFromJson(j.at("issue"))};
    }

    if (eventType == event_types::kUpdated) {
        UpdatedChange change;
        for (const auto& [field, pair] : j.items()) {
            if (pair.is_object() && pair.contains("old") && pair.contains("new")) {
                change.fields[field] = FieldChange{pair["old"], pair["new"]};
            } else {
                // Older logs stored the metadata patch without an old value
                change.fields[field] = FieldChange{nullptr, pair};
            }
        }
        return change;
    }

    if (eventType == event_types::kClosed || eventType == event_types::kSessionEnded) {
        return ReasonChange{j.value("reason", "")};
    }

    if (eventType == event_types::kDependencyAdded || eventType == event_types::kDependencyRemoved) {
        DependencyChange change{requireString(j, "from_id"), requireString(j, "to_id"), std::nullopt};
        if (auto depType = optionalString(j, "dep_type")) {
            change.depType = parseDependencyType(*depType);
        }
        return change;
    }

    return OpaqueChange{j};
}

// =============================================================================
// Event
// =============================================================================

json IssueSerializer::eventToJson(const IssueEvent& event) {
    json j;
    j["id"] = event.id;
    j["issue_id"] = event.issueId;
    j["event_type"] = event.eventType;
    j["actor"] = event.actor;
    j["changes"] = changeToJson(event.changes);
    j["timestamp"] = util::formatTimestamp(event.timestamp);
    j["session_id"] = optionalToJson(event.sessionId);
    return j;
}

IssueEvent IssueSerializer::eventFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Event record is not a JSON object");
    }

    IssueEvent event;
    event.id = requireString(j, "id");
    event.issueId = requireString(j, "issue_id");
    event.eventType = requireString(j, "event_type");
    event.actor = j.value("actor", "");
    event.changes = changeFromJson(event.eventType, j.value("changes", json::object()));
    event.timestamp = util::parseTimestamp(requireString(j, "timestamp"));
    event.sessionId = optionalString(j, "session_id");
    return event;
}

} // namespace issues
