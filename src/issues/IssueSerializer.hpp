#pragma once

#include "issues/IssueEvent.hpp"
#include "issues/Types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace issues {

/**
 * JSON encoding of issues, dependencies and events
 *
 * Issue:
 *   {"id": "...", "title": "...", "description": "", "status": "open",
 *    "priority": 2, "issue_type": "task", "assignee": null,
 *    "created_at": "2026-01-02T03:04:05.123456Z", "updated_at": "...",
 *    "closed_at": null, "parent_id": null, "discovered_from": null,
 *    "blocking_notes": null, "metadata": {}}
 *
 * Dependency:
 *   {"from_id": "...", "to_id": "...", "dep_type": "blocks", "created_at": "..."}
 *
 * Event:
 *   {"id": "...", "issue_id": "...", "event_type": "updated", "actor": "...",
 *    "changes": {...}, "timestamp": "...", "session_id": null}
 *
 * Decoders throw std::runtime_error (nlohmann type errors included) or
 * ValidationError on malformed records; the storage layer wraps them.
 */
class IssueSerializer {
public:
    static json issueToJson(const Issue& issue);
    static Issue issueFromJson(const json& j);

    static json dependencyToJson(const Dependency& dep);
    static Dependency dependencyFromJson(const json& j);

    static json eventToJson(const IssueEvent& event);
    static IssueEvent eventFromJson(const json& j);

    /**
     * Encode a change payload in the on-disk shape for its event type
     */
    static json changeToJson(const EventChange& change);

    /**
     * Decode a change payload, picking the alternative from eventType
     */
    static EventChange changeFromJson(const std::string& eventType, const json& j);

private:
    static json optionalToJson(const std::optional<std::string>& value);
    static std::optional<std::string> optionalString(const json& j, const char* key);
    static std::string requireString(const json& j, const char* key);
};

} // namespace issues
