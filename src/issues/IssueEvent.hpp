#pragma once

#include "issues/Types.hpp"
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace issues {

namespace event_types {
inline constexpr const char* kCreated = "created";
inline constexpr const char* kUpdated = "updated";
inline constexpr const char* kClosed = "closed";
inline constexpr const char* kDependencyAdded = "dependency_added";
inline constexpr const char* kDependencyRemoved = "dependency_removed";
inline constexpr const char* kSessionEnded = "session_ended";
} // namespace event_types

/**
 * Change payloads, one alternative per event type
 */

/// created: snapshot of the new issue
struct CreatedChange {
    Issue issue;
};

/// old/new pair for one field of an update
struct FieldChange {
    json oldValue;
    json newValue;
};

/// updated: field name -> {old, new}
struct UpdatedChange {
    std::map<std::string, FieldChange> fields;
};

/// closed, session_ended
struct ReasonChange {
    std::string reason;
};

/// dependency_added (depType set), dependency_removed (depType absent)
struct DependencyChange {
    std::string fromId;
    std::string toId;
    std::optional<DependencyType> depType;
};

/// Any event type this build does not model; kept verbatim
struct OpaqueChange {
    json payload = json::object();
};

using EventChange = std::variant<
    CreatedChange,
    UpdatedChange,
    ReasonChange,
    DependencyChange,
    OpaqueChange
>;

/**
 * Immutable audit record, appended to the event log
 */
struct IssueEvent {
    std::string id;
    std::string issueId;
    std::string eventType;
    std::string actor;
    EventChange changes;
    Timestamp timestamp;
    std::optional<std::string> sessionId;  // External session that produced the event
};

} // namespace issues
