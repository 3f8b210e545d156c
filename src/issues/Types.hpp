#pragma once

#include "util/DateTimeUtil.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace issues {

using json = nlohmann::json;
using util::Timestamp;

/**
 * Workflow state of an issue
 *
 * Legacy aliases are accepted on input: "done" -> Completed,
 * "waiting" -> PendingUserInput.
 */
enum class IssueStatus {
    Open,
    InProgress,
    Blocked,
    Closed,
    Completed,
    PendingUserInput
};

enum class IssueType {
    Bug,
    Feature,
    Task,
    Epic,
    Chore
};

/**
 * Kind of a dependency edge. All kinds take part in cycle detection
 * and in ready/blocked derivation.
 */
enum class DependencyType {
    Blocks,
    Related,
    ParentChild,
    DiscoveredFrom
};

// === Enum conversions ===
// Parsers throw ValidationError on unknown values.

std::string statusToString(IssueStatus status);
IssueStatus parseStatus(const std::string& str);

/**
 * Map legacy aliases to their canonical names, pass anything else through
 */
std::string normalizeStatusAlias(const std::string& str);

/**
 * Closed and Completed both count as resolved for scheduling
 */
bool isResolved(IssueStatus status);

std::string issueTypeToString(IssueType type);
IssueType parseIssueType(const std::string& str);

std::string dependencyTypeToString(DependencyType type);
DependencyType parseDependencyType(const std::string& str);

constexpr int kMinPriority = 0;
constexpr int kMaxPriority = 4;

/**
 * Throws ValidationError unless kMinPriority <= priority <= kMaxPriority
 */
void validatePriority(int priority);

/**
 * Priority from a JSON integer of any width
 * Throws ValidationError for non-integers and values outside 0-4
 */
int priorityFromJson(const json& value);

/**
 * A unit of work
 */
struct Issue {
    std::string id;                           // Immutable, globally unique
    std::string title;
    std::string description;
    IssueStatus status = IssueStatus::Open;
    int priority = 2;                         // 0 = highest, 4 = lowest
    IssueType issueType = IssueType::Task;
    std::optional<std::string> assignee;
    Timestamp createdAt;
    Timestamp updatedAt;
    std::optional<Timestamp> closedAt;
    std::optional<std::string> parentId;       // Hierarchy
    std::optional<std::string> discoveredFrom; // Provenance link
    std::optional<std::string> blockingNotes;
    json metadata = json::object();

    bool operator==(const Issue& other) const = default;
};

/**
 * Directed edge: fromId is blocked by toId
 */
struct Dependency {
    std::string fromId;
    std::string toId;
    DependencyType depType = DependencyType::Blocks;
    Timestamp createdAt;

    bool operator==(const Dependency& other) const = default;
};

/**
 * Optional filters for listing; absent fields match everything
 */
struct IssueFilter {
    std::optional<IssueStatus> status;
    std::optional<int> priority;
    std::optional<IssueType> issueType;
    std::optional<std::string> assignee;

    bool matches(const Issue& issue) const;
};

/**
 * Issue paired with every blocker that is still unresolved
 */
struct BlockedIssue {
    Issue issue;
    std::vector<Issue> blockers;
};

} // namespace issues
