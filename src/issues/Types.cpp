#include "issues/Types.hpp"
#include "issues/Errors.hpp"
#include <cstdint>

namespace issues {

// === Status ===

std::string statusToString(IssueStatus status) {
    switch (status) {
        case IssueStatus::Open:             return "open";
        case IssueStatus::InProgress:       return "in_progress";
        case IssueStatus::Blocked:          return "blocked";
        case IssueStatus::Closed:           return "closed";
        case IssueStatus::Completed:        return "completed";
        case IssueStatus::PendingUserInput: return "pending_user_input";
    }
    return "unknown";
}

std::string normalizeStatusAlias(const std::string& str) {
    if (str == "done")    return "completed";
    if (str == "waiting") return "pending_user_input";
    return str;
}

IssueStatus parseStatus(const std::string& str) {
    const std::string name = normalizeStatusAlias(str);
    if (name == "open")               return IssueStatus::Open;
    if (name == "in_progress")        return IssueStatus::InProgress;
    if (name == "blocked")            return IssueStatus::Blocked;
    if (name == "closed")             return IssueStatus::Closed;
    if (name == "completed")          return IssueStatus::Completed;
    if (name == "pending_user_input") return IssueStatus::PendingUserInput;
    throw ValidationError("Invalid status '" + str + "'. Must be one of: open, in_progress, "
                          "blocked, closed, completed, pending_user_input");
}

bool isResolved(IssueStatus status) {
    return status == IssueStatus::Closed || status == IssueStatus::Completed;
}

// === Issue type ===

std::string issueTypeToString(IssueType type) {
    switch (type) {
        case IssueType::Bug:     return "bug";
        case IssueType::Feature: return "feature";
        case IssueType::Task:    return "task";
        case IssueType::Epic:    return "epic";
        case IssueType::Chore:   return "chore";
    }
    return "unknown";
}

IssueType parseIssueType(const std::string& str) {
    if (str == "bug")     return IssueType::Bug;
    if (str == "feature") return IssueType::Feature;
    if (str == "task")    return IssueType::Task;
    if (str == "epic")    return IssueType::Epic;
    if (str == "chore")   return IssueType::Chore;
    throw ValidationError("Invalid issue_type '" + str + "'. Must be one of: bug, feature, task, epic, chore");
}

// === Dependency type ===

std::string dependencyTypeToString(DependencyType type) {
    switch (type) {
        case DependencyType::Blocks:         return "blocks";
        case DependencyType::Related:        return "related";
        case DependencyType::ParentChild:    return "parent-child";
        case DependencyType::DiscoveredFrom: return "discovered-from";
    }
    return "unknown";
}

DependencyType parseDependencyType(const std::string& str) {
    if (str == "blocks")          return DependencyType::Blocks;
    if (str == "related")         return DependencyType::Related;
    if (str == "parent-child")    return DependencyType::ParentChild;
    if (str == "discovered-from") return DependencyType::DiscoveredFrom;
    throw ValidationError("Invalid dep_type '" + str + "'. Must be one of: blocks, related, "
                          "parent-child, discovered-from");
}

void validatePriority(int priority) {
    if (priority < kMinPriority || priority > kMaxPriority) {
        throw ValidationError("Priority must be 0-4, got " + std::to_string(priority));
    }
}

int priorityFromJson(const json& value) {
    if (!value.is_number_integer()) {
        throw ValidationError("Priority must be an integer, got " + value.dump());
    }
    bool inRange = value.is_number_unsigned()
        ? value.get<uint64_t>() <= static_cast<uint64_t>(kMaxPriority)
        : value.get<int64_t>() >= kMinPriority && value.get<int64_t>() <= kMaxPriority;
    if (!inRange) {
        throw ValidationError("Priority must be 0-4, got " + value.dump());
    }
    return value.get<int>();
}

// === IssueFilter ===

bool IssueFilter::matches(const Issue& issue) const {
    if (status && issue.status != *status) return false;
    if (priority && issue.priority != *priority) return false;
    if (issueType && issue.issueType != *issueType) return false;
    if (assignee && issue.assignee != *assignee) return false;
    return true;
}

} // namespace issues
