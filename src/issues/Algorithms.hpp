#pragma once

#include "issues/IssueIndex.hpp"
#include "issues/Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace issues {

/**
 * Would adding the edge fromId -> toId close a cycle?
 *
 * True iff toId already reaches fromId through existing edges (every
 * dependency type counts). A self-edge is a cycle.
 */
bool detectCycle(const IssueIndex& index, const std::string& fromId, const std::string& toId);

/**
 * Blocker ids of id whose issue exists and is neither closed nor completed
 */
std::vector<std::string> unresolvedBlockers(const IssueIndex& index, const std::string& id);

/**
 * Open issues with no unresolved blocker
 *
 * Ordered by priority ascending, then creation time ascending (id breaks
 * exact ties). limit only truncates the ordered result.
 */
std::vector<Issue> getReadyIssues(const IssueIndex& index,
                                  std::optional<size_t> limit = std::nullopt);

/**
 * Issues with at least one unresolved blocker, whatever their own status,
 * each paired with all of its unresolved blockers
 *
 * Ordered like getReadyIssues; blockers are ordered by id.
 */
std::vector<BlockedIssue> getBlockedIssues(const IssueIndex& index);

} // namespace issues
