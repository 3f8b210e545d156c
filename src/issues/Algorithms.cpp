#include "issues/Algorithms.hpp"
#include <algorithm>
#include <queue>
#include <unordered_set>

namespace issues {

namespace {

bool schedulingOrder(const Issue& a, const Issue& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
    return a.id < b.id;
}

} // anonymous namespace

bool detectCycle(const IssueIndex& index, const std::string& fromId, const std::string& toId) {
    if (fromId == toId) {
        return true;
    }

    // Breadth-first walk along blocked-by edges starting at toId
    std::unordered_set<std::string> visited{toId};
    std::queue<std::string> pending;
    pending.push(toId);

    while (!pending.empty()) {
        std::string current = pending.front();
        pending.pop();

        for (const auto& next : index.getBlockers(current)) {
            if (next == fromId) {
                return true;
            }
            if (visited.insert(next).second) {
                pending.push(next);
            }
        }
    }
    return false;
}

std::vector<std::string> unresolvedBlockers(const IssueIndex& index, const std::string& id) {
    std::vector<std::string> result;
    for (const auto& blockerId : index.getBlockers(id)) {
        const Issue* blocker = index.findIssue(blockerId);
        if (blocker && !isResolved(blocker->status)) {
            result.push_back(blockerId);
        }
    }
    return result;
}

std::vector<Issue> getReadyIssues(const IssueIndex& index, std::optional<size_t> limit) {
    std::vector<Issue> ready;
    for (const auto& issue : index.getAllIssues()) {
        if (issue.status != IssueStatus::Open) continue;
        if (!unresolvedBlockers(index, issue.id).empty()) continue;
        ready.push_back(issue);
    }

    std::sort(ready.begin(), ready.end(), schedulingOrder);

    if (limit && ready.size() > *limit) {
        ready.resize(*limit);
    }
    return ready;
}

std::vector<BlockedIssue> getBlockedIssues(const IssueIndex& index) {
    std::vector<BlockedIssue> blocked;
    for (const auto& issue : index.getAllIssues()) {
        auto blockerIds = unresolvedBlockers(index, issue.id);
        if (blockerIds.empty()) continue;

        BlockedIssue entry{issue, {}};
        entry.blockers.reserve(blockerIds.size());
        for (const auto& blockerId : blockerIds) {
            entry.blockers.push_back(*index.findIssue(blockerId));
        }
        blocked.push_back(std::move(entry));
    }

    std::sort(blocked.begin(), blocked.end(), [](const BlockedIssue& a, const BlockedIssue& b) {
        return schedulingOrder(a.issue, b.issue);
    });
    return blocked;
}

} // namespace issues
