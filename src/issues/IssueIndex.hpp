#pragma once

#include "issues/Types.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace issues {

/**
 * In-memory graph of issues and dependencies for one operation
 *
 * Built from storage at the start of every IssueManager call and discarded
 * at the end. Keeps issues in insertion order so a snapshot written back to
 * disk preserves the file order.
 *
 * Adjacency:
 *   blockers of X   = every toId with an edge X -> toId
 *   dependents of X = every fromId with an edge fromId -> X
 */
class IssueIndex {
public:
    IssueIndex() = default;

    // === Issues ===

    /**
     * Insert an issue, replacing any issue with the same id
     */
    void addIssue(const Issue& issue);

    /**
     * Mutable lookup for in-place updates, nullptr if absent
     */
    Issue* findIssue(const std::string& id);
    const Issue* findIssue(const std::string& id) const;

    std::optional<Issue> getIssue(const std::string& id) const;
    bool hasIssue(const std::string& id) const { return m_positions.count(id) > 0; }

    /**
     * Issues matching every supplied filter, in insertion order
     */
    std::vector<Issue> listIssues(const IssueFilter& filter = {}) const;

    const std::vector<Issue>& getAllIssues() const { return m_issues; }
    size_t issueCount() const { return m_issues.size(); }

    // === Dependencies ===

    /**
     * Insert an edge; an existing edge for the same pair is replaced
     */
    void addDependency(const Dependency& dep);

    /**
     * Returns false if the edge did not exist
     */
    bool removeDependency(const std::string& fromId, const std::string& toId);

    bool hasDependency(const std::string& fromId, const std::string& toId) const;
    const Dependency* findDependency(const std::string& fromId, const std::string& toId) const;

    /**
     * Ids of issues blocking id (sorted)
     */
    std::vector<std::string> getBlockers(const std::string& id) const;

    /**
     * Ids of issues blocked by id (sorted)
     */
    std::vector<std::string> getDependents(const std::string& id) const;

    /**
     * Every edge, ordered by (fromId, toId)
     */
    std::vector<Dependency> getAllDependencies() const;
    size_t dependencyCount() const { return m_dependencies.size(); }

private:
    using EdgeKey = std::pair<std::string, std::string>;

    std::vector<Issue> m_issues;
    std::unordered_map<std::string, size_t> m_positions;  // id -> index in m_issues

    std::map<EdgeKey, Dependency> m_dependencies;
    std::map<std::string, std::set<std::string>> m_blockers;    // from -> {to}
    std::map<std::string, std::set<std::string>> m_dependents;  // to -> {from}
};

} // namespace issues
