#include "issues/IssueIndex.hpp"

namespace issues {

// =============================================================================
// Issues
// =============================================================================

void IssueIndex::addIssue(const Issue& issue) {
    auto it = m_positions.find(issue.id);
    if (it != m_positions.end()) {
        m_issues[it->second] = issue;
        return;
    }
    m_positions[issue.id] = m_issues.size();
    m_issues.push_back(issue);
}

Issue* IssueIndex::findIssue(const std::string& id) {
    auto it = m_positions.find(id);
    return it == m_positions.end() ? nullptr : &m_issues[it->second];
}

const Issue* IssueIndex::findIssue(const std::string& id) const {
    auto it = m_positions.find(id);
    return it == m_positions.end() ? nullptr : &m_issues[it->second];
}

std::optional<Issue> IssueIndex::getIssue(const std::string& id) const {
    const Issue* issue = findIssue(id);
    if (!issue) {
        return std::nullopt;
    }
    return *issue;
}

std::vector<Issue> IssueIndex::listIssues(const IssueFilter& filter) const {
    std::vector<Issue> result;
    for (const auto& issue : m_issues) {
        if (filter.matches(issue)) {
            result.push_back(issue);
        }
    }
    return result;
}

// =============================================================================
// Dependencies
// =============================================================================

void IssueIndex::addDependency(const Dependency& dep) {
    m_dependencies[{dep.fromId, dep.toId}] = dep;
    m_blockers[dep.fromId].insert(dep.toId);
    m_dependents[dep.toId].insert(dep.fromId);
}

bool IssueIndex::removeDependency(const std::string& fromId, const std::string& toId) {
    if (m_dependencies.erase({fromId, toId}) == 0) {
        return false;
    }

    auto blockersIt = m_blockers.find(fromId);
    if (blockersIt != m_blockers.end()) {
        blockersIt->second.erase(toId);
        if (blockersIt->second.empty()) {
            m_blockers.erase(blockersIt);
        }
    }

    auto dependentsIt = m_dependents.find(toId);
    if (dependentsIt != m_dependents.end()) {
        dependentsIt->second.erase(fromId);
        if (dependentsIt->second.empty()) {
            m_dependents.erase(dependentsIt);
        }
    }
    return true;
}

bool IssueIndex::hasDependency(const std::string& fromId, const std::string& toId) const {
    return m_dependencies.count({fromId, toId}) > 0;
}

const Dependency* IssueIndex::findDependency(const std::string& fromId, const std::string& toId) const {
    auto it = m_dependencies.find({fromId, toId});
    return it == m_dependencies.end() ? nullptr : &it->second;
}

std::vector<std::string> IssueIndex::getBlockers(const std::string& id) const {
    auto it = m_blockers.find(id);
    if (it == m_blockers.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> IssueIndex::getDependents(const std::string& id) const {
    auto it = m_dependents.find(id);
    if (it == m_dependents.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<Dependency> IssueIndex::getAllDependencies() const {
    std::vector<Dependency> result;
    result.reserve(m_dependencies.size());
    for (const auto& [key, dep] : m_dependencies) {
        result.push_back(dep);
    }
    return result;
}

} // namespace issues
