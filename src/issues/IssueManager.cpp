#include "issues/IssueManager.hpp"
#include "issues/Algorithms.hpp"
#include "issues/Errors.hpp"
#include "issues/IssueSerializer.hpp"
#include "util/Logger.hpp"
#include "util/Uuid.hpp"
#include <algorithm>

namespace issues {

namespace {

json optionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

/**
 * Reject input the JSON Lines files cannot store (invalid UTF-8)
 */
void requireEncodable(const json& value, const char* name) {
    try {
        (void)value.dump();
    } catch (const json::type_error&) {
        throw ValidationError(std::string(name) + " is not valid UTF-8");
    }
}

} // anonymous namespace

IssueManager::IssueManager(const std::filesystem::path& dataDir, ManagerOptions options)
    : m_storage(dataDir),
      m_options(std::move(options)),
      m_lockPath(dataDir / kLockFile) {}

// =============================================================================
// Transaction plumbing
// =============================================================================

storage::FileLock IssueManager::acquireLock() const {
    return storage::FileLock(m_lockPath.string(), m_options.lockTimeout);
}

IssueIndex IssueManager::loadFresh() const {
    IssueIndex index;
    for (const auto& issue : m_storage.loadIssues()) {
        index.addIssue(issue);
    }
    for (const auto& dep : m_storage.loadDependencies()) {
        index.addDependency(dep);
    }
    return index;
}

template<typename Fn>
auto IssueManager::withLock(Fn&& fn) const {
    auto lock = acquireLock();
    IssueIndex index = loadFresh();
    return fn(index);
}

template<typename Fn>
auto IssueManager::mutateIssues(Fn&& fn) {
    auto lock = acquireLock();
    IssueIndex index = loadFresh();
    auto result = fn(index);
    m_storage.saveIssues(index.getAllIssues());
    return result;
}

template<typename Fn>
auto IssueManager::mutateDependencies(Fn&& fn) {
    auto lock = acquireLock();
    IssueIndex index = loadFresh();
    auto result = fn(index);
    m_storage.saveDependencies(index.getAllDependencies());
    return result;
}

void IssueManager::emitEvent(const std::string& issueId, const std::string& eventType, EventChange changes) {
    IssueEvent event{
        .id = util::generateUuid(),
        .issueId = issueId,
        .eventType = eventType,
        .actor = m_options.actor,
        .changes = std::move(changes),
        .timestamp = util::now(),
        .sessionId = m_options.sessionId
    };

    try {
        m_storage.appendEvent(event);
    } catch (const StorageError& e) {
        LOG_ERROR("Failed to record " + eventType + " event for issue " + issueId + ": " + e.what());
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to encode " + eventType + " event for issue " + issueId + ": " + e.what());
    }
}

std::vector<Issue> IssueManager::resolveIssues(const IssueIndex& index,
                                               const std::vector<std::string>& ids) const {
    std::vector<Issue> result;
    for (const auto& id : ids) {
        if (const Issue* issue = index.findIssue(id)) {
            result.push_back(*issue);
        }
    }
    return result;
}

void IssueManager::requireId(const std::string& id, const char* name) {
    if (id.empty()) {
        throw ValidationError(std::string(name) + " is required");
    }
}

// =============================================================================
// Issue CRUD
// =============================================================================

Issue IssueManager::createIssue(const NewIssue& request) {
    if (request.title.empty()) {
        throw ValidationError("title is required");
    }
    validatePriority(request.priority);
    const IssueType type = parseIssueType(request.issueType);
    if (!request.metadata.is_null() && !request.metadata.is_object()) {
        throw ValidationError("metadata must be a JSON object");
    }

    const auto now = util::now();
    Issue issue;
    issue.id = util::generateUuid();
    issue.title = request.title;
    issue.description = request.description;
    issue.status = IssueStatus::Open;
    issue.priority = request.priority;
    issue.issueType = type;
    issue.assignee = request.assignee;
    issue.createdAt = now;
    issue.updatedAt = now;
    issue.parentId = request.parentId;
    issue.discoveredFrom = request.discoveredFrom;
    issue.metadata = request.metadata.is_null() ? json::object() : request.metadata;
    requireEncodable(IssueSerializer::issueToJson(issue), "issue");

    Issue created = mutateIssues([&](IssueIndex& index) {
        // Never replace an existing issue on an id collision
        while (index.hasIssue(issue.id)) {
            LOG_WARN("Generated issue id " + issue.id + " already exists, retrying");
            issue.id = util::generateUuid();
        }
        index.addIssue(issue);
        return issue;
    });

    LOG_DEBUG("Created issue " + created.id + " (" + created.title + ")");
    emitEvent(created.id, event_types::kCreated, CreatedChange{created});
    return created;
}

std::optional<Issue> IssueManager::getIssue(const std::string& issueId) {
    requireId(issueId, "issue_id");
    return withLock([&](const IssueIndex& index) {
        return index.getIssue(issueId);
    });
}

Issue IssueManager::updateIssue(const std::string& issueId, const IssueUpdate& update) {
    requireId(issueId, "issue_id");

    // Validate everything before touching the store
    std::optional<IssueStatus> newStatus;
    if (update.status) {
        newStatus = parseStatus(*update.status);
    }
    if (update.priority) {
        validatePriority(*update.priority);
    }
    if (update.title && update.title->empty()) {
        throw ValidationError("title must not be empty");
    }
    if (update.metadata && !update.metadata->is_object()) {
        throw ValidationError("metadata must be a JSON object");
    }
    requireEncodable(json{
        {"title", optionalToJson(update.title)},
        {"description", optionalToJson(update.description)},
        {"assignee", optionalToJson(update.assignee)},
        {"blocking_notes", optionalToJson(update.blockingNotes)},
        {"metadata", update.metadata.value_or(json::object())}
    }, "update");

    UpdatedChange changes;
    Issue updated = mutateIssues([&](IssueIndex& index) {
        Issue* issue = index.findIssue(issueId);
        if (!issue) {
            throw NotFoundError("Issue not found: " + issueId);
        }

        if (update.title) {
            changes.fields["title"] = {issue->title, *update.title};
            issue->title = *update.title;
        }
        if (update.description) {
            changes.fields["description"] = {issue->description, *update.description};
            issue->description = *update.description;
        }
        if (newStatus) {
            changes.fields["status"] = {statusToString(issue->status), statusToString(*newStatus)};
            issue->status = *newStatus;
        }
        if (update.priority) {
            changes.fields["priority"] = {issue->priority, *update.priority};
            issue->priority = *update.priority;
        }
        if (update.assignee) {
            changes.fields["assignee"] = {optionalToJson(issue->assignee), *update.assignee};
            issue->assignee = *update.assignee;
        }
        if (update.blockingNotes) {
            changes.fields["blocking_notes"] = {optionalToJson(issue->blockingNotes), *update.blockingNotes};
            issue->blockingNotes = *update.blockingNotes;
        }
        if (update.metadata) {
            json before = issue->metadata;
            issue->metadata.update(*update.metadata);
            changes.fields["metadata"] = {before, issue->metadata};
        }

        issue->updatedAt = util::now();
        return *issue;
    });

    LOG_DEBUG("Updated issue " + issueId + " (" + std::to_string(changes.fields.size()) + " fields)");
    emitEvent(issueId, event_types::kUpdated, std::move(changes));
    return updated;
}

Issue IssueManager::closeIssue(const std::string& issueId, const std::string& reason) {
    requireId(issueId, "issue_id");
    requireEncodable(json(reason), "reason");

    Issue closed = mutateIssues([&](IssueIndex& index) {
        Issue* issue = index.findIssue(issueId);
        if (!issue) {
            throw NotFoundError("Issue not found: " + issueId);
        }

        const auto now = util::now();
        issue->status = IssueStatus::Closed;
        issue->closedAt = now;
        issue->updatedAt = now;
        return *issue;
    });

    LOG_DEBUG("Closed issue " + issueId);
    emitEvent(issueId, event_types::kClosed, ReasonChange{reason});
    return closed;
}

std::vector<Issue> IssueManager::listIssues(const IssueFilter& filter) {
    return withLock([&](const IssueIndex& index) {
        return index.listIssues(filter);
    });
}

// =============================================================================
// Dependencies
// =============================================================================

Dependency IssueManager::addDependency(const std::string& fromId, const std::string& toId,
                                       const std::string& depType) {
    requireId(fromId, "from_id");
    requireId(toId, "to_id");
    const DependencyType type = parseDependencyType(depType);
    requireEncodable(json{fromId, toId}, "dependency id");

    Dependency dep = mutateDependencies([&](IssueIndex& index) {
        if (!index.hasIssue(fromId)) {
            throw NotFoundError("Issue not found: " + fromId);
        }
        if (!index.hasIssue(toId)) {
            throw NotFoundError("Issue not found: " + toId);
        }
        if (index.hasDependency(fromId, toId)) {
            throw ConflictError("Dependency already exists: " + fromId + " -> " + toId);
        }
        if (detectCycle(index, fromId, toId)) {
            throw ConflictError("Dependency would create a cycle: " + fromId + " -> " + toId);
        }

        Dependency created{fromId, toId, type, util::now()};
        index.addDependency(created);
        return created;
    });

    LOG_DEBUG("Added dependency " + fromId + " -> " + toId + " (" + depType + ")");
    emitEvent(fromId, event_types::kDependencyAdded, DependencyChange{fromId, toId, type});
    return dep;
}

void IssueManager::removeDependency(const std::string& fromId, const std::string& toId) {
    requireId(fromId, "from_id");
    requireId(toId, "to_id");

    mutateDependencies([&](IssueIndex& index) {
        if (!index.removeDependency(fromId, toId)) {
            throw NotFoundError("Dependency not found: " + fromId + " -> " + toId);
        }
        return true;
    });

    LOG_DEBUG("Removed dependency " + fromId + " -> " + toId);
    emitEvent(fromId, event_types::kDependencyRemoved, DependencyChange{fromId, toId, std::nullopt});
}

std::vector<Issue> IssueManager::getDependencies(const std::string& issueId) {
    requireId(issueId, "issue_id");
    return withLock([&](const IssueIndex& index) {
        return resolveIssues(index, index.getBlockers(issueId));
    });
}

std::vector<Issue> IssueManager::getDependents(const std::string& issueId) {
    requireId(issueId, "issue_id");
    return withLock([&](const IssueIndex& index) {
        return resolveIssues(index, index.getDependents(issueId));
    });
}

// =============================================================================
// Scheduling
// =============================================================================

std::vector<Issue> IssueManager::getReadyIssues(std::optional<size_t> limit) {
    return withLock([&](const IssueIndex& index) {
        return issues::getReadyIssues(index, limit);
    });
}

std::vector<BlockedIssue> IssueManager::getBlockedIssues() {
    return withLock([](const IssueIndex& index) {
        return issues::getBlockedIssues(index);
    });
}

// =============================================================================
// Events and sessions
// =============================================================================

std::vector<IssueEvent> IssueManager::getIssueEvents(const std::string& issueId) const {
    std::vector<IssueEvent> result;
    for (auto& event : m_storage.loadEvents()) {
        if (event.issueId == issueId) {
            result.push_back(std::move(event));
        }
    }
    return result;
}

IssueSessions IssueManager::getIssueSessions(const std::string& issueId) {
    requireId(issueId, "issue_id");

    bool exists = withLock([&](const IssueIndex& index) {
        return index.hasIssue(issueId);
    });
    if (!exists) {
        throw NotFoundError("Issue not found: " + issueId);
    }

    IssueSessions report;
    report.issueId = issueId;
    for (const auto& event : getIssueEvents(issueId)) {
        if (event.sessionId && !event.sessionId->empty()) {
            report.eventsBySession[*event.sessionId].push_back(event.eventType);
        }
    }
    for (const auto& [sessionId, eventTypes] : report.eventsBySession) {
        report.linkedSessions.push_back(sessionId);
    }
    report.sessionCount = report.linkedSessions.size();
    report.hint = "Resume one of the linked sessions to recover its context for follow-up questions";
    return report;
}

void IssueManager::emitSessionEnded(const std::string& issueId) {
    if (issueId.empty()) {
        return;
    }

    bool exists = false;
    try {
        exists = withLock([&](const IssueIndex& index) {
            return index.hasIssue(issueId);
        });
    } catch (const IssueError& e) {
        LOG_WARN("Skipping session_ended for issue " + issueId + ": " + e.what());
        return;
    }

    if (!exists) {
        LOG_DEBUG("Ignoring session_ended for unknown issue " + issueId);
        return;
    }

    emitEvent(issueId, event_types::kSessionEnded, ReasonChange{"session terminated"});
}

} // namespace issues
