#pragma once

#include "issues/IssueEvent.hpp"
#include "issues/IssueIndex.hpp"
#include "issues/Types.hpp"
#include "storage/FileLock.hpp"
#include "storage/IssueStorage.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace issues {

/**
 * Engine configuration
 */
struct ManagerOptions {
    std::string actor = "system";               // Stamped on every event
    std::optional<std::string> sessionId;       // External session, stamped on every event
    std::chrono::milliseconds lockTimeout{10000};
};

/**
 * Fields of a new issue; status always starts as open
 */
struct NewIssue {
    std::string title;
    std::string description;
    int priority = 2;
    std::string issueType = "task";
    std::optional<std::string> assignee;
    std::optional<std::string> parentId;
    std::optional<std::string> discoveredFrom;
    json metadata = json::object();
};

/**
 * Partial update; only supplied fields change
 *
 * status accepts the legacy aliases "done" and "waiting".
 * metadata is merged key by key into the existing map.
 */
struct IssueUpdate {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> status;
    std::optional<int> priority;
    std::optional<std::string> assignee;
    std::optional<std::string> blockingNotes;
    std::optional<json> metadata;
};

/**
 * Which external sessions touched an issue
 */
struct IssueSessions {
    std::string issueId;
    std::vector<std::string> linkedSessions;                         // Sorted, unique
    size_t sessionCount = 0;
    std::map<std::string, std::vector<std::string>> eventsBySession;  // session -> event types in log order
    std::string hint;
};

/**
 * Public entry point of the issue engine
 *
 * Every operation is a self-contained transaction:
 *   lock -> load fresh index -> validate/mutate -> save -> unlock -> emit event
 *
 * No state is kept between calls, so any number of processes can share one
 * data directory. Validation errors are raised before the lock is taken;
 * not-found and conflict errors are raised before anything is written.
 * Events are appended after the lock is released.
 *
 * Usage:
 *   IssueManager manager("/path/to/issues", {.actor = "agent", .sessionId = "s1"});
 *   auto issue = manager.createIssue({.title = "Fix login", .priority = 1});
 *   auto ready = manager.getReadyIssues(5);
 */
class IssueManager {
public:
    explicit IssueManager(const std::filesystem::path& dataDir, ManagerOptions options = {});

    // === Issue CRUD ===

    /**
     * Create an issue
     * Throws ValidationError on empty title, bad priority or issue_type
     */
    Issue createIssue(const NewIssue& request);

    /**
     * Lookup by id, nullopt if unknown
     */
    std::optional<Issue> getIssue(const std::string& issueId);

    /**
     * Apply a partial update, recording {old, new} for each supplied field
     * Throws ValidationError, NotFoundError
     */
    Issue updateIssue(const std::string& issueId, const IssueUpdate& update);

    /**
     * Mark closed and stamp closed_at
     * Throws NotFoundError
     */
    Issue closeIssue(const std::string& issueId, const std::string& reason = "Completed");

    /**
     * Issues matching every supplied filter, in storage order
     */
    std::vector<Issue> listIssues(const IssueFilter& filter = {});

    // === Dependencies ===

    /**
     * Record that fromId is blocked by toId
     * Throws ValidationError (dep_type), NotFoundError (either issue),
     * ConflictError (cycle or existing edge)
     */
    Dependency addDependency(const std::string& fromId, const std::string& toId,
                             const std::string& depType = "blocks");

    /**
     * Throws NotFoundError if the exact edge does not exist
     */
    void removeDependency(const std::string& fromId, const std::string& toId);

    /**
     * Issues blocking issueId
     */
    std::vector<Issue> getDependencies(const std::string& issueId);

    /**
     * Issues blocked by issueId
     */
    std::vector<Issue> getDependents(const std::string& issueId);

    // === Scheduling ===

    std::vector<Issue> getReadyIssues(std::optional<size_t> limit = std::nullopt);
    std::vector<BlockedIssue> getBlockedIssues();

    // === Events and sessions ===

    /**
     * Events of one issue in log order; reads the log without the lock
     */
    std::vector<IssueEvent> getIssueEvents(const std::string& issueId) const;

    /**
     * Throws NotFoundError if the issue is unknown
     */
    IssueSessions getIssueSessions(const std::string& issueId);

    /**
     * Record that the current session ended while working on issueId
     * Never throws for an unknown issue or an unavailable store.
     */
    void emitSessionEnded(const std::string& issueId);

    // === Accessors ===

    const std::filesystem::path& getDataDir() const { return m_storage.getDataDir(); }
    const std::string& getActor() const { return m_options.actor; }
    const std::optional<std::string>& getSessionId() const { return m_options.sessionId; }
    const storage::IssueStorage& getStorage() const { return m_storage; }

    static constexpr const char* kLockFile = ".issues.lock";

private:
    storage::FileLock acquireLock() const;
    IssueIndex loadFresh() const;

    /**
     * Run fn(index) under the lock against a fresh index, no write-back
     */
    template<typename Fn>
    auto withLock(Fn&& fn) const;

    /**
     * Run fn(index) under the lock, then save the issue snapshot
     */
    template<typename Fn>
    auto mutateIssues(Fn&& fn);

    /**
     * Run fn(index) under the lock, then save the dependency snapshot
     */
    template<typename Fn>
    auto mutateDependencies(Fn&& fn);

    /**
     * Append an event; failures are logged, never propagated
     */
    void emitEvent(const std::string& issueId, const std::string& eventType, EventChange changes);

    std::vector<Issue> resolveIssues(const IssueIndex& index, const std::vector<std::string>& ids) const;

    static void requireId(const std::string& id, const char* name);

    storage::IssueStorage m_storage;
    ManagerOptions m_options;
    std::filesystem::path m_lockPath;
};

} // namespace issues
