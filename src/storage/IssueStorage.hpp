#pragma once

#include "issues/IssueEvent.hpp"
#include "issues/Types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace storage {

/**
 * JSON Lines storage for one issue directory
 *
 * Layout:
 *   issues.jsonl        full snapshot of every issue, rewritten on save
 *   dependencies.jsonl  full snapshot of every dependency, rewritten on save
 *   events.jsonl        append-only audit log
 *
 * Nothing is cached between calls. Snapshots are replaced atomically
 * (temp file, fsync, rename); mutual exclusion between writers is the
 * caller's job (see FileLock).
 *
 * Absent files load as empty. A malformed line throws issues::StorageError
 * naming the file and line; records are never silently dropped.
 */
class IssueStorage {
public:
    /**
     * Bind to a data directory, creating it if missing
     */
    explicit IssueStorage(const std::filesystem::path& dataDir);

    // === Issues ===

    std::vector<issues::Issue> loadIssues() const;
    void saveIssues(const std::vector<issues::Issue>& issues) const;

    // === Dependencies ===

    std::vector<issues::Dependency> loadDependencies() const;
    void saveDependencies(const std::vector<issues::Dependency>& deps) const;

    // === Events ===

    /**
     * Append one event as a single write to the log
     */
    void appendEvent(const issues::IssueEvent& event) const;

    /**
     * All events in append order
     */
    std::vector<issues::IssueEvent> loadEvents() const;

    // === Paths ===

    const std::filesystem::path& getDataDir() const { return m_dataDir; }
    std::filesystem::path issuesPath() const { return m_dataDir / kIssuesFile; }
    std::filesystem::path dependenciesPath() const { return m_dataDir / kDependenciesFile; }
    std::filesystem::path eventsPath() const { return m_dataDir / kEventsFile; }

    static constexpr const char* kIssuesFile = "issues.jsonl";
    static constexpr const char* kDependenciesFile = "dependencies.jsonl";
    static constexpr const char* kEventsFile = "events.jsonl";

private:
    /**
     * Parse every non-blank line of a JSONL file
     */
    std::vector<issues::json> readLines(const std::filesystem::path& path) const;

    /**
     * Replace path with the given records via temp file + rename
     */
    void writeSnapshot(const std::filesystem::path& path,
                       const std::vector<issues::json>& records) const;

    std::filesystem::path m_dataDir;
};

} // namespace storage
