#pragma once

#include <stdexcept>
#include <string>

namespace issues {

/*
  Error taxonomy of the issue engine.

  Every failure the engine reports derives from IssueError so collaborators
  can catch the whole family; the tool layer maps kind() to its error payload.
*/

class IssueError : public std::runtime_error {
public:
    explicit IssueError(const std::string& msg) : std::runtime_error(msg) {}
    virtual const char* kind() const noexcept = 0;
};

/// Bad input: out-of-range priority, unknown enum value, missing identifier
class ValidationError : public IssueError {
public:
    explicit ValidationError(const std::string& msg) : IssueError(msg) {}
    const char* kind() const noexcept override { return "validation"; }
};

/// Unknown issue id or dependency edge
class NotFoundError : public IssueError {
public:
    explicit NotFoundError(const std::string& msg) : IssueError(msg) {}
    const char* kind() const noexcept override { return "not_found"; }
};

/// Mutation rejected against the current graph (cycle, duplicate edge)
class ConflictError : public IssueError {
public:
    explicit ConflictError(const std::string& msg) : IssueError(msg) {}
    const char* kind() const noexcept override { return "conflict"; }
};

/// Cross-process lock not acquired within its timeout
class LockTimeoutError : public IssueError {
public:
    explicit LockTimeoutError(const std::string& msg) : IssueError(msg) {}
    const char* kind() const noexcept override { return "lock_timeout"; }
};

/// Persisted data unreadable, corrupt or not writable
class StorageError : public IssueError {
public:
    explicit StorageError(const std::string& msg) : IssueError(msg) {}
    const char* kind() const noexcept override { return "storage"; }
};

} // namespace issues
