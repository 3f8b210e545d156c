#pragma once

#include <chrono>
#include <string>

namespace storage {

/**
 * Exclusive advisory lock on a file, shared by every process on the host
 *
 * Uses flock(2) on a dedicated lock file. The lock belongs to the open file
 * description, so two FileLock objects in the same process also exclude
 * each other. The kernel drops the lock when the holder exits, including on
 * a crash.
 *
 * Usage:
 *   FileLock lock(dataDir / ".issues.lock", std::chrono::seconds(10));
 *   // ... critical section ...
 *   // released by the destructor on every exit path
 */
class FileLock {
public:
    /**
     * Acquire the lock, polling until timeout elapses
     * Throws issues::LockTimeoutError on timeout, issues::StorageError if the
     * lock file cannot be opened
     */
    FileLock(const std::string& path, std::chrono::milliseconds timeout);
    ~FileLock();

    // Non-copyable
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Movable
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    /**
     * Release early; the destructor becomes a no-op
     */
    void release();

    bool isHeld() const { return m_fd >= 0; }
    const std::string& getPath() const { return m_path; }

private:
    std::string m_path;
    int m_fd = -1;
};

} // namespace storage
