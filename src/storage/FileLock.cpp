#include "storage/FileLock.hpp"
#include "issues/Errors.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace storage {

namespace {

constexpr std::chrono::milliseconds kPollInterval{20};

} // anonymous namespace

FileLock::FileLock(const std::string& path, std::chrono::milliseconds timeout)
    : m_path(path) {
    int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw issues::StorageError("Failed to open lock file " + path + ": " + std::strerror(errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            m_fd = fd;
            return;
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            std::string reason = std::strerror(errno);
            ::close(fd);
            throw issues::StorageError("Failed to lock " + path + ": " + reason);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::close(fd);
            LOG_WARN("Timed out waiting for lock " + path);
            throw issues::LockTimeoutError("Could not acquire lock " + path + " within " +
                                           std::to_string(timeout.count()) + "ms");
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : m_path(std::move(other.m_path)), m_fd(other.m_fd) {
    other.m_fd = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        m_path = std::move(other.m_path);
        m_fd = other.m_fd;
        other.m_fd = -1;
    }
    return *this;
}

void FileLock::release() {
    if (m_fd >= 0) {
        ::flock(m_fd, LOCK_UN);
        ::close(m_fd);
        m_fd = -1;
    }
}

} // namespace storage
