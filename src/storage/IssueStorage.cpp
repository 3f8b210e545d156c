#include "storage/IssueStorage.hpp"
#include "issues/Errors.hpp"
#include "issues/IssueSerializer.hpp"
#include "util/Uuid.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <fcntl.h>
#include <unistd.h>

namespace storage {

namespace fs = std::filesystem;
using issues::IssueSerializer;
using issues::StorageError;
using issues::json;

namespace {

/**
 * Write the whole buffer, retrying on short writes and EINTR
 */
void writeAll(int fd, const std::string& data, const fs::path& path) {
    const char* ptr = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, ptr, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw StorageError("Write failed for " + path.string() + ": " + std::strerror(errno));
        }
        ptr += written;
        remaining -= static_cast<size_t>(written);
    }
}

/**
 * Flush directory entries so a completed rename survives power loss
 */
void syncDirectory(const fs::path& dir) {
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) {
        throw StorageError("Cannot open directory " + dir.string() + ": " + std::strerror(errno));
    }
    int rc = ::fsync(dfd);
    int savedErrno = errno;
    ::close(dfd);
    if (rc != 0) {
        throw StorageError("fsync failed for directory " + dir.string() + ": " + std::strerror(savedErrno));
    }
}

/**
 * Decode every record with fn, reporting the failing line on error
 */
template<typename T, typename Fn>
std::vector<T> decodeAll(const std::vector<json>& records, const fs::path& path, Fn fn) {
    std::vector<T> result;
    result.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        try {
            result.push_back(fn(records[i]));
        } catch (const std::exception& e) {
            throw StorageError("Invalid record #" + std::to_string(i + 1) + " in " +
                               path.string() + ": " + e.what());
        }
    }
    return result;
}

} // anonymous namespace

IssueStorage::IssueStorage(const fs::path& dataDir) : m_dataDir(dataDir) {
    std::error_code ec;
    fs::create_directories(m_dataDir, ec);
    if (ec) {
        throw StorageError("Cannot create data directory " + m_dataDir.string() + ": " + ec.message());
    }
}

// =============================================================================
// Low-level file access
// =============================================================================

std::vector<json> IssueStorage::readLines(const fs::path& path) const {
    std::vector<json> records;

    std::ifstream in(path);
    if (!in.is_open()) {
        if (!fs::exists(path)) {
            return records;
        }
        throw StorageError("Cannot open " + path.string());
    }

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        try {
            records.push_back(json::parse(line));
        } catch (const json::parse_error& e) {
            throw StorageError("Malformed JSON at " + path.string() + ":" +
                               std::to_string(lineNumber) + ": " + e.what());
        }
    }

    if (in.bad()) {
        throw StorageError("Read failed for " + path.string());
    }
    return records;
}

void IssueStorage::writeSnapshot(const fs::path& path, const std::vector<json>& records) const {
    std::string content;
    try {
        for (const auto& record : records) {
            content += record.dump();
            content += '\n';
        }
    } catch (const json::type_error& e) {
        throw StorageError("Cannot encode snapshot " + path.string() + ": " + e.what());
    }

    const fs::path tmpPath = path.string() + ".tmp-" + issues::util::generateUuid();

    int fd = ::open(tmpPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StorageError("Cannot create " + tmpPath.string() + ": " + std::strerror(errno));
    }

    try {
        writeAll(fd, content, tmpPath);
        if (::fsync(fd) != 0) {
            throw StorageError("fsync failed for " + tmpPath.string() + ": " + std::strerror(errno));
        }
    } catch (const StorageError&) {
        ::close(fd);
        std::error_code ec;
        fs::remove(tmpPath, ec);
        throw;
    }
    ::close(fd);

    // Atomic rename
    if (::rename(tmpPath.c_str(), path.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        std::error_code ec;
        fs::remove(tmpPath, ec);
        throw StorageError("Rename to " + path.string() + " failed: " + reason);
    }

    syncDirectory(m_dataDir);
}

// =============================================================================
// Issues
// =============================================================================

std::vector<issues::Issue> IssueStorage::loadIssues() const {
    const auto path = issuesPath();
    return decodeAll<issues::Issue>(readLines(path), path, &IssueSerializer::issueFromJson);
}

void IssueStorage::saveIssues(const std::vector<issues::Issue>& issues) const {
    std::vector<json> records;
    records.reserve(issues.size());
    for (const auto& issue : issues) {
        records.push_back(IssueSerializer::issueToJson(issue));
    }
    writeSnapshot(issuesPath(), records);
}

// =============================================================================
// Dependencies
// =============================================================================

std::vector<issues::Dependency> IssueStorage::loadDependencies() const {
    const auto path = dependenciesPath();
    return decodeAll<issues::Dependency>(readLines(path), path, &IssueSerializer::dependencyFromJson);
}

void IssueStorage::saveDependencies(const std::vector<issues::Dependency>& deps) const {
    std::vector<json> records;
    records.reserve(deps.size());
    for (const auto& dep : deps) {
        records.push_back(IssueSerializer::dependencyToJson(dep));
    }
    writeSnapshot(dependenciesPath(), records);
}

// =============================================================================
// Events
// =============================================================================

void IssueStorage::appendEvent(const issues::IssueEvent& event) const {
    const auto path = eventsPath();
    std::string line;
    try {
        line = IssueSerializer::eventToJson(event).dump() + "\n";
    } catch (const json::type_error& e) {
        throw StorageError("Cannot encode event " + event.id + ": " + e.what());
    }

    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StorageError("Cannot open " + path.string() + ": " + std::strerror(errno));
    }

    try {
        writeAll(fd, line, path);
    } catch (const StorageError&) {
        ::close(fd);
        throw;
    }
    ::close(fd);
}

std::vector<issues::IssueEvent> IssueStorage::loadEvents() const {
    const auto path = eventsPath();
    return decodeAll<issues::IssueEvent>(readLines(path), path, &IssueSerializer::eventFromJson);
}

} // namespace storage
