#pragma once

#include <chrono>
#include <string>

namespace issues {
namespace util {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::microseconds>;

/**
 * Current wall-clock time truncated to microseconds
 */
Timestamp now();

/**
 * Format as ISO 8601 UTC with microseconds: 2026-01-02T03:04:05.123456Z
 */
std::string formatTimestamp(Timestamp ts);

/**
 * Parse an ISO 8601 timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" (or a space separator), an optional
 * fraction of 1-9 digits and an optional "Z" or "+HH:MM"/"-HH:MM" offset.
 * A missing zone is read as UTC.
 * Throws std::invalid_argument if the string is not in that form.
 */
Timestamp parseTimestamp(const std::string& text);

} // namespace util
} // namespace issues
