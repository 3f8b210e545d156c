#pragma once

#include <string>

namespace issues {
namespace util {

/**
 * Random RFC 4122 version 4 UUID in canonical 8-4-4-4-12 hex form
 */
std::string generateUuid();

} // namespace util
} // namespace issues
