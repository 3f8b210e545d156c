#include "util/Uuid.hpp"
#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace issues {
namespace util {

namespace {

std::mt19937_64 makeGenerator() {
    // One 32-bit draw would allow only 2^32 sequences across processes
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
}

} // anonymous namespace

std::string generateUuid() {
    static thread_local std::mt19937_64 gen = makeGenerator();

    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 8) {
        uint64_t value = gen();
        for (size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<uint8_t>(value >> (j * 8));
        }
    }

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

} // namespace util
} // namespace issues
