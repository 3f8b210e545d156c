#include "util/DateTimeUtil.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace issues {
namespace util {

namespace {

int parseDigits(const std::string& text, size_t pos, size_t count) {
    if (pos + count > text.size()) {
        throw std::invalid_argument("Truncated timestamp: " + text);
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Invalid timestamp: " + text);
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

void expect(const std::string& text, size_t pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        throw std::invalid_argument("Invalid timestamp: " + text);
    }
}

} // anonymous namespace

Timestamp now() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(Clock::now());
}

std::string formatTimestamp(Timestamp ts) {
    auto seconds = std::chrono::floor<std::chrono::seconds>(ts);
    auto micros = (ts - seconds).count();
    std::time_t time = Clock::to_time_t(seconds);

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(6) << micros << 'Z';
    return oss.str();
}

Timestamp parseTimestamp(const std::string& text) {
    // yyyy-mm-ddTHH:MM:SS
    std::tm tm{};
    tm.tm_year = parseDigits(text, 0, 4) - 1900;
    expect(text, 4, '-');
    tm.tm_mon = parseDigits(text, 5, 2) - 1;
    expect(text, 7, '-');
    tm.tm_mday = parseDigits(text, 8, 2);
    if (text.size() < 11 || (text[10] != 'T' && text[10] != ' ')) {
        throw std::invalid_argument("Invalid timestamp: " + text);
    }
    tm.tm_hour = parseDigits(text, 11, 2);
    expect(text, 13, ':');
    tm.tm_min = parseDigits(text, 14, 2);
    expect(text, 16, ':');
    tm.tm_sec = parseDigits(text, 17, 2);

    size_t pos = 19;

    // Optional fraction, kept to microsecond precision
    int64_t micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > 9) {
            throw std::invalid_argument("Invalid timestamp fraction: " + text);
        }
        for (size_t i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    // Optional zone
    int64_t offsetSeconds = 0;
    if (pos < text.size()) {
        if (text[pos] == 'Z' && pos + 1 == text.size()) {
            ++pos;
        } else if ((text[pos] == '+' || text[pos] == '-') && pos + 6 == text.size()) {
            int sign = text[pos] == '+' ? 1 : -1;
            int hours = parseDigits(text, pos + 1, 2);
            expect(text, pos + 3, ':');
            int minutes = parseDigits(text, pos + 4, 2);
            offsetSeconds = sign * (hours * 3600 + minutes * 60);
            pos += 6;
        } else {
            throw std::invalid_argument("Invalid timestamp zone: " + text);
        }
    }

    std::time_t epoch = timegm(&tm);
    return Timestamp(std::chrono::seconds(epoch - offsetSeconds) + std::chrono::microseconds(micros));
}

} // namespace util
} // namespace issues
