#include "timestamp.hpp"
#include <cstdio>

namespace piot {
namespace protocol {

namespace {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) return 29;
    return DAYS[month - 1];
}

// Parse `count` decimal digits starting at `pos`
bool readDigits(std::string_view text, size_t pos, size_t count, int& out) {
    int value = 0;
    for (size_t i = 0; i < count; i++) {
        char c = text[pos + i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

} // anonymous namespace

bool isValidTimestamp(const Timestamp& ts) {
    if (ts.year < 0 || ts.year > 9999) return false;
    if (ts.month < 1 || ts.month > 12) return false;
    if (ts.day < 1 || ts.day > daysInMonth(ts.year, ts.month)) return false;
    if (ts.hour < 0 || ts.hour > 23) return false;
    if (ts.minute < 0 || ts.minute > 59) return false;
    if (ts.second < 0 || ts.second > 59) return false;
    return true;
}

std::optional<Timestamp> parseTimestamp(std::string_view text) {
    if (text.size() != TIMESTAMP_LEN) {
        return std::nullopt;
    }

    // Separators: YYYY-MM-DD HH:MM:SS
    if (text[4] != '-' || text[7] != '-' || text[10] != ' ' ||
        text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    Timestamp ts;
    if (!readDigits(text, 0, 4, ts.year) ||
        !readDigits(text, 5, 2, ts.month) ||
        !readDigits(text, 8, 2, ts.day) ||
        !readDigits(text, 11, 2, ts.hour) ||
        !readDigits(text, 14, 2, ts.minute) ||
        !readDigits(text, 17, 2, ts.second)) {
        return std::nullopt;
    }

    if (!isValidTimestamp(ts)) {
        return std::nullopt;
    }

    return ts;
}

std::string formatTimestamp(const Timestamp& ts) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
             ts.year, ts.month, ts.day, ts.hour, ts.minute, ts.second);
    return buf;
}

std::string formatDate(const Timestamp& ts) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d", ts.year, ts.month, ts.day);
    return buf;
}

std::string formatTime(const Timestamp& ts) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%02d:%02d:%02d", ts.hour, ts.minute, ts.second);
    return buf;
}

} // namespace protocol
} // namespace piot
