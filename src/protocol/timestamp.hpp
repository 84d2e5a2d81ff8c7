#pragma once

#include "piot/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace piot {
namespace protocol {

// Length of "YYYY-MM-DD HH:MM:SS"
constexpr size_t TIMESTAMP_LEN = 19;

// Parse exactly "YYYY-MM-DD HH:MM:SS" (zero-padded, calendar-valid).
// Returns nullopt on any deviation.
std::optional<Timestamp> parseTimestamp(std::string_view text);

// Check field ranges (month, day-of-month incl. leap years, h/m/s)
bool isValidTimestamp(const Timestamp& ts);

// "YYYY-MM-DD HH:MM:SS"
std::string formatTimestamp(const Timestamp& ts);

// "YYYY-MM-DD"
std::string formatDate(const Timestamp& ts);

// "HH:MM:SS"
std::string formatTime(const Timestamp& ts);

} // namespace protocol
} // namespace piot
