#pragma once

#include "piot/types.hpp"
#include "protocol/payload.hpp"
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace piot {
namespace pipeline {

using protocol::SensorData;

// Parse one "timestamp,temperature,humidity" row.
// `line_no` is 1-based and only used in the error detail.
Result<SensorData> parseRow(std::string_view line, size_t line_no);

// Parse every row of a stream. Blank lines are skipped; the first bad row
// fails the whole read with MALFORMED_ROW.
Result<std::vector<SensorData>> parseRows(std::istream& in);

// Open and parse a row file
Result<std::vector<SensorData>> readRows(const std::string& path);

} // namespace pipeline
} // namespace piot
