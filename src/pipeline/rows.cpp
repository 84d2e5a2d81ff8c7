#include "rows.hpp"
#include "piot/logging.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace piot {
namespace pipeline {

namespace {

std::string_view trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && (s[start] == ' ' || s[start] == '\t' || s[start] == '\r')) {
        start++;
    }
    size_t end = s.size();
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r')) {
        end--;
    }
    return s.substr(start, end - start);
}

// Whole-field decimal parse; rejects trailing garbage, hex floats and
// non-finite values
bool parseDouble(std::string_view field, double& out) {
    if (field.empty()) return false;
    if (field.find_first_of("xX") != std::string_view::npos) return false;

    std::string text(field);
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        return false;
    }

    out = value;
    return true;
}

Result<SensorData> badRow(size_t line_no, const std::string& why) {
    return Result<SensorData>::fail(ErrorKind::MALFORMED_ROW,
                                    "line " + std::to_string(line_no) + ": " + why);
}

} // anonymous namespace

Result<SensorData> parseRow(std::string_view line, size_t line_no) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        size_t comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }

    if (fields.size() != 3) {
        return badRow(line_no, "expected 3 fields, got " + std::to_string(fields.size()));
    }

    auto ts = protocol::parseTimestamp(fields[0]);
    if (!ts) {
        return badRow(line_no, "bad timestamp '" + std::string(fields[0]) + "'");
    }

    SensorData data;
    data.timestamp = *ts;
    if (!parseDouble(fields[1], data.temperature)) {
        return badRow(line_no, "bad temperature '" + std::string(fields[1]) + "'");
    }
    if (!parseDouble(fields[2], data.humidity)) {
        return badRow(line_no, "bad humidity '" + std::string(fields[2]) + "'");
    }

    return Result<SensorData>::ok(data);
}

Result<std::vector<SensorData>> parseRows(std::istream& in) {
    std::vector<SensorData> rows;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (trim(line).empty()) continue;

        auto row = parseRow(line, line_no);
        if (!row) {
            LOG_PIPE(ERROR, "%s", row.detail.c_str());
            return Result<std::vector<SensorData>>::from(row);
        }
        rows.push_back(*row);
    }

    if (in.bad()) {
        return Result<std::vector<SensorData>>::fail(ErrorKind::IO_ERROR,
            "read failed after line " + std::to_string(line_no));
    }

    return Result<std::vector<SensorData>>::ok(std::move(rows));
}

Result<std::vector<SensorData>> readRows(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_PIPE(ERROR, "Cannot open rows file %s", path.c_str());
        return Result<std::vector<SensorData>>::fail(ErrorKind::IO_ERROR, "cannot open " + path);
    }

    auto rows = parseRows(file);
    if (rows) {
        LOG_PIPE(DEBUG, "Read %zu rows from %s", rows->size(), path.c_str());
    }
    return rows;
}

} // namespace pipeline
} // namespace piot
