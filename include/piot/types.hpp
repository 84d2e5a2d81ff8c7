#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace piot {

// Core types
using Bytes = std::vector<uint8_t>;            // Encoded frame / payload
using ByteSpan = std::span<const uint8_t>;     // Read-only view for decoding
using MutableByteSpan = std::span<uint8_t>;

// Calendar date-time, second precision ("YYYY-MM-DD HH:MM:SS")
struct Timestamp {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;

    bool operator==(const Timestamp&) const = default;
};

// Failure kinds reported by the codec, stream, engine and driver
enum class ErrorKind : uint8_t {
    NONE = 0,
    MALFORMED_PAYLOAD,      // Short payload or unparseable timestamp / signal code
    INVALID_FRAME,          // Checksum mismatch (corruption or tampering)
    TRUNCATED_STREAM,       // Trailing partial record
    SEQUENCE_OVERFLOW,      // Sequence number exceeds 32 bits
    EMPTY_TRAINING_WINDOW,  // No frames to seed the statistics from
    INVALID_ADDRESS,        // Address is not exactly 6 ASCII bytes
    MALFORMED_ROW,          // Bad input row (field count, timestamp, number)
    IO_ERROR,               // File could not be opened, read or written
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                  return "NONE";
        case ErrorKind::MALFORMED_PAYLOAD:     return "MALFORMED_PAYLOAD";
        case ErrorKind::INVALID_FRAME:         return "INVALID_FRAME";
        case ErrorKind::TRUNCATED_STREAM:      return "TRUNCATED_STREAM";
        case ErrorKind::SEQUENCE_OVERFLOW:     return "SEQUENCE_OVERFLOW";
        case ErrorKind::EMPTY_TRAINING_WINDOW: return "EMPTY_TRAINING_WINDOW";
        case ErrorKind::INVALID_ADDRESS:       return "INVALID_ADDRESS";
        case ErrorKind::MALFORMED_ROW:         return "MALFORMED_ROW";
        case ErrorKind::IO_ERROR:              return "IO_ERROR";
        default:                               return "UNKNOWN";
    }
}

// Outcome of an operation with no value
struct Status {
    ErrorKind error = ErrorKind::NONE;
    std::string detail;

    static Status ok() { return {}; }

    static Status fail(ErrorKind kind, std::string why) {
        Status s;
        s.error = kind;
        s.detail = std::move(why);
        return s;
    }

    bool isOk() const { return error == ErrorKind::NONE; }
    explicit operator bool() const { return isOk(); }
};

// Value-or-error. Exactly one of `value` / `error` is set.
template <typename T>
struct Result {
    std::optional<T> value;
    ErrorKind error = ErrorKind::NONE;
    std::string detail;

    static Result ok(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result fail(ErrorKind kind, std::string why) {
        Result r;
        r.error = kind;
        r.detail = std::move(why);
        return r;
    }

    // Forward the error of another result or status
    template <typename Other>
    static Result from(const Other& failed) {
        return fail(failed.error, failed.detail);
    }

    bool isOk() const { return value.has_value(); }
    explicit operator bool() const { return isOk(); }

    T& operator*() { return *value; }
    const T& operator*() const { return *value; }
    T* operator->() { return &*value; }
    const T* operator->() const { return &*value; }

    Status status() const {
        return isOk() ? Status::ok() : Status::fail(error, detail);
    }
};

} // namespace piot
