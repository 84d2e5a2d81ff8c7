#pragma once

#include "piot/types.hpp"
#include "timestamp.hpp"
#include <optional>
#include <string>

namespace piot {
namespace protocol {

// Reading carried by a sensor frame
struct SensorData {
    Timestamp timestamp;
    double temperature = 0.0;   // °C
    double humidity = 0.0;      // %

    bool operator==(const SensorData&) const = default;
};

// Actuator command (irrigation mode)
enum class Signal : uint8_t {
    OFF  = 1,
    LOW  = 2,
    HIGH = 3,
};

const char* signalToString(Signal signal);

// Map a wire code back to a Signal. Returns nullopt for unknown codes.
std::optional<Signal> signalFromCode(uint8_t code);

// Control decision carried by a signal frame, stamped with the
// timestamp of the reading that triggered it
struct SignalData {
    Timestamp timestamp;
    Signal type = Signal::OFF;

    bool operator==(const SignalData&) const = default;
};

// Fixed-size wire codec, one specialization per payload variant.
// Only SensorData and SignalData are valid frame payloads.
template <typename Payload>
struct PayloadCodec;

// SensorData wire format (35 bytes):
// ┌─────────────────────┬─────────────┬─────────────┐
// │ TIMESTAMP (ASCII)   │ TEMPERATURE │ HUMIDITY    │
// │ 19B                 │ 8B f64 BE   │ 8B f64 BE   │
// └─────────────────────┴─────────────┴─────────────┘
template <>
struct PayloadCodec<SensorData> {
    static constexpr size_t SIZE = TIMESTAMP_LEN + 8 + 8;

    static Bytes encode(const SensorData& data);

    // Reads the first SIZE bytes; fails with MALFORMED_PAYLOAD if fewer
    // are available or the timestamp does not parse
    static Result<SensorData> decode(ByteSpan data);

    static std::string toString(const SensorData& data);
};

// SignalData wire format (20 bytes):
// ┌─────────────────────┬──────┐
// │ TIMESTAMP (ASCII)   │ CODE │
// │ 19B                 │ 1B   │
// └─────────────────────┴──────┘
template <>
struct PayloadCodec<SignalData> {
    static constexpr size_t SIZE = TIMESTAMP_LEN + 1;

    static Bytes encode(const SignalData& data);
    static Result<SignalData> decode(ByteSpan data);
    static std::string toString(const SignalData& data);
};

// Big-endian IEEE-754 helpers
void appendDoubleBE(Bytes& out, double value);
double readDoubleBE(const uint8_t* data);

} // namespace protocol
} // namespace piot
