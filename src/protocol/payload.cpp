#include "payload.hpp"
#include "piot/logging.hpp"
#include <cstdio>
#include <cstring>
#include <string_view>

namespace piot {
namespace protocol {

const char* signalToString(Signal signal) {
    switch (signal) {
        case Signal::OFF:  return "OFF";
        case Signal::LOW:  return "LOW";
        case Signal::HIGH: return "HIGH";
        default:           return "UNKNOWN";
    }
}

std::optional<Signal> signalFromCode(uint8_t code) {
    switch (code) {
        case static_cast<uint8_t>(Signal::OFF):  return Signal::OFF;
        case static_cast<uint8_t>(Signal::LOW):  return Signal::LOW;
        case static_cast<uint8_t>(Signal::HIGH): return Signal::HIGH;
        default:                                 return std::nullopt;
    }
}

void appendDoubleBE(Bytes& out, double value) {
    static_assert(sizeof(double) == 8, "IEEE-754 binary64 required");
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((bits >> shift) & 0xFF));
    }
}

double readDoubleBE(const uint8_t* data) {
    uint64_t bits = 0;
    for (int i = 0; i < 8; i++) {
        bits = (bits << 8) | data[i];
    }
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

namespace {

void appendTimestamp(Bytes& out, const Timestamp& ts) {
    std::string text = formatTimestamp(ts);
    out.insert(out.end(), text.begin(), text.end());
}

std::optional<Timestamp> readTimestamp(ByteSpan data) {
    std::string_view text(reinterpret_cast<const char*>(data.data()), TIMESTAMP_LEN);
    return parseTimestamp(text);
}

} // anonymous namespace

// === SensorData ===

Bytes PayloadCodec<SensorData>::encode(const SensorData& data) {
    Bytes result;
    result.reserve(SIZE);

    // TIMESTAMP (19 bytes)
    appendTimestamp(result, data.timestamp);

    // TEMPERATURE, HUMIDITY (8 bytes each, big-endian)
    appendDoubleBE(result, data.temperature);
    appendDoubleBE(result, data.humidity);

    return result;
}

Result<SensorData> PayloadCodec<SensorData>::decode(ByteSpan data) {
    if (data.size() < SIZE) {
        LOG_CODEC(DEBUG, "Sensor payload too short: %zu < %zu", data.size(), SIZE);
        return Result<SensorData>::fail(ErrorKind::MALFORMED_PAYLOAD,
            "sensor payload needs " + std::to_string(SIZE) + " bytes, got " +
            std::to_string(data.size()));
    }

    auto ts = readTimestamp(data);
    if (!ts) {
        return Result<SensorData>::fail(ErrorKind::MALFORMED_PAYLOAD,
            "unparseable timestamp in sensor payload");
    }

    SensorData result;
    result.timestamp = *ts;
    result.temperature = readDoubleBE(data.data() + TIMESTAMP_LEN);
    result.humidity = readDoubleBE(data.data() + TIMESTAMP_LEN + 8);
    return Result<SensorData>::ok(result);
}

std::string PayloadCodec<SensorData>::toString(const SensorData& data) {
    char buf[96];
    snprintf(buf, sizeof(buf), "%s, %.2f, %.2f",
             formatTimestamp(data.timestamp).c_str(), data.temperature, data.humidity);
    return buf;
}

// === SignalData ===

Bytes PayloadCodec<SignalData>::encode(const SignalData& data) {
    Bytes result;
    result.reserve(SIZE);
    appendTimestamp(result, data.timestamp);
    result.push_back(static_cast<uint8_t>(data.type));
    return result;
}

Result<SignalData> PayloadCodec<SignalData>::decode(ByteSpan data) {
    if (data.size() < SIZE) {
        return Result<SignalData>::fail(ErrorKind::MALFORMED_PAYLOAD,
            "signal payload needs " + std::to_string(SIZE) + " bytes, got " +
            std::to_string(data.size()));
    }

    auto ts = readTimestamp(data);
    if (!ts) {
        return Result<SignalData>::fail(ErrorKind::MALFORMED_PAYLOAD,
            "unparseable timestamp in signal payload");
    }

    auto type = signalFromCode(data[TIMESTAMP_LEN]);
    if (!type) {
        return Result<SignalData>::fail(ErrorKind::MALFORMED_PAYLOAD,
            "unknown signal code " + std::to_string(data[TIMESTAMP_LEN]));
    }

    SignalData result;
    result.timestamp = *ts;
    result.type = *type;
    return Result<SignalData>::ok(result);
}

std::string PayloadCodec<SignalData>::toString(const SignalData& data) {
    return formatTimestamp(data.timestamp) + ", " + signalToString(data.type);
}

} // namespace protocol
} // namespace piot
