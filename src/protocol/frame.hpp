#pragma once

#include "piot/types.hpp"
#include "checksum.hpp"
#include "payload.hpp"
#include <algorithm>
#include <cstdint>
#include <string>
#include <type_traits>

namespace piot {
namespace protocol {

// Station addresses are fixed 6-byte ASCII strings
constexpr size_t ADDRESS_LEN = 6;

// Default addressing: sensor -> network layer -> actuator
inline constexpr const char* DEFAULT_SOURCE = "013A5B";
inline constexpr const char* DEFAULT_DESTINATION = "014D8E";
inline constexpr const char* DEFAULT_ACTUATOR = "025C8H";

// Largest sequence number that fits the 4-byte field
constexpr uint64_t MAX_SEQUENCE = 0xFFFFFFFFull;

// True if `address` is exactly ADDRESS_LEN printable ASCII characters
bool isValidAddress(const std::string& address);

// Header helpers shared by every frame variant
void appendAddress(Bytes& out, const std::string& address);
std::string readAddress(const uint8_t* data);
void appendU32BE(Bytes& out, uint32_t value);
uint32_t readU32BE(const uint8_t* data);

// Protocol frame, parametrized on the payload variant
//
// Wire format (big-endian):
// ┌──────────┬──────────┬─────┬─────────────┬──────────┐
// │ SRC_ADDR │ DST_ADDR │ SEQ │ PAYLOAD     │ CHECKSUM │
// │    6B    │    6B    │ 4B  │ Codec::SIZE │ 16B MD5  │
// └──────────┴──────────┴─────┴─────────────┴──────────┘
//
// The checksum covers the encoded payload only, never the header.
// Sensor frame: 67 bytes. Signal frame: 52 bytes.
//
template <typename Payload>
struct Frame {
    static_assert(std::is_same_v<Payload, SensorData> || std::is_same_v<Payload, SignalData>,
                  "Frame payload must be SensorData or SignalData");

    using Codec = PayloadCodec<Payload>;

    // Header size (before payload)
    static constexpr size_t HEADER_SIZE = ADDRESS_LEN + ADDRESS_LEN + 4;

    // Payload size for this variant
    static constexpr size_t PAYLOAD_SIZE = Codec::SIZE;

    // Total on-wire size
    static constexpr size_t SIZE = HEADER_SIZE + PAYLOAD_SIZE + CHECKSUM_SIZE;

    // Frame fields
    std::string source = DEFAULT_SOURCE;
    std::string destination = DEFAULT_DESTINATION;
    uint64_t sequence = 0;      // 1-based; must fit in 32 bits to encode
    Payload data{};
    Checksum checksum{};

    bool operator==(const Frame&) const = default;

    // Build a frame and compute its checksum from the payload
    static Result<Frame> make(const Payload& data, uint64_t sequence,
                              const std::string& source = DEFAULT_SOURCE,
                              const std::string& destination = DEFAULT_DESTINATION) {
        if (!isValidTimestamp(data.timestamp)) {
            return Result<Frame>::fail(ErrorKind::MALFORMED_PAYLOAD,
                "timestamp " + formatTimestamp(data.timestamp) + " is not a calendar date-time");
        }

        auto checksum = calculateChecksum(Codec::encode(data));
        if (!checksum) {
            return Result<Frame>::fail(ErrorKind::INVALID_FRAME, "checksum unavailable");
        }

        Frame f;
        f.source = source;
        f.destination = destination;
        f.sequence = sequence;
        f.data = data;
        f.checksum = *checksum;
        return Result<Frame>::ok(f);
    }

    // Serialize frame to bytes (writes the stored checksum)
    Result<Bytes> encode() const {
        if (!isValidAddress(source)) {
            return Result<Bytes>::fail(ErrorKind::INVALID_ADDRESS,
                "source address '" + source + "' is not 6 ASCII bytes");
        }
        if (!isValidAddress(destination)) {
            return Result<Bytes>::fail(ErrorKind::INVALID_ADDRESS,
                "destination address '" + destination + "' is not 6 ASCII bytes");
        }
        if (sequence > MAX_SEQUENCE) {
            return Result<Bytes>::fail(ErrorKind::SEQUENCE_OVERFLOW,
                "sequence number " + std::to_string(sequence) + " exceeds 32 bits");
        }
        if (!isValidTimestamp(data.timestamp)) {
            return Result<Bytes>::fail(ErrorKind::MALFORMED_PAYLOAD,
                "timestamp " + formatTimestamp(data.timestamp) + " is not a calendar date-time");
        }

        Bytes payload = Codec::encode(data);
        if (payload.size() != PAYLOAD_SIZE) {
            return Result<Bytes>::fail(ErrorKind::MALFORMED_PAYLOAD,
                "payload encodes to " + std::to_string(payload.size()) + " bytes");
        }

        Bytes result;
        result.reserve(SIZE);

        // SRC_ADDR, DST_ADDR (6 bytes each)
        appendAddress(result, source);
        appendAddress(result, destination);

        // SEQ (4 bytes, big-endian)
        appendU32BE(result, static_cast<uint32_t>(sequence));

        // PAYLOAD
        result.insert(result.end(), payload.begin(), payload.end());

        // CHECKSUM (16 bytes)
        result.insert(result.end(), checksum.begin(), checksum.end());

        return Result<Bytes>::ok(std::move(result));
    }

    // Deserialize exactly one frame's worth of bytes.
    // Fails with MALFORMED_PAYLOAD if the length is wrong or the payload
    // does not decode, and INVALID_FRAME if the trailing checksum does not
    // match the payload.
    static Result<Frame> decode(ByteSpan bytes) {
        if (bytes.size() != SIZE) {
            return Result<Frame>::fail(ErrorKind::MALFORMED_PAYLOAD,
                "frame is " + std::to_string(SIZE) + " bytes, got " +
                std::to_string(bytes.size()));
        }

        size_t pos = 0;

        Frame frame;
        frame.source = readAddress(bytes.data() + pos);
        pos += ADDRESS_LEN;
        frame.destination = readAddress(bytes.data() + pos);
        pos += ADDRESS_LEN;
        frame.sequence = readU32BE(bytes.data() + pos);
        pos += 4;

        ByteSpan payload_bytes = bytes.subspan(pos, PAYLOAD_SIZE);
        pos += PAYLOAD_SIZE;

        std::copy(bytes.begin() + pos, bytes.begin() + pos + CHECKSUM_SIZE,
                  frame.checksum.begin());

        // A decodable payload re-encodes to exactly its wire bytes.
        // Verify before decoding so a corrupted timestamp is INVALID_FRAME.
        auto expected = calculateChecksum(payload_bytes);
        if (!expected || *expected != frame.checksum) {
            return Result<Frame>::fail(ErrorKind::INVALID_FRAME,
                "checksum mismatch in frame " + std::to_string(frame.sequence));
        }

        auto payload = Codec::decode(payload_bytes);
        if (!payload) {
            return Result<Frame>::from(payload);
        }
        frame.data = *payload;

        return Result<Frame>::ok(std::move(frame));
    }

    // True if the stored checksum matches the payload
    bool hasValidChecksum() const {
        auto expected = calculateChecksum(Codec::encode(data));
        return expected && *expected == checksum;
    }
};

using SensorFrame = Frame<SensorData>;
using SignalFrame = Frame<SignalData>;

static_assert(SensorFrame::SIZE == 67, "sensor frame must be 67 bytes");
static_assert(SignalFrame::SIZE == 52, "signal frame must be 52 bytes");

// Debug output
std::string frameToString(const SensorFrame& frame);
std::string frameToString(const SignalFrame& frame);

} // namespace protocol
} // namespace piot
