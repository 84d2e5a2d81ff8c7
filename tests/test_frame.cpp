/**
 * Frame Codec Test Suite
 *
 * Sensor and signal frame layout, integrity check and header validation.
 */

#include "protocol/frame.hpp"
#include <iostream>
#include <string>

using namespace piot;
using namespace piot::protocol;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

static SensorData makeReading(int hour, double temperature, double humidity) {
    SensorData data;
    data.timestamp.year = 2023;
    data.timestamp.month = 1;
    data.timestamp.day = 2;
    data.timestamp.hour = hour;
    data.temperature = temperature;
    data.humidity = humidity;
    return data;
}

// ============================================================================
// Layout
// ============================================================================

bool test_frame_sizes() {
    TEST("Frame sizes");

    if (SensorFrame::HEADER_SIZE != 16) FAIL("Header size");
    if (SensorFrame::SIZE != 67) FAIL("Sensor frame size");
    if (SignalFrame::SIZE != 52) FAIL("Signal frame size");

    auto frame = SensorFrame::make(makeReading(3, 21.0, 55.0), 1);
    if (!frame) FAIL("make failed");
    auto bytes = frame->encode();
    if (!bytes) FAIL("encode failed: " << bytes.detail);
    if (bytes->size() != 67) FAIL("Encoded " << bytes->size() << " bytes");

    PASS();
    return true;
}

bool test_frame_layout() {
    TEST("Sensor frame byte layout");

    auto frame = SensorFrame::make(makeReading(7, 19.5, 48.0), 0x01020304, "013A5B", "014D8E");
    if (!frame) FAIL("make failed");
    auto bytes = frame->encode();
    if (!bytes) FAIL("encode failed");
    const Bytes& b = *bytes;

    if (std::string(b.begin(), b.begin() + 6) != "013A5B") FAIL("Source bytes");
    if (std::string(b.begin() + 6, b.begin() + 12) != "014D8E") FAIL("Destination bytes");
    if (b[12] != 0x01 || b[13] != 0x02 || b[14] != 0x03 || b[15] != 0x04) FAIL("Sequence not big-endian");

    // Payload occupies [16, 51) and matches the payload codec
    Bytes payload(b.begin() + 16, b.begin() + 51);
    if (payload != PayloadCodec<SensorData>::encode(frame->data)) FAIL("Payload bytes");

    // Checksum is MD5 over the payload only
    auto md5 = calculateChecksum(payload);
    if (!md5) FAIL("Digest failed");
    if (!std::equal(md5->begin(), md5->end(), b.begin() + 51)) FAIL("Checksum bytes");

    PASS();
    return true;
}

// ============================================================================
// Roundtrip
// ============================================================================

bool test_sensor_roundtrip() {
    TEST("Sensor frame roundtrip");

    auto frame = SensorFrame::make(makeReading(12, -3.25, 97.5), 4242, "AAAAAA", "ZZZZZZ");
    if (!frame) FAIL("make failed");
    if (!frame->hasValidChecksum()) FAIL("Fresh frame checksum invalid");

    auto bytes = frame->encode();
    if (!bytes) FAIL("encode failed");

    auto decoded = SensorFrame::decode(*bytes);
    if (!decoded) FAIL("decode failed: " << decoded.detail);
    if (!(*decoded == *frame)) FAIL("Decoded frame differs");
    if (decoded->sequence != 4242) FAIL("Sequence");
    if (decoded->source != "AAAAAA" || decoded->destination != "ZZZZZZ") FAIL("Addresses");

    PASS();
    return true;
}

bool test_signal_roundtrip() {
    TEST("Signal frame roundtrip");

    SignalData data;
    data.timestamp = makeReading(9, 0, 0).timestamp;
    data.type = Signal::HIGH;

    auto frame = SignalFrame::make(data, 17, DEFAULT_SOURCE, DEFAULT_ACTUATOR);
    if (!frame) FAIL("make failed");

    auto bytes = frame->encode();
    if (!bytes) FAIL("encode failed");
    if (bytes->size() != 52) FAIL("Encoded " << bytes->size() << " bytes");

    auto decoded = SignalFrame::decode(*bytes);
    if (!decoded) FAIL("decode failed: " << decoded.detail);
    if (!(*decoded == *frame)) FAIL("Decoded frame differs");
    if (decoded->destination != "025C8H") FAIL("Actuator address");

    PASS();
    return true;
}

bool test_max_sequence() {
    TEST("Sequence 2^32-1 roundtrip");

    auto frame = SensorFrame::make(makeReading(0, 20.0, 50.0), MAX_SEQUENCE);
    if (!frame) FAIL("make failed");
    auto bytes = frame->encode();
    if (!bytes) FAIL("encode failed");
    auto decoded = SensorFrame::decode(*bytes);
    if (!decoded) FAIL("decode failed");
    if (decoded->sequence != 0xFFFFFFFFull) FAIL("Sequence");

    PASS();
    return true;
}

// ============================================================================
// Integrity
// ============================================================================

bool test_payload_bit_flips() {
    TEST("Every payload bit flip is INVALID_FRAME");

    auto frame = SensorFrame::make(makeReading(15, 24.75, 61.0), 99);
    if (!frame) FAIL("make failed");
    auto bytes = frame->encode();
    if (!bytes) FAIL("encode failed");

    const size_t start = SensorFrame::HEADER_SIZE;
    const size_t end = start + SensorFrame::PAYLOAD_SIZE;
    for (size_t pos = start; pos < end; pos++) {
        for (int bit = 0; bit < 8; bit++) {
            Bytes corrupted = *bytes;
            corrupted[pos] ^= static_cast<uint8_t>(1u << bit);
            auto decoded = SensorFrame::decode(corrupted);
            if (decoded) FAIL("Flip at byte " << pos << " bit " << bit << " accepted");
            if (decoded.error != ErrorKind::INVALID_FRAME) {
                FAIL("Flip at byte " << pos << " bit " << bit << ": "
                     << errorKindToString(decoded.error));
            }
        }
    }

    PASS();
    return true;
}

bool test_checksum_corruption() {
    TEST("Corrupted checksum is INVALID_FRAME");

    auto frame = SensorFrame::make(makeReading(1, 10.0, 30.0), 5);
    if (!frame) FAIL("make failed");
    auto bytes = frame->encode();
    if (!bytes) FAIL("encode failed");

    Bytes corrupted = *bytes;
    corrupted.back() ^= 0x80;
    auto decoded = SensorFrame::decode(corrupted);
    if (decoded.error != ErrorKind::INVALID_FRAME) FAIL("Expected INVALID_FRAME");

    // A frame built with a stale checksum encodes, but does not verify
    SensorFrame stale = *frame;
    stale.data.temperature = 11.0;
    if (stale.hasValidChecksum()) FAIL("Stale checksum reported valid");
    auto stale_bytes = stale.encode();
    if (!stale_bytes) FAIL("encode failed");
    if (SensorFrame::decode(*stale_bytes).error != ErrorKind::INVALID_FRAME) {
        FAIL("Stale checksum decoded");
    }

    PASS();
    return true;
}

bool test_header_not_covered() {
    TEST("Header bytes are outside the checksum");

    auto frame = SensorFrame::make(makeReading(1, 10.0, 30.0), 5);
    if (!frame) FAIL("make failed");
    auto bytes = frame->encode();
    if (!bytes) FAIL("encode failed");

    Bytes changed = *bytes;
    changed[0] = 'X';       // source
    changed[15] = 0x06;     // sequence low byte
    auto decoded = SensorFrame::decode(changed);
    if (!decoded) FAIL("Header change rejected: " << decoded.detail);
    if (decoded->source != "X13A5B") FAIL("Source");
    if (decoded->sequence != 6) FAIL("Sequence");

    PASS();
    return true;
}

// ============================================================================
// Errors
// ============================================================================

bool test_short_input() {
    TEST("Short input is MALFORMED_PAYLOAD");

    auto frame = SensorFrame::make(makeReading(2, 20.0, 40.0), 1);
    if (!frame) FAIL("make failed");
    auto bytes = frame->encode();
    if (!bytes) FAIL("encode failed");

    Bytes short_bytes(bytes->begin(), bytes->end() - 1);
    if (SensorFrame::decode(short_bytes).error != ErrorKind::MALFORMED_PAYLOAD) FAIL("66 bytes");
    if (SensorFrame::decode(Bytes{}).error != ErrorKind::MALFORMED_PAYLOAD) FAIL("0 bytes");

    // Trailing bytes are not silently dropped
    Bytes long_bytes = *bytes;
    long_bytes.push_back(0x00);
    if (SensorFrame::decode(long_bytes).error != ErrorKind::MALFORMED_PAYLOAD) FAIL("68 bytes");

    PASS();
    return true;
}

bool test_invalid_timestamp() {
    TEST("Impossible timestamps do not encode");

    // Right width on the wire, but not a calendar date-time
    SensorData data = makeReading(0, 20.0, 40.0);
    data.timestamp.month = 2;
    data.timestamp.day = 30;
    data.timestamp.hour = 25;
    data.timestamp.minute = 61;
    data.timestamp.second = 99;

    auto made = SensorFrame::make(data, 1);
    if (made) FAIL("make accepted 2023-02-30 25:61:99");
    if (made.error != ErrorKind::MALFORMED_PAYLOAD) FAIL("make: " << errorKindToString(made.error));

    // A frame assembled by hand is caught by encode
    auto frame = SensorFrame::make(makeReading(0, 20.0, 40.0), 1);
    if (!frame) FAIL("make failed");
    frame->data.timestamp.day = 32;
    auto bytes = frame->encode();
    if (bytes) FAIL("encode accepted day 32");
    if (bytes.error != ErrorKind::MALFORMED_PAYLOAD) FAIL("encode: " << errorKindToString(bytes.error));

    SignalData signal;
    signal.timestamp.month = 13;
    if (SignalFrame::make(signal, 1).error != ErrorKind::MALFORMED_PAYLOAD) FAIL("Signal month 13");

    PASS();
    return true;
}

bool test_sequence_overflow() {
    TEST("Sequence above 32 bits is SEQUENCE_OVERFLOW");

    auto frame = SensorFrame::make(makeReading(2, 20.0, 40.0), MAX_SEQUENCE + 1);
    if (!frame) FAIL("make failed");
    auto bytes = frame->encode();
    if (bytes) FAIL("Overflowing sequence encoded");
    if (bytes.error != ErrorKind::SEQUENCE_OVERFLOW) FAIL("Wrong error kind");

    PASS();
    return true;
}

bool test_invalid_address() {
    TEST("Bad addresses are INVALID_ADDRESS");

    if (!isValidAddress("013A5B")) FAIL("Valid address rejected");
    if (isValidAddress("013A5")) FAIL("5 chars accepted");
    if (isValidAddress("013A5B7")) FAIL("7 chars accepted");
    if (isValidAddress(std::string("01\x01" "A5B"))) FAIL("Control char accepted");

    auto frame = SensorFrame::make(makeReading(2, 20.0, 40.0), 1, "SHORT", DEFAULT_DESTINATION);
    if (!frame) FAIL("make failed");
    if (frame->encode().error != ErrorKind::INVALID_ADDRESS) FAIL("Bad source encoded");

    frame->source = DEFAULT_SOURCE;
    frame->destination = "TOO-LONG";
    if (frame->encode().error != ErrorKind::INVALID_ADDRESS) FAIL("Bad destination encoded");

    PASS();
    return true;
}

bool test_frame_to_string() {
    TEST("frameToString");

    auto frame = SensorFrame::make(makeReading(4, 21.5, 60.25), 12);
    if (!frame) FAIL("make failed");

    std::string text = frameToString(*frame);
    if (text.find("Frame: 12") == std::string::npos) FAIL("Missing sequence: " << text);
    if (text.find("013A5B") == std::string::npos) FAIL("Missing source");
    if (text.find("2023-01-02 04:00:00, 21.50, 60.25") == std::string::npos) FAIL("Missing payload: " << text);
    if (text.find(checksumToString(frame->checksum)) == std::string::npos) FAIL("Missing checksum");

    PASS();
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== Frame Codec Test Suite ===\n\n";

    std::cout << "Layout Tests:\n";
    test_frame_sizes();
    test_frame_layout();

    std::cout << "\nRoundtrip Tests:\n";
    test_sensor_roundtrip();
    test_signal_roundtrip();
    test_max_sequence();

    std::cout << "\nIntegrity Tests:\n";
    test_payload_bit_flips();
    test_checksum_corruption();
    test_header_not_covered();

    std::cout << "\nError Tests:\n";
    test_short_input();
    test_invalid_timestamp();
    test_sequence_overflow();
    test_invalid_address();
    test_frame_to_string();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
