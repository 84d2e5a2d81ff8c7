/**
 * Payload Codec Test Suite
 *
 * Timestamp text format, SensorData / SignalData wire encoding and the
 * MD5 helper.
 */

#include "protocol/payload.hpp"
#include "protocol/timestamp.hpp"
#include "protocol/checksum.hpp"
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

static Timestamp ts(int y, int mo, int d, int h, int mi, int s) {
    Timestamp t;
    t.year = y; t.month = mo; t.day = d;
    t.hour = h; t.minute = mi; t.second = s;
    return t;
}

static Bytes bytesOf(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

// ============================================================================
// Timestamp
// ============================================================================

bool test_timestamp_parse() {
    TEST("Timestamp parse/format");

    auto parsed = parseTimestamp("2023-01-31 23:59:58");
    if (!parsed) FAIL("Valid timestamp rejected");
    if (!(*parsed == ts(2023, 1, 31, 23, 59, 58))) FAIL("Fields mismatch");
    if (formatTimestamp(*parsed) != "2023-01-31 23:59:58") FAIL("Format mismatch");
    if (formatDate(*parsed) != "2023-01-31") FAIL("Date mismatch");
    if (formatTime(*parsed) != "23:59:58") FAIL("Time mismatch");

    PASS();
    return true;
}

bool test_timestamp_rejects() {
    TEST("Timestamp rejects malformed text");

    const char* bad[] = {
        "2023-01-01",             // Too short
        "2023-01-01 00:00:00 ",   // Too long
        "2023/01/01 00:00:00",    // Wrong separator
        "2023-01-01T00:00:00",    // ISO 'T'
        "2023-1-01 00:00:000",    // Not zero-padded
        "2023-13-01 00:00:00",    // Month 13
        "2023-02-29 00:00:00",    // Not a leap year
        "2023-04-31 00:00:00",    // April has 30 days
        "2023-01-01 24:00:00",    // Hour 24
        "2023-01-01 00:60:00",    // Minute 60
        "2023-01-01 00:00:60",    // Second 60
        "2023-01-0a 00:00:00",    // Non-digit
    };
    for (const char* text : bad) {
        if (parseTimestamp(text)) FAIL(std::string("Accepted '") + text + "'");
    }

    // Leap years
    if (!parseTimestamp("2024-02-29 12:00:00")) FAIL("2024-02-29 rejected");
    if (!parseTimestamp("2000-02-29 12:00:00")) FAIL("2000-02-29 rejected");
    if (parseTimestamp("1900-02-29 12:00:00")) FAIL("1900-02-29 accepted");

    PASS();
    return true;
}

// ============================================================================
// SensorData
// ============================================================================

bool test_sensor_layout() {
    TEST("SensorData wire layout (35 bytes, big-endian doubles)");

    SensorData data;
    data.timestamp = ts(2023, 1, 1, 0, 0, 0);
    data.temperature = 1.0;
    data.humidity = -2.0;

    Bytes encoded = PayloadCodec<SensorData>::encode(data);
    if (encoded.size() != 35) FAIL("Expected 35 bytes, got " << encoded.size());
    if (PayloadCodec<SensorData>::SIZE != 35) FAIL("SIZE constant");

    std::string text(encoded.begin(), encoded.begin() + 19);
    if (text != "2023-01-01 00:00:00") FAIL("Timestamp bytes: " << text);

    // 1.0 = 3FF0000000000000
    const uint8_t temp_be[8] = {0x3F, 0xF0, 0, 0, 0, 0, 0, 0};
    // -2.0 = C000000000000000
    const uint8_t humi_be[8] = {0xC0, 0x00, 0, 0, 0, 0, 0, 0};
    for (int i = 0; i < 8; i++) {
        if (encoded[19 + i] != temp_be[i]) FAIL("Temperature byte " << i);
        if (encoded[27 + i] != humi_be[i]) FAIL("Humidity byte " << i);
    }

    PASS();
    return true;
}

bool test_sensor_roundtrip() {
    TEST("SensorData roundtrip");

    const double temps[] = {0.0, -0.0, 21.5, -40.25, 1e-300, 123456.789};
    const double humis[] = {0.0, 100.0, 63.0, 0.1, 99.999, 42.0};

    for (size_t i = 0; i < 6; i++) {
        SensorData data;
        data.timestamp = ts(2023, 1, static_cast<int>(i) + 1, static_cast<int>(i) * 3, 15, 30);
        data.temperature = temps[i];
        data.humidity = humis[i];

        auto decoded = PayloadCodec<SensorData>::decode(PayloadCodec<SensorData>::encode(data));
        if (!decoded) FAIL("Decode failed: " << decoded.detail);
        if (!(*decoded == data)) FAIL("Mismatch at case " << i);
    }

    PASS();
    return true;
}

bool test_sensor_malformed() {
    TEST("SensorData decode errors");

    SensorData data;
    data.timestamp = ts(2023, 1, 1, 5, 0, 0);
    Bytes encoded = PayloadCodec<SensorData>::encode(data);

    // Short by one byte
    Bytes short_bytes(encoded.begin(), encoded.end() - 1);
    auto r1 = PayloadCodec<SensorData>::decode(short_bytes);
    if (r1) FAIL("Short payload accepted");
    if (r1.error != ErrorKind::MALFORMED_PAYLOAD) FAIL("Wrong error for short payload");

    // Empty
    auto r2 = PayloadCodec<SensorData>::decode(Bytes{});
    if (r2.error != ErrorKind::MALFORMED_PAYLOAD) FAIL("Wrong error for empty payload");

    // Garbled timestamp
    Bytes garbled = encoded;
    garbled[4] = '/';
    auto r3 = PayloadCodec<SensorData>::decode(garbled);
    if (r3) FAIL("Garbled timestamp accepted");
    if (r3.error != ErrorKind::MALFORMED_PAYLOAD) FAIL("Wrong error for garbled timestamp");

    PASS();
    return true;
}

// ============================================================================
// SignalData
// ============================================================================

bool test_signal_roundtrip() {
    TEST("SignalData roundtrip (20 bytes)");

    for (Signal s : {Signal::OFF, Signal::LOW, Signal::HIGH}) {
        SignalData data;
        data.timestamp = ts(2023, 1, 15, 13, 0, 0);
        data.type = s;

        Bytes encoded = PayloadCodec<SignalData>::encode(data);
        if (encoded.size() != 20) FAIL("Expected 20 bytes");
        if (encoded[19] != static_cast<uint8_t>(s)) FAIL("Signal code byte");

        auto decoded = PayloadCodec<SignalData>::decode(encoded);
        if (!decoded) FAIL("Decode failed: " << decoded.detail);
        if (!(*decoded == data)) FAIL("Mismatch for " << signalToString(s));
    }

    if (static_cast<int>(Signal::LOW) != 2 || static_cast<int>(Signal::HIGH) != 3) {
        FAIL("Signal codes changed");
    }

    PASS();
    return true;
}

bool test_signal_unknown_code() {
    TEST("SignalData rejects unknown code");

    SignalData data;
    data.timestamp = ts(2023, 1, 15, 13, 0, 0);
    Bytes encoded = PayloadCodec<SignalData>::encode(data);
    encoded[19] = 0x07;

    auto decoded = PayloadCodec<SignalData>::decode(encoded);
    if (decoded) FAIL("Unknown code accepted");
    if (decoded.error != ErrorKind::MALFORMED_PAYLOAD) FAIL("Wrong error kind");

    PASS();
    return true;
}

// ============================================================================
// Checksum
// ============================================================================

bool test_md5_vectors() {
    TEST("MD5 known vectors");

    auto empty = calculateChecksum(Bytes{});
    if (!empty) FAIL("Digest failed");
    if (checksumToString(*empty) != "1B2M2Y8AsgTpgAmY7PhCfg==") {
        FAIL("MD5('') = " << checksumToString(*empty));
    }

    // 900150983cd24fb0d6963f7d28e17f72
    const Checksum abc_expected = {0x90, 0x01, 0x50, 0x98, 0x3c, 0xd2, 0x4f, 0xb0,
                                   0xd6, 0x96, 0x3f, 0x7d, 0x28, 0xe1, 0x7f, 0x72};
    auto abc = calculateChecksum(bytesOf("abc"));
    if (!abc) FAIL("Digest failed");
    if (*abc != abc_expected) FAIL("MD5('abc') mismatch");

    PASS();
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== Payload Codec Test Suite ===\n\n";

    std::cout << "Timestamp Tests:\n";
    test_timestamp_parse();
    test_timestamp_rejects();

    std::cout << "\nSensorData Tests:\n";
    test_sensor_layout();
    test_sensor_roundtrip();
    test_sensor_malformed();

    std::cout << "\nSignalData Tests:\n";
    test_signal_roundtrip();
    test_signal_unknown_code();

    std::cout << "\nChecksum Tests:\n";
    test_md5_vectors();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";

    return (tests_passed == tests_run) ? 0 : 1;
}
