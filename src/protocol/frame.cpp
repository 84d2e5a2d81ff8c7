#include "frame.hpp"
#include <cstdio>

namespace piot {
namespace protocol {

bool isValidAddress(const std::string& address) {
    if (address.size() != ADDRESS_LEN) {
        return false;
    }
    for (char c : address) {
        if (c < 0x20 || c > 0x7E) return false;
    }
    return true;
}

void appendAddress(Bytes& out, const std::string& address) {
    for (size_t i = 0; i < ADDRESS_LEN; i++) {
        out.push_back(static_cast<uint8_t>(address[i]));
    }
}

std::string readAddress(const uint8_t* data) {
    return std::string(reinterpret_cast<const char*>(data), ADDRESS_LEN);
}

void appendU32BE(Bytes& out, uint32_t value) {
    out.push_back((value >> 24) & 0xFF);
    out.push_back((value >> 16) & 0xFF);
    out.push_back((value >> 8) & 0xFF);
    out.push_back(value & 0xFF);
}

uint32_t readU32BE(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
            static_cast<uint32_t>(data[3]);
}

namespace {

template <typename Payload>
std::string describe(const Frame<Payload>& frame) {
    char buf[256];
    snprintf(buf, sizeof(buf),
             "Frame: %llu\n"
             "  source      : %s\n"
             "  destination : %s\n"
             "  data        : %s\n"
             "  checksum    : %s\n",
             static_cast<unsigned long long>(frame.sequence),
             frame.source.c_str(),
             frame.destination.c_str(),
             PayloadCodec<Payload>::toString(frame.data).c_str(),
             checksumToString(frame.checksum).c_str());
    return buf;
}

} // anonymous namespace

std::string frameToString(const SensorFrame& frame) {
    return describe(frame);
}

std::string frameToString(const SignalFrame& frame) {
    return describe(frame);
}

} // namespace protocol
} // namespace piot
