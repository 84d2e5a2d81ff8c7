#pragma once

#include "piot/types.hpp"
#include <array>
#include <optional>
#include <string>

namespace piot {
namespace protocol {

// MD5 digest carried at the end of every frame
constexpr size_t CHECKSUM_SIZE = 16;
using Checksum = std::array<uint8_t, CHECKSUM_SIZE>;

// MD5 over the given bytes. Returns nullopt only if the digest backend fails.
std::optional<Checksum> calculateChecksum(ByteSpan data);

// Base64 text of a digest (24 chars), for display
std::string checksumToString(const Checksum& checksum);

} // namespace protocol
} // namespace piot
