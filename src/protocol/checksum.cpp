#include "checksum.hpp"
#include "piot/logging.hpp"
#include <openssl/evp.h>

namespace piot {
namespace protocol {

std::optional<Checksum> calculateChecksum(ByteSpan data) {
    Checksum digest{};
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
                   EVP_md5(), nullptr) != 1) {
        LOG_CODEC(ERROR, "MD5 digest failed over %zu bytes", data.size());
        return std::nullopt;
    }
    if (digest_len != CHECKSUM_SIZE) {
        LOG_CODEC(ERROR, "MD5 digest has unexpected length %u", digest_len);
        return std::nullopt;
    }

    return digest;
}

std::string checksumToString(const Checksum& checksum) {
    // 16 bytes -> 24 base64 chars + NUL
    unsigned char text[4 * ((CHECKSUM_SIZE + 2) / 3) + 1] = {};
    int len = EVP_EncodeBlock(text, checksum.data(), static_cast<int>(checksum.size()));
    return std::string(reinterpret_cast<const char*>(text), len > 0 ? static_cast<size_t>(len) : 0);
}

} // namespace protocol
} // namespace piot
