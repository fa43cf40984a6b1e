#ifndef OTP_BASE32_H
#define OTP_BASE32_H

#include <cstdint>
#include <string>
#include <vector>

// RFC 4648 Base32, the encoding authenticator apps use for shared secrets
namespace Base32 {
    // Case-insensitive, skips whitespace. Throws std::invalid_argument on
    // characters outside the alphabet or malformed padding.
    std::vector<uint8_t> decode(const std::string& encoded);

    // Padded with '=' to a multiple of 8 characters unless pad is false
    std::string encode(const std::vector<uint8_t>& data, bool pad = true);
}

#endif // OTP_BASE32_H
