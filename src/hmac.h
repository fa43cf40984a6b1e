#ifndef OTP_HMAC_H
#define OTP_HMAC_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace OTP {

    static constexpr size_t HMAC_SHA1_SIZE = 20;

    // RFC 2104 HMAC over SHA-1. Throws std::runtime_error if OpenSSL fails.
    std::vector<uint8_t> hmacSha1(const std::vector<uint8_t>& key, const std::vector<uint8_t>& msg);

}

#endif // OTP_HMAC_H
