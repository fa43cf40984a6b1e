#include "hmac.h"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <stdexcept>

static_assert(SHA_DIGEST_LENGTH == OTP::HMAC_SHA1_SIZE, "SHA-1 digest is 20 bytes");

namespace OTP {

    std::vector<uint8_t> hmacSha1(const std::vector<uint8_t>& key, const std::vector<uint8_t>& msg) {
        // OpenSSL rejects a null key pointer even when its length is zero
        static const unsigned char emptyKey[1] = { 0 };

        std::vector<uint8_t> result(SHA_DIGEST_LENGTH);
        unsigned int len = SHA_DIGEST_LENGTH;

        const unsigned char* out = HMAC(EVP_sha1(),
                                        key.empty() ? emptyKey : key.data(), static_cast<int>(key.size()),
                                        msg.data(), msg.size(),
                                        result.data(), &len);
        if (out == nullptr || len != SHA_DIGEST_LENGTH) {
            throw std::runtime_error("HMAC-SHA1 computation failed");
        }

        return result;
    }

}
