#ifndef OTP_SECRET_H
#define OTP_SECRET_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "config.h"
#include "otp_error.h"

namespace OTP {

    // Source of cryptographically secure bytes used to create shared secrets
    class RandomSource {
    public:
        virtual ~RandomSource() = default;

        // Fills buf with len random bytes, returns false on failure
        virtual bool fill(uint8_t* buf, size_t len) = 0;
    };

    // Backed by OpenSSL RAND_bytes
    class OpenSslRandomSource : public RandomSource {
    public:
        bool fill(uint8_t* buf, size_t len) override;
    };

    // Generates a secret of nbBits / 8 bytes. nbBits must be a positive
    // multiple of 8 (InvalidSecretLength). A failing source is reported as
    // RandomSourceError and secret is left untouched.
    OtpError generateSecret(RandomSource& rng, std::vector<uint8_t>& secret, int nbBits = DEFAULT_SECRET_BITS);

}

#endif // OTP_SECRET_H
