#include "secret.h"

#include <limits>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "log.h"

namespace OTP {

    bool OpenSslRandomSource::fill(uint8_t* buf, size_t len) {
        if (len > static_cast<size_t>(std::numeric_limits<int>::max())) {
            return false;
        }
        if (RAND_bytes(buf, static_cast<int>(len)) != 1) {
            char reason[256];
            ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
            Log::error(std::string("RAND_bytes failed: ") + reason);
            return false;
        }
        return true;
    }

    OtpError generateSecret(RandomSource& rng, std::vector<uint8_t>& secret, int nbBits) {
        if (nbBits <= 0 || nbBits % 8 != 0) {
            return OtpError::InvalidSecretLength;
        }

        std::vector<uint8_t> bytes(static_cast<size_t>(nbBits / 8));
        if (!rng.fill(bytes.data(), bytes.size())) {
            return OtpError::RandomSourceError;
        }

        secret.swap(bytes);
        Log::debug("Generated " + std::to_string(nbBits) + "-bit secret");
        return OtpError::None;
    }

}
