#ifndef OTP_CONFIG_H
#define OTP_CONFIG_H

#include <cstdint>
#include <string>

#include "otp_error.h"

namespace OTP {

    static constexpr uint64_t DEFAULT_PERIOD = 30;     // seconds per time step
    static constexpr uint64_t DEFAULT_T0 = 0;          // Unix time of step zero
    static constexpr uint64_t DEFAULT_DRIFT = 2;       // steps, 2 * 30 + 29 = 89s max skew
    static constexpr int DEFAULT_DIGITS = 6;
    static constexpr int DEFAULT_THRESHOLD = 15;       // counters tried per verification
    static constexpr int DEFAULT_SECRET_BITS = 160;

    // Parameters shared by the derivation, verification and provisioning steps
    struct OtpConfig {
        uint64_t period = DEFAULT_PERIOD;
        uint64_t t0 = DEFAULT_T0;
        uint64_t drift = DEFAULT_DRIFT;
        int digits = DEFAULT_DIGITS;
        int threshold = DEFAULT_THRESHOLD;
        int secretBits = DEFAULT_SECRET_BITS;
        std::string issuer = "otpctl";
    };

    // Decimal digits only: rejects signs, empty text and trailing characters
    // instead of wrapping or truncating. Errors are logged with name, out is
    // only written on success.
    bool parseUnsigned(const std::string& name, const std::string& text, uint64_t& out);

    OtpError validateConfig(const OtpConfig& config);

    // Overrides fields from OTP_PERIOD, OTP_T0, OTP_DRIFT, OTP_DIGITS,
    // OTP_THRESHOLD, OTP_SECRET_BITS and OTP_ISSUER. On any bad value the
    // config is left untouched and InvalidConfig is returned.
    OtpError loadConfigFromEnv(OtpConfig& config);

}

#endif // OTP_CONFIG_H
