#ifndef OTP_TOTP_H
#define OTP_TOTP_H

#include <cstdint>
#include <string>
#include <vector>

#include "config.h"
#include "counter.h"
#include "otp_error.h"

namespace OTP {

    // Seconds since the Unix epoch from the system clock
    uint64_t currentUnixTime();

    // RFC 6238 time step, biased backward by drift steps:
    //   step = floor((now - t0) / period) - drift
    // The verifier only searches forward, so starting drift steps early
    // covers client clocks running up to drift steps behind or ahead.
    // Fails with InvalidPeriod for a zero period and with InvalidTime when
    // now < t0 or the result would go below step zero.
    OtpError totpCounter(uint64_t now, Counter& counter,
                         uint64_t period = DEFAULT_PERIOD,
                         uint64_t t0 = DEFAULT_T0,
                         uint64_t drift = DEFAULT_DRIFT);

    OtpError totpCounter(const OtpConfig& config, uint64_t now, Counter& counter);

    // Same as above with now taken from the system clock
    OtpError totpCounter(const OtpConfig& config, Counter& counter);

    // Code generator for one shared secret, the client side of TOTP
    class TOTP {
    public:
        // secret is Base32 encoded, as shown to the user
        TOTP(const std::string& secret, int digits = DEFAULT_DIGITS, uint64_t period = DEFAULT_PERIOD,
             uint64_t t0 = DEFAULT_T0);
        TOTP(const std::vector<uint8_t>& secret, int digits = DEFAULT_DIGITS, uint64_t period = DEFAULT_PERIOD,
             uint64_t t0 = DEFAULT_T0);

        std::string generateCode() const;
        std::string generateCodeAt(uint64_t now) const;

        // Seconds left before the code for now changes
        uint64_t secondsRemaining(uint64_t now) const;

    private:
        std::vector<uint8_t> secretKey;
        int digits;
        uint64_t period;
        uint64_t t0;

        void checkParameters() const;
    };

}

#endif // OTP_TOTP_H
