#ifndef OTP_VERIFIER_H
#define OTP_VERIFIER_H

#include <cstdint>
#include <vector>

#include "config.h"
#include "counter.h"
#include "otp_error.h"

namespace OTP {

    // Outcome of a verification: either the number of forward increments
    // that were needed to match the submitted code, or the rejection reason.
    class VerificationResult {
    public:
        static VerificationResult synchronized(int steps);
        // Throws std::invalid_argument for OtpError::None
        static VerificationResult rejected(OtpError reason);

        bool isSynchronized() const { return reason == OtpError::None; }
        explicit operator bool() const { return isSynchronized(); }

        // Only meaningful when synchronized
        int steps() const { return stepCount; }
        OtpError error() const { return reason; }

    private:
        VerificationResult(OtpError reason, int steps);

        OtpError reason;
        int stepCount;
    };

    // Number of decimal digits of a non-negative value
    int countDigits(int value);

    // Checks submitted against the HOTP values of counter, counter + 1, ...
    // for at most threshold counters and stops at the first match. The digit
    // count used for truncation is the decimal length of submitted, so a
    // code with leading zeros is read as a shorter one.
    // Codes outside [100000, 99999999] fail with InvalidDigitCount. Running
    // out of attempts, or a threshold below 1, fails with InvalidThreshold.
    VerificationResult verify(const std::vector<uint8_t>& secret, Counter counter, int submitted,
                              int threshold = DEFAULT_THRESHOLD);

    // Same search with the expected digit count stated by the caller, which
    // accepts codes with leading zeros.
    VerificationResult verifyWithDigits(const std::vector<uint8_t>& secret, Counter counter, int submitted,
                                        int digits, int threshold = DEFAULT_THRESHOLD);

    // Derives the counter from the system clock and config, then verifies
    // with config.digits and config.threshold.
    VerificationResult verifyNow(const std::vector<uint8_t>& secret, int submitted, const OtpConfig& config);

}

#endif // OTP_VERIFIER_H
