#include "verifier.h"

#include <stdexcept>

#include "hotp.h"
#include "log.h"
#include "totp.h"

namespace OTP {

    namespace {
        constexpr int MIN_CODE = 100000;
        constexpr int MAX_CODE = 99999999;

        VerificationResult search(const std::vector<uint8_t>& secret, Counter counter, int submitted,
                                  int digits, int threshold) {
            for (int remaining = threshold; remaining > 0; --remaining) {
                int candidate = 0;
                OtpError error = hotp(secret, counter, digits, candidate);
                if (error != OtpError::None) {
                    return VerificationResult::rejected(error);
                }

                if (candidate == submitted) {
                    int steps = threshold - remaining;
                    Log::debug("Code matched counter " + counter.toString() + " after " +
                               std::to_string(steps) + " increments");
                    return VerificationResult::synchronized(steps);
                }

                counter = counter.increment();
            }

            Log::debug("No match within " + std::to_string(threshold) + " counters");
            return VerificationResult::rejected(OtpError::InvalidThreshold);
        }
    }

    VerificationResult::VerificationResult(OtpError reason, int steps)
        : reason(reason), stepCount(steps) {
    }

    VerificationResult VerificationResult::synchronized(int steps) {
        return VerificationResult(OtpError::None, steps);
    }

    VerificationResult VerificationResult::rejected(OtpError reason) {
        if (reason == OtpError::None) {
            throw std::invalid_argument("A rejected verification needs an error");
        }
        return VerificationResult(reason, 0);
    }

    int countDigits(int value) {
        int digits = 1;
        while (value >= 10) {
            value /= 10;
            ++digits;
        }
        return digits;
    }

    VerificationResult verify(const std::vector<uint8_t>& secret, Counter counter, int submitted, int threshold) {
        if (threshold <= 0) {
            return VerificationResult::rejected(OtpError::InvalidThreshold);
        }
        if (submitted < MIN_CODE || submitted > MAX_CODE) {
            return VerificationResult::rejected(OtpError::InvalidDigitCount);
        }

        return search(secret, counter, submitted, countDigits(submitted), threshold);
    }

    VerificationResult verifyWithDigits(const std::vector<uint8_t>& secret, Counter counter, int submitted,
                                        int digits, int threshold) {
        if (threshold <= 0) {
            return VerificationResult::rejected(OtpError::InvalidThreshold);
        }
        if (!isValidDigitCount(digits) || submitted < 0 || submitted >= codeModulus(digits)) {
            return VerificationResult::rejected(OtpError::InvalidDigitCount);
        }

        return search(secret, counter, submitted, digits, threshold);
    }

    VerificationResult verifyNow(const std::vector<uint8_t>& secret, int submitted, const OtpConfig& config) {
        Counter counter;
        OtpError error = totpCounter(config, counter);
        if (error != OtpError::None) {
            return VerificationResult::rejected(error);
        }

        return verifyWithDigits(secret, counter, submitted, config.digits, config.threshold);
    }

}
