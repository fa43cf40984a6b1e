#include "totp.h"

#include <chrono>
#include <stdexcept>

#include "base32.h"
#include "hotp.h"
#include "log.h"

namespace OTP {

    uint64_t currentUnixTime() {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }

    OtpError totpCounter(uint64_t now, Counter& counter, uint64_t period, uint64_t t0, uint64_t drift) {
        if (period == 0) {
            return OtpError::InvalidPeriod;
        }
        if (now < t0) {
            Log::debug("Time " + std::to_string(now) + " is before t0 " + std::to_string(t0));
            return OtpError::InvalidTime;
        }

        uint64_t steps = (now - t0) / period;
        if (steps < drift) {
            Log::debug("Drift of " + std::to_string(drift) + " steps exceeds elapsed steps " +
                       std::to_string(steps));
            return OtpError::InvalidTime;
        }

        counter = Counter(steps - drift);
        return OtpError::None;
    }

    OtpError totpCounter(const OtpConfig& config, uint64_t now, Counter& counter) {
        return totpCounter(now, counter, config.period, config.t0, config.drift);
    }

    OtpError totpCounter(const OtpConfig& config, Counter& counter) {
        return totpCounter(config, currentUnixTime(), counter);
    }

    TOTP::TOTP(const std::string& secret, int digits, uint64_t period, uint64_t t0)
        : secretKey(Base32::decode(secret)), digits(digits), period(period), t0(t0) {
        checkParameters();
    }

    TOTP::TOTP(const std::vector<uint8_t>& secret, int digits, uint64_t period, uint64_t t0)
        : secretKey(secret), digits(digits), period(period), t0(t0) {
        checkParameters();
    }

    void TOTP::checkParameters() const {
        if (!isValidDigitCount(digits)) {
            throw std::invalid_argument("TOTP codes must have 6, 7 or 8 digits");
        }
        if (period == 0) {
            throw std::invalid_argument("TOTP period must be greater than zero");
        }
    }

    std::string TOTP::generateCode() const {
        return generateCodeAt(currentUnixTime());
    }

    std::string TOTP::generateCodeAt(uint64_t now) const {
        Counter counter;
        OtpError error = totpCounter(now, counter, period, t0, 0);
        if (error != OtpError::None) {
            throw std::invalid_argument(errorMessage(error));
        }

        int code = 0;
        error = hotp(secretKey, counter, digits, code);
        if (error != OtpError::None) {
            throw std::invalid_argument(errorMessage(error));
        }

        return formatCode(code, digits);
    }

    uint64_t TOTP::secondsRemaining(uint64_t now) const {
        if (now < t0) {
            return t0 - now;
        }
        return period - (now - t0) % period;
    }

}
