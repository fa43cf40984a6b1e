#include "config.h"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "hotp.h"
#include "log.h"

namespace OTP {

    bool parseUnsigned(const std::string& name, const std::string& text, uint64_t& out) {
        const std::string& value = text;
        if (value.empty() || !isdigit(static_cast<unsigned char>(value[0]))) {
            Log::error(name + " is not an unsigned integer: '" + value + "'");
            return false;
        }

        try {
            size_t end = 0;
            unsigned long long parsed = std::stoull(value, &end);
            if (end != value.size()) {
                Log::error(name + " has trailing characters: '" + value + "'");
                return false;
            }
            out = parsed;
        } catch (const std::invalid_argument&) {
            Log::error(name + " is not an unsigned integer: '" + value + "'");
            return false;
        } catch (const std::out_of_range&) {
            Log::error(name + " is out of range: '" + value + "'");
            return false;
        }

        return true;
    }

    namespace {
        bool parseInt(const char* name, const char* text, int& out) {
            uint64_t value = 0;
            if (!parseUnsigned(name, text, value)) {
                return false;
            }
            if (value > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
                Log::error(std::string(name) + " is out of range: '" + text + "'");
                return false;
            }
            out = static_cast<int>(value);
            return true;
        }
    }

    OtpError validateConfig(const OtpConfig& config) {
        if (config.period == 0) {
            return OtpError::InvalidPeriod;
        }
        if (!isValidDigitCount(config.digits)) {
            return OtpError::InvalidDigitCount;
        }
        if (config.threshold <= 0) {
            return OtpError::InvalidThreshold;
        }
        if (config.secretBits <= 0 || config.secretBits % 8 != 0) {
            return OtpError::InvalidSecretLength;
        }
        return OtpError::None;
    }

    OtpError loadConfigFromEnv(OtpConfig& config) {
        OtpConfig loaded = config;
        bool ok = true;

        if (const char* value = std::getenv("OTP_PERIOD")) {
            ok = ok && parseUnsigned("OTP_PERIOD", value, loaded.period);
        }
        if (const char* value = std::getenv("OTP_T0")) {
            ok = ok && parseUnsigned("OTP_T0", value, loaded.t0);
        }
        if (const char* value = std::getenv("OTP_DRIFT")) {
            ok = ok && parseUnsigned("OTP_DRIFT", value, loaded.drift);
        }
        if (const char* value = std::getenv("OTP_DIGITS")) {
            ok = ok && parseInt("OTP_DIGITS", value, loaded.digits);
        }
        if (const char* value = std::getenv("OTP_THRESHOLD")) {
            ok = ok && parseInt("OTP_THRESHOLD", value, loaded.threshold);
        }
        if (const char* value = std::getenv("OTP_SECRET_BITS")) {
            ok = ok && parseInt("OTP_SECRET_BITS", value, loaded.secretBits);
        }
        if (const char* value = std::getenv("OTP_ISSUER")) {
            loaded.issuer = value;
        }

        if (!ok) {
            return OtpError::InvalidConfig;
        }

        OtpError error = validateConfig(loaded);
        if (error != OtpError::None) {
            Log::error("Rejected configuration: " + errorMessage(error));
            return OtpError::InvalidConfig;
        }

        config = loaded;
        Log::debug("Configuration: period=" + std::to_string(config.period) +
                   " t0=" + std::to_string(config.t0) +
                   " drift=" + std::to_string(config.drift) +
                   " digits=" + std::to_string(config.digits) +
                   " threshold=" + std::to_string(config.threshold));
        return OtpError::None;
    }

}
