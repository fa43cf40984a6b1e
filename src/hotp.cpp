#include "hotp.h"

#include <cstdio>
#include <stdexcept>

#include "hmac.h"

namespace OTP {

    bool isValidDigitCount(int digits) {
        return digits >= MIN_DIGITS && digits <= MAX_DIGITS;
    }

    int codeModulus(int digits) {
        static const int POWERS[] = { 1000000, 10000000, 100000000 };
        if (!isValidDigitCount(digits)) {
            throw std::invalid_argument("Unsupported digit count");
        }
        return POWERS[digits - MIN_DIGITS];
    }

    int dynamicTruncation(const std::vector<uint8_t>& hmacResult) {
        if (hmacResult.size() != HMAC_SHA1_SIZE) {
            throw std::invalid_argument("HMAC-SHA1 digest must be 20 bytes");
        }

        int offset = hmacResult[hmacResult.size() - 1] & 0x0F;

        int binary = ((hmacResult[offset] & 0x7F) << 24) |
                     ((hmacResult[offset + 1] & 0xFF) << 16) |
                     ((hmacResult[offset + 2] & 0xFF) << 8) |
                     (hmacResult[offset + 3] & 0xFF);

        return binary;
    }

    OtpError hotp(const std::vector<uint8_t>& secret, const Counter& counter, int digits, int& code) {
        if (!isValidDigitCount(digits)) {
            return OtpError::InvalidDigitCount;
        }

        auto counterBytes = counter.toBytes();
        std::vector<uint8_t> msg(counterBytes.begin(), counterBytes.end());

        auto hmacResult = hmacSha1(secret, msg);
        code = dynamicTruncation(hmacResult) % codeModulus(digits);

        return OtpError::None;
    }

    OtpError parseCode(const std::string& text, int digits, int& code) {
        if (!isValidDigitCount(digits) || text.size() != static_cast<size_t>(digits)) {
            return OtpError::InvalidDigitCount;
        }

        int value = 0;
        for (char c : text) {
            if (c < '0' || c > '9') {
                return OtpError::InvalidDigitCount;
            }
            value = value * 10 + (c - '0');
        }

        code = value;
        return OtpError::None;
    }

    std::string formatCode(int code, int digits) {
        if (!isValidDigitCount(digits)) {
            throw std::invalid_argument("Unsupported digit count");
        }

        char codeStr[MAX_DIGITS + 1];
        snprintf(codeStr, sizeof(codeStr), "%0*d", digits, code);

        return std::string(codeStr);
    }

}
