#ifndef OTP_HOTP_H
#define OTP_HOTP_H

#include <cstdint>
#include <string>
#include <vector>

#include "counter.h"
#include "otp_error.h"

namespace OTP {

    static constexpr int MIN_DIGITS = 6;
    static constexpr int MAX_DIGITS = 8;

    bool isValidDigitCount(int digits);

    // 10^digits for a supported digit count
    int codeModulus(int digits);

    // RFC 4226 section 5.3: picks 4 bytes of the digest at the offset given
    // by its low nibble and returns them with the sign bit cleared.
    // The digest must be exactly 20 bytes, otherwise std::invalid_argument.
    int dynamicTruncation(const std::vector<uint8_t>& hmacResult);

    // HOTP value of (secret, counter) reduced to the given number of digits.
    // Returns InvalidDigitCount without computing when digits is not 6, 7 or 8.
    OtpError hotp(const std::vector<uint8_t>& secret, const Counter& counter, int digits, int& code);

    // Reads a code typed by a user. It must be exactly digits decimal
    // characters, leading zeros included, otherwise InvalidDigitCount.
    OtpError parseCode(const std::string& text, int digits, int& code);

    // Zero-padded decimal rendering, e.g. 7081804 with 8 digits -> "07081804"
    std::string formatCode(int code, int digits);

}

#endif // OTP_HOTP_H
