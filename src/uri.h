#ifndef OTP_URI_H
#define OTP_URI_H

#include <cstdint>
#include <string>
#include <vector>

#include "config.h"

namespace OTP {

    // Percent-encodes everything except A-Z a-z 0-9 - . _ ~ @
    std::string percentEncode(const std::string& text);

    // Key URI understood by authenticator apps:
    //   otpauth://totp/{issuer}:{label}?secret=...&issuer=...&algorithm=SHA1&digit=...&period=...
    // Only SHA1 is supported, any other algorithm is replaced by SHA1.
    std::string buildTotpUri(const std::string& label, const std::vector<uint8_t>& secret,
                             const std::string& issuer, const std::string& algorithm = "SHA1",
                             int digits = DEFAULT_DIGITS, uint64_t period = DEFAULT_PERIOD);

    std::string buildTotpUri(const std::string& label, const std::vector<uint8_t>& secret,
                             const OtpConfig& config);

}

#endif // OTP_URI_H
