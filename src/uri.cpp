#include "uri.h"

#include <cctype>
#include <cstdio>

#include "base32.h"
#include "log.h"

namespace OTP {

    std::string percentEncode(const std::string& text) {
        std::string result;
        result.reserve(text.size());

        for (char c : text) {
            unsigned char byte = static_cast<unsigned char>(c);
            if (isalnum(byte) || c == '-' || c == '.' || c == '_' || c == '~' || c == '@') {
                result += c;
            } else {
                char hex[4];
                snprintf(hex, sizeof(hex), "%%%02X", byte);
                result += hex;
            }
        }

        return result;
    }

    std::string buildTotpUri(const std::string& label, const std::vector<uint8_t>& secret,
                             const std::string& issuer, const std::string& algorithm,
                             int digits, uint64_t period) {
        std::string algo = algorithm;
        if (algo != "SHA1") {
            // Most authenticator clients only implement SHA1
            Log::warn("Algorithm '" + algo + "' is not supported, using SHA1");
            algo = "SHA1";
        }

        std::string encodedIssuer = percentEncode(issuer);

        std::string uri = "otpauth://totp/";
        uri += encodedIssuer + ":" + percentEncode(label);
        uri += "?secret=" + Base32::encode(secret, false);
        uri += "&issuer=" + encodedIssuer;
        uri += "&algorithm=" + algo;
        uri += "&digit=" + std::to_string(digits);
        uri += "&period=" + std::to_string(period);

        return uri;
    }

    std::string buildTotpUri(const std::string& label, const std::vector<uint8_t>& secret,
                             const OtpConfig& config) {
        return buildTotpUri(label, secret, config.issuer, "SHA1", config.digits, config.period);
    }

}
