#ifndef OTP_TEST_HELPERS_H
#define OTP_TEST_HELPERS_H

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

// "0b0b" -> { 0x0b, 0x0b }
inline std::vector<uint8_t> fromHex(const std::string& hex) {
    std::vector<uint8_t> bytes;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        bytes.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return bytes;
}

inline std::string toHex(const std::vector<uint8_t>& data) {
    std::ostringstream oss;
    for (uint8_t byte : data) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

inline std::vector<uint8_t> toBytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// Shared secret of the RFC 4226 and RFC 6238 test vectors
inline std::vector<uint8_t> rfcSecret() {
    return toBytes("12345678901234567890");
}

#endif // OTP_TEST_HELPERS_H
