#include "base32.h"
#include <cctype>
#include <stdexcept>
#include <vector>

namespace Base32 {
    static const std::string BASE32_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    static const char PADDING_CHAR = '=';

    std::vector<uint8_t> decode(const std::string& encoded) {
        std::vector<uint8_t> result;
        uint32_t buffer = 0;
        int bitsLeft = 0;
        size_t paddingCount = 0;

        for (char c : encoded) {
            if (isspace(static_cast<unsigned char>(c))) continue;
            if (c == PADDING_CHAR) {
                paddingCount++;
                continue;
            }
            if (paddingCount > 0) {
                throw std::invalid_argument("Base32 data after padding");
            }

            c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
            size_t index = BASE32_CHARS.find(c);
            if (index == std::string::npos) {
                throw std::invalid_argument("Invalid Base32 character");
            }

            // Only the low bitsLeft bits are still pending, keep the buffer small
            buffer = ((buffer << 5) | static_cast<uint32_t>(index)) & 0xFFF;
            bitsLeft += 5;

            if (bitsLeft >= 8) {
                bitsLeft -= 8;
                result.push_back(static_cast<uint8_t>((buffer >> bitsLeft) & 0xFF));
            }
        }

        if (paddingCount > 6 || (paddingCount > 0 && (bitsLeft + paddingCount * 5) % 8 != 0)) {
            throw std::invalid_argument("Invalid Base32 padding");
        }

        return result;
    }

    std::string encode(const std::vector<uint8_t>& data, bool pad) {
        std::string result;
        uint32_t buffer = 0;
        int bitsLeft = 0;

        for (uint8_t byte : data) {
            buffer = ((buffer << 8) | byte) & 0xFFF;
            bitsLeft += 8;

            while (bitsLeft >= 5) {
                bitsLeft -= 5;
                result += BASE32_CHARS[(buffer >> bitsLeft) & 0x1F];
            }
        }

        // Remaining bits are left-aligned in a last character
        if (bitsLeft > 0) {
            result += BASE32_CHARS[(buffer << (5 - bitsLeft)) & 0x1F];
        }

        if (pad) {
            size_t padding = (8 - (result.size() % 8)) % 8;
            result.append(padding, PADDING_CHAR);
        }

        return result;
    }
}
