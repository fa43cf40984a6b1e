#include "counter.h"

namespace OTP {

    Counter::Counter(uint64_t value)
        : step(value) {
    }

    Counter Counter::fromBytes(const std::array<uint8_t, SIZE>& bytes) {
        uint64_t value = 0;
        for (uint8_t byte : bytes) {
            value = (value << 8) | byte;
        }
        return Counter(value);
    }

    std::array<uint8_t, Counter::SIZE> Counter::toBytes() const {
        std::array<uint8_t, SIZE> bytes{};
        uint64_t value = step;
        for (int i = static_cast<int>(SIZE) - 1; i >= 0; --i) {
            bytes[i] = static_cast<uint8_t>(value & 0xFF);
            value >>= 8;
        }
        return bytes;
    }

    Counter Counter::increment() const {
        // Unsigned arithmetic wraps at 2^64
        return Counter(step + 1);
    }

    std::string Counter::toString() const {
        return std::to_string(step);
    }

    std::string Counter::toByteString() const {
        auto bytes = toBytes();
        return std::string(bytes.begin(), bytes.end());
    }

}
