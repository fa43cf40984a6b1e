#ifndef OTP_COUNTER_H
#define OTP_COUNTER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace OTP {

    // Moving factor of the HOTP computation: an unsigned 64-bit time step
    // serialized as 8 big-endian bytes. Values are immutable, increment()
    // returns the successor modulo 2^64.
    class Counter {
    public:
        static constexpr size_t SIZE = 8;

        Counter() = default;
        explicit Counter(uint64_t value);

        static Counter fromBytes(const std::array<uint8_t, SIZE>& bytes);

        uint64_t value() const { return step; }
        std::array<uint8_t, SIZE> toBytes() const;

        Counter increment() const;

        // Decimal rendering of the counter value
        std::string toString() const;
        // The 8 raw big-endian bytes as a string
        std::string toByteString() const;

        bool operator==(const Counter& other) const { return step == other.step; }
        bool operator!=(const Counter& other) const { return step != other.step; }
        bool operator<(const Counter& other) const { return step < other.step; }
        bool operator<=(const Counter& other) const { return step <= other.step; }
        bool operator>(const Counter& other) const { return step > other.step; }
        bool operator>=(const Counter& other) const { return step >= other.step; }

    private:
        uint64_t step = 0;
    };

}

#endif // OTP_COUNTER_H
