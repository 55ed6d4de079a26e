#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Fixed-width 256 bit unsigned integer. Decoded ciphertext integers and
// all batch amounts use this type: the widest accepted tag is 128 bits, so
// sums over any realistic batch are exact.
class BigUint {
private:
    static constexpr size_t BITS = 256;
    static constexpr size_t ELEMENTS = BITS / 32;

public:
    using fragments_type = std::array<uint32_t, ELEMENTS>; // little-endian limbs

private:
    fragments_type fragments;

public:
    constexpr BigUint()
        : fragments {}
    {
    }
    constexpr BigUint(uint64_t v)
        : fragments {}
    {
        fragments[0] = uint32_t(v);
        fragments[1] = uint32_t(v >> 32);
    }
    static BigUint max()
    {
        BigUint b;
        b.fragments.fill(0xFFFFFFFFu);
        return b;
    }
    static BigUint pow2(size_t exponent); // 2^exponent, exponent < 256
    static BigUint from_be_bytes(const std::array<uint8_t, 32>&);
    static std::optional<BigUint> parse_decimal(std::string_view);
    static std::optional<BigUint> parse_hex(std::string_view); // "0x" prefix required

    std::array<uint8_t, 32> to_be_bytes() const;
    std::string to_string() const; // decimal
    std::string to_hex() const; // "0x" prefixed, no leading zeros

    bool operator==(const BigUint&) const = default;
    std::strong_ordering operator<=>(const BigUint& rhs) const
    {
        size_t j = fragments.size();
        while (j != 0) {
            j -= 1;
            if (fragments[j] != rhs.fragments[j])
                return fragments[j] <=> rhs.fragments[j];
        }
        return std::strong_ordering::equal;
    }

    BigUint& operator+=(const BigUint&);
    BigUint& operator-=(const BigUint&); // requires *this >= rhs
    BigUint& operator*=(uint32_t factor);
    uint32_t divmod(uint32_t divisor); // divides in place, returns remainder

    friend BigUint operator+(BigUint a, const BigUint& b) { return a += b; }
    friend BigUint operator-(BigUint a, const BigUint& b) { return a -= b; }

    bool is_zero() const { return *this == BigUint(); }
    size_t bit_length() const;
    bool fits_bits(size_t n) const { return bit_length() <= n; }
    std::optional<uint64_t> to_uint64() const;

private:
    bool mul_add(uint32_t factor, uint32_t addend); // false on overflow
};
