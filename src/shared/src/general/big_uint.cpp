#include "big_uint.hpp"
#include "big_endian.hpp"
#include <bit>
#include <cassert>

BigUint BigUint::pow2(size_t exponent)
{
    assert(exponent < BITS);
    BigUint b;
    b.fragments[exponent / 32] = uint32_t(1) << (exponent % 32);
    return b;
}

BigUint BigUint::from_be_bytes(const std::array<uint8_t, 32>& data)
{
    BigUint b;
    for (size_t i = 0; i < ELEMENTS; ++i)
        b.fragments[ELEMENTS - 1 - i] = load_be32(data.data() + 4 * i);
    return b;
}

std::array<uint8_t, 32> BigUint::to_be_bytes() const
{
    std::array<uint8_t, 32> res;
    for (size_t i = 0; i < ELEMENTS; ++i)
        store_be32(res.data() + 4 * i, fragments[ELEMENTS - 1 - i]);
    return res;
}

std::optional<BigUint> BigUint::parse_decimal(std::string_view s)
{
    if (s.empty())
        return {};
    BigUint res;
    for (char c : s) {
        if (c < '0' || c > '9')
            return {};
        if (!res.mul_add(10, uint32_t(c - '0')))
            return {};
    }
    return res;
}

bool BigUint::mul_add(uint32_t factor, uint32_t addend)
{
    uint64_t carry = addend;
    for (size_t i = 0; i < fragments.size(); i++) {
        uint64_t n = carry + uint64_t(fragments[i]) * uint64_t(factor);
        fragments[i] = n & 0xfffffffful;
        carry = n >> 32;
    }
    return carry == 0;
}

std::optional<BigUint> BigUint::parse_hex(std::string_view s)
{
    if (s.size() < 3 || s[0] != '0' || (s[1] != 'x' && s[1] != 'X'))
        return {};
    s.remove_prefix(2);
    while (s.size() > 1 && s[0] == '0')
        s.remove_prefix(1);
    if (s.size() > 64)
        return {};
    BigUint res;
    size_t nibble { 0 };
    for (auto it = s.rbegin(); it != s.rend(); ++it, ++nibble) {
        char c { *it };
        uint32_t v;
        if (c >= '0' && c <= '9')
            v = c - '0';
        else if (c >= 'a' && c <= 'f')
            v = 10 + (c - 'a');
        else if (c >= 'A' && c <= 'F')
            v = 10 + (c - 'A');
        else
            return {};
        res.fragments[nibble / 8] |= v << (4 * (nibble % 8));
    }
    return res;
}

std::string BigUint::to_string() const
{
    if (is_zero())
        return "0";
    std::string out;
    BigUint tmp { *this };
    while (!tmp.is_zero())
        out.push_back(char('0' + tmp.divmod(10)));
    return { out.rbegin(), out.rend() };
}

std::string BigUint::to_hex() const
{
    constexpr const char* h = "0123456789abcdef";
    std::string out;
    for (size_t i = ELEMENTS; i-- > 0;) {
        for (int s = 28; s >= 0; s -= 4) {
            char c { h[(fragments[i] >> s) & 15] };
            if (out.empty() && c == '0')
                continue;
            out.push_back(c);
        }
    }
    if (out.empty())
        out = "0";
    return "0x" + out;
}

BigUint& BigUint::operator+=(const BigUint& w)
{
    uint64_t carry = 0;
    for (size_t i = 0; i < fragments.size(); i++) {
        uint64_t n = carry + uint64_t(fragments[i]) + uint64_t(w.fragments[i]);
        fragments[i] = n & 0xfffffffful;
        carry = n >> 32;
    }
    assert(carry == 0);
    return *this;
}

BigUint& BigUint::operator-=(const BigUint& w)
{
    assert(*this >= w);
    uint64_t carry = 0;
    for (size_t i = 0; i < fragments.size(); i++) {
        carry += w.fragments[i];
        if (fragments[i] >= carry) {
            fragments[i] = (fragments[i] - carry) & 0xfffffffful;
            carry = 0;
        } else {
            fragments[i] = (fragments[i] - carry) & 0xfffffffful;
            carry = 1;
        }
    }
    return *this;
}

BigUint& BigUint::operator*=(uint32_t factor)
{
    uint64_t carry = 0;
    for (size_t i = 0; i < fragments.size(); i++) {
        uint64_t n = carry + uint64_t(fragments[i]) * uint64_t(factor);
        fragments[i] = n & 0xfffffffful;
        carry = n >> 32;
    }
    return *this;
}

uint32_t BigUint::divmod(uint32_t divisor)
{
    assert(divisor != 0);
    uint64_t rem = 0;
    for (size_t i = fragments.size(); i-- > 0;) {
        uint64_t cur = (rem << 32) | fragments[i];
        fragments[i] = uint32_t(cur / divisor);
        rem = cur % divisor;
    }
    return uint32_t(rem);
}

size_t BigUint::bit_length() const
{
    for (size_t i = fragments.size(); i-- > 0;) {
        if (fragments[i] != 0)
            return 32 * i + (32 - std::countl_zero(fragments[i]));
    }
    return 0;
}

std::optional<uint64_t> BigUint::to_uint64() const
{
    if (!fits_bits(64))
        return {};
    return (uint64_t(fragments[1]) << 32) | fragments[0];
}
