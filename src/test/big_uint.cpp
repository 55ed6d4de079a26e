#include "general/big_uint.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
using namespace std;

void test_decimal()
{
    assert(BigUint::parse_decimal("0")->to_string() == "0");
    assert(BigUint::parse_decimal("1000")->to_string() == "1000");
    const char* big = "340282366920938463463374607431768211455"; // 2^128-1
    auto b { BigUint::parse_decimal(big) };
    assert(b);
    assert(b->to_string() == big);
    assert(b->fits_bits(128));
    assert(!(*b + BigUint(1)).fits_bits(128));
    assert(!BigUint::parse_decimal(""));
    assert(!BigUint::parse_decimal("12a"));
    assert(!BigUint::parse_decimal("-1"));
    // 2^256 does not fit
    assert(!BigUint::parse_decimal(
        "115792089237316195423570985008687907853269984665640564039457584007913129639936"));
    assert(BigUint::parse_decimal(
        "115792089237316195423570985008687907853269984665640564039457584007913129639935")
        == BigUint::max());
}

void test_hex()
{
    assert(BigUint::parse_hex("0x0")->is_zero());
    assert(BigUint::parse_hex("0xff") == BigUint(255));
    assert(BigUint(255).to_hex() == "0xff");
    assert(BigUint(0).to_hex() == "0x0");
    assert(!BigUint::parse_hex("ff"));
    assert(!BigUint::parse_hex("0xzz"));
}

void test_arithmetic()
{
    BigUint a { 0xFFFFFFFFull };
    a += BigUint(1);
    assert(a == BigUint(0x100000000ull));
    a -= BigUint(1);
    assert(a == BigUint(0xFFFFFFFFull));
    assert(BigUint(5) < BigUint(7));
    assert(std::min(BigUint(1000), BigUint(800)) == BigUint(800));
    assert((BigUint::pow2(128) - BigUint(1)).bit_length() == 128);
    assert(BigUint::pow2(128).bit_length() == 129);
    assert(BigUint().bit_length() == 0);
    assert(BigUint(42).to_uint64() == 42u);
    assert(!BigUint::pow2(64).to_uint64());
}

void test_bytes()
{
    auto v { BigUint::parse_decimal("123456789012345678901234567890") };
    assert(v);
    auto bytes { v->to_be_bytes() };
    assert(BigUint::from_be_bytes(bytes) == *v);
    auto one { BigUint(1).to_be_bytes() };
    assert(one[31] == 1);
    for (size_t i = 0; i < 31; ++i)
        assert(one[i] == 0);
}

int main()
{
    test_decimal();
    test_hex();
    test_arithmetic();
    test_bytes();
    cout << "big_uint tests passed" << endl;
    return 0;
}
