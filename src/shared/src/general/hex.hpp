#pragma once
#include "errors.hpp"
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

void serialize_hex(const uint8_t* data, size_t size, char* out);
std::string serialize_hex(const uint8_t* data, size_t size);

template <size_t N>
std::string serialize_hex(const std::array<uint8_t, N>& arr)
{
    return serialize_hex(arr.data(), arr.size());
}

[[nodiscard]] inline std::string serialize_hex(std::span<const uint8_t> s)
{
    return serialize_hex(s.data(), s.size());
}

// "0x" prefixed form used for ids, addresses and handles
template <size_t N>
std::string serialize_hex0x(const std::array<uint8_t, N>& arr)
{
    return "0x" + serialize_hex(arr);
}

// accepts input with or without "0x" prefix
bool parse_hex(std::string_view in, uint8_t* out, size_t out_size);

template <size_t N>
bool parse_hex(std::string_view in, std::array<uint8_t, N>& out)
{
    return parse_hex(in, out.data(), out.size());
}

template <size_t N>
std::array<uint8_t, N> hex_to_arr(std::string_view in)
{
    std::array<uint8_t, N> out;
    if (!parse_hex(in, out.data(), out.size()))
        throw Error(EINV_HEX);
    return out;
}

std::vector<uint8_t> hex_to_vec(std::string_view in);
