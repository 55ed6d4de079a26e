#pragma once

#include "general/big_endian.hpp"
#include <concepts>
#include <cstdint>
#include <span>
#include <string_view>

template <typename T>
concept Serializer = requires(T t, const std::span<const uint8_t>& s) {
    { t.write(s) };
};

template <typename S, typename T>
concept Serializing = Serializer<S> && requires(S& s, const T& t) {
    { t.serialize(s) };
};

constexpr auto&& operator<<(Serializer auto&& s, std::span<const uint8_t> sp)
{
    s.write(sp);
    return std::forward<decltype(s)>(s);
}

auto&& operator<<(Serializer auto&& s, uint64_t v)
{
    uint8_t buf[8];
    store_be64(buf, v);
    return std::forward<decltype(s)>(s << std::span<const uint8_t>(buf, 8));
}

auto&& operator<<(Serializer auto&& s, uint32_t v)
{
    uint8_t buf[4];
    store_be32(buf, v);
    return std::forward<decltype(s)>(s << std::span<const uint8_t>(buf, 4));
}

auto&& operator<<(Serializer auto&& s, uint8_t v)
{
    return std::forward<decltype(s)>(s << std::span<const uint8_t>(&v, 1));
}

auto&& operator<<(Serializer auto&& s, bool b)
{
    return std::forward<decltype(s)>(s << (b ? uint8_t(1) : uint8_t(0)));
}

// length-prefixed so that concatenated strings hash unambiguously
auto&& operator<<(Serializer auto&& s, std::string_view r)
{
    std::span sp(reinterpret_cast<const uint8_t*>(r.data()), r.size());
    return std::forward<decltype(s)>(s << uint32_t(r.size()) << sp);
}

template <typename S, typename T>
requires Serializer<S> && Serializing<S, T>
constexpr auto&& operator<<(S&& s, const T& t)
{
    t.serialize(s);
    return std::forward<S>(s);
}
