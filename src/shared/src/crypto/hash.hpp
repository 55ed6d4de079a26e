#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

class Hash : public std::array<uint8_t, 32> {
    Hash() = default;

public:
    static constexpr size_t byte_size() { return 32; }
    static std::optional<Hash> parse_string(std::string_view);
    static Hash uninitialized()
    {
        return {};
    }
    static Hash zero()
    {
        Hash h;
        h.fill(0);
        return h;
    }
    Hash(std::array<uint8_t, 32> other)
        : array(std::move(other))
    {
    }
    Hash(const Hash&) = default;
    Hash(Hash&&) = default;
    std::string hex_string() const; // "0x" prefixed
    Hash& operator=(const Hash&) = default;
    bool operator==(const Hash&) const = default;
    auto operator<=>(const Hash&) const = default;
    void serialize(auto& s) const
    {
        s.write(std::span<const uint8_t>(data(), size()));
    }
};

template <typename T>
class GenericHash : public Hash {
public:
    explicit GenericHash(Hash h)
        : Hash(std::move(h))
    {
    }
    explicit GenericHash(std::array<uint8_t, 32> other)
        : Hash(std::move(other))
    {
    }
    [[nodiscard]] static std::optional<T> parse_string(std::string_view s)
    {
        auto p { Hash::parse_string(s) };
        if (p)
            return T { *p };
        return {};
    }
    static T uninitialized()
    {
        return T { Hash::uninitialized() };
    }
};

// canonical digest of a settlement, the message committee members sign
class SettlementHash : public GenericHash<SettlementHash> {
public:
    using GenericHash::GenericHash;
};
