#pragma once
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>

// 20 byte account/token/operator address, printed in canonical
// fixed-width lowercase hex with "0x" prefix
class Address : public std::array<uint8_t, 20> {
    Address() { };

public:
    friend class PubKey;
    static constexpr size_t byte_size() { return 20; }
    static Address uninitialized() { return {}; }
    static Address zero()
    {
        Address a;
        a.fill(0);
        return a;
    }
    static std::optional<Address> parse(std::string_view);
    explicit Address(std::string_view); // throws Error(EBADADDRESS)
    Address(std::array<uint8_t, 20> arr)
        : array(arr) { };
    std::string to_string() const;
    bool operator==(const Address&) const = default;
    auto operator<=>(const Address&) const = default;
    void serialize(auto& s) const
    {
        s.write(std::span<const uint8_t>(data(), size()));
    }
};
