#pragma once

#include "general/serializer.hxx"
#include <cstdint>
#include <span>
#include <vector>

// growing byte buffer, counterpart of Reader
class Writer {
public:
    Writer() { }
    Writer(size_t reserve)
    {
        bytes.reserve(reserve);
    }

    void write(const std::span<const uint8_t>& s)
    {
        bytes.insert(bytes.end(), s.begin(), s.end());
    }

    size_t size() const { return bytes.size(); }
    std::vector<uint8_t>&& move_bytes() && { return std::move(bytes); }
    operator std::vector<uint8_t>() && { return std::move(bytes); }

private:
    std::vector<uint8_t> bytes;
};
