#pragma once

#include "batch/ids.hpp"
#include "crypto/address.hpp"
#include "crypto/hash.hpp"
#include "SQLiteCpp/Column.h"
#include <cstring>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace sqlite {
class ColumnConverter {
    SQLite::Column c;

public:
    template <size_t size>
    std::array<uint8_t, size> get_array() const
    {
        std::array<uint8_t, size> res;
        if (size_t(c.getBytes()) != size)
            throw std::runtime_error(
                "Database corrupted, cannot load " + std::to_string(size) + " bytes");
        memcpy(res.data(), c.getBlob(), size);
        return res;
    }

    std::vector<uint8_t> get_vector() const
    {
        std::vector<uint8_t> res(c.getBytes());
        if (!res.empty())
            memcpy(res.data(), c.getBlob(), res.size());
        return res;
    }

    int64_t getInt64() const noexcept { return c.getInt64(); }
    uint64_t getUInt64() const
    {
        auto i { getInt64() };
        if (i < 0) {
            throw std::runtime_error("Database might be corrupted. Expected non-negative value.");
        }
        return i;
    }

    uint32_t getUInt32() const
    {
        auto i { getUInt64() };
        if (i > std::numeric_limits<uint32_t>::max())
            throw std::runtime_error("Database might be corrupted. Value overflows uint32_t.");
        return i;
    }
    ColumnConverter(SQLite::Column c)
        : c(std::move(c))
    {
    }
    bool is_null() const { return c.isNull(); }

    operator Hash() const { return { get_array<32>() }; }
    operator IntentId() const { return IntentId { get_array<32>() }; }
    operator BatchId() const { return BatchId { get_array<32>() }; }
    operator PoolId() const { return PoolId { get_array<32>() }; }
    operator SettlementHash() const { return SettlementHash { get_array<32>() }; }
    operator Address() const { return get_array<20>(); }
    operator std::vector<uint8_t>() const { return get_vector(); }
    operator std::string() const { return c.getString(); }
    operator int64_t() const { return getInt64(); }
    operator uint64_t() const { return getUInt64(); }
    operator uint32_t() const { return getUInt32(); }
    operator bool() const { return getInt64() != 0; }
};

namespace bind_convert {
    template <size_t N>
    inline auto convert(const std::array<uint8_t, N>& v) { return std::span<const uint8_t>(v); }
    inline auto convert(const std::vector<uint8_t>& v) { return std::span<const uint8_t>(v); }
    inline auto convert(int64_t i) { return i; }
    inline auto convert(int i) { return int64_t(i); }
    inline auto convert(uint64_t i)
    {
        if (i > uint64_t(std::numeric_limits<int64_t>::max()))
            throw std::runtime_error("Value does not fit into database integer.");
        return (int64_t)i;
    }
    inline auto convert(uint32_t i) { return (int64_t)i; }
    inline auto convert(bool b) { return (int64_t)(b ? 1 : 0); }
    inline const auto& convert(const std::string& s) { return s; }
}
}
