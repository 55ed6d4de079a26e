#pragma once

#include "general/serializer.hxx"
#include "hash.hpp"
#include <memory>
#include <openssl/evp.h>
#include <span>
#include <stdexcept>

class HasherSHA256 {
private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx;

public:
    HasherSHA256()
        : ctx(EVP_MD_CTX_new())
    {
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
            throw std::runtime_error("Cannot initialize SHA256 context");
    }

    operator Hash() &&
    {
        Hash tmp { Hash::uninitialized() };
        finalize(tmp.data());
        return tmp;
    }

    void write(const std::span<const uint8_t>& s)
    {
        if (EVP_DigestUpdate(ctx.get(), s.data(), s.size()) != 1)
            throw std::runtime_error("SHA256 update failed");
    }

private:
    void finalize(uint8_t* out256)
    {
        unsigned int len { 0 };
        if (EVP_DigestFinal_ex(ctx.get(), out256, &len) != 1 || len != 32)
            throw std::runtime_error("SHA256 finalization failed");
    }
};

inline Hash hashSHA256(std::span<const uint8_t> s)
{
    return HasherSHA256() << s;
}

inline Hash hashSHA256(const uint8_t* data, size_t len)
{
    return hashSHA256({ data, len });
}

template <typename... Ts>
[[nodiscard]] inline Hash hash_args_SHA256(Ts&&... ts)
{
    return (HasherSHA256() << ... << std::forward<Ts>(ts));
}
