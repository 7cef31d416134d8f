#pragma once
#include <cstdint>
#include <vector>
#include <openssl/evp.h>
#include <casket/nonstd/span.hpp>
#include <peerlink/crypto/pointers.hpp>
#include <peerlink/crypto/exception.hpp>

namespace peerlink::crypto
{

class HashTraits
{
public:
    static inline HashCtxPtr createContext()
    {
        auto ctx = HashCtxPtr{EVP_MD_CTX_new()};
        ThrowIfTrue(ctx == nullptr, "EVP_MD_CTX_new");
        return ctx;
    }

    static inline void initHash(HashCtx* ctx, const Hash* algorithm)
    {
        ThrowIfFalse(0 < EVP_DigestInit_ex(ctx, algorithm, nullptr), "EVP_DigestInit_ex");
    }

    static inline void updateHash(HashCtx* ctx, nonstd::span<const uint8_t> message)
    {
        ThrowIfFalse(0 < EVP_DigestUpdate(ctx, message.data(), message.size()), "EVP_DigestUpdate");
    }

    static inline std::vector<uint8_t> finalHash(HashCtx* ctx)
    {
        std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
        unsigned int digestSize{0};
        ThrowIfFalse(0 < EVP_DigestFinal_ex(ctx, digest.data(), &digestSize), "EVP_DigestFinal_ex");
        digest.resize(digestSize);
        return digest;
    }

    /// @brief One-shot digest of @p message.
    static inline std::vector<uint8_t> digest(const Hash* algorithm, nonstd::span<const uint8_t> message)
    {
        auto ctx = createContext();
        initHash(ctx, algorithm);
        updateHash(ctx, message);
        return finalHash(ctx);
    }

    static inline std::vector<uint8_t> sha256(nonstd::span<const uint8_t> message)
    {
        return digest(EVP_sha256(), message);
    }
};

} // namespace peerlink::crypto
