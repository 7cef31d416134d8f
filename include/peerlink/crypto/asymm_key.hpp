#pragma once
#include <cstdint>
#include <string_view>
#include <peerlink/crypto/pointers.hpp>
#include <casket/nonstd/span.hpp>

namespace peerlink::crypto
{

class AsymmKey
{
public:
    static bool isAlgorithm(const Key* key, std::string_view alg);

    /// @brief Decodes an unencrypted PEM private key (PKCS#8 or traditional format).
    ///
    /// @throw CryptoException if no private key can be decoded from @p input.
    static KeyPtr privateKeyFromPemBytes(nonstd::span<const uint8_t> input);

    static KeyPtr privateKeyFromBio(Bio* in, Encoding inEncoding);

    /// @brief Checks that @p key is the private half of the public key in @p cert.
    static bool matchesCertificate(Key* key, X509Cert* cert);
};

} // namespace peerlink::crypto
