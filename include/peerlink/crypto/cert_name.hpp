#pragma once
#include <optional>
#include <string>
#include <peerlink/crypto/pointers.hpp>

namespace peerlink::crypto
{

class CertName final
{
public:
    static X509NamePtr deepCopy(OSSL_CONST_COMPAT X509Name* name);

    /// @brief Returns the first commonName entry of @p name converted to UTF-8.
    ///
    /// @return Empty optional when @p name has no commonName entry.
    ///
    /// @throw CryptoException if the entry cannot be converted to UTF-8.
    static std::optional<std::string> commonName(OSSL_CONST_COMPAT X509Name* name);
};

} // namespace peerlink::crypto
