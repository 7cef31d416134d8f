#pragma once
#include <cstdint>
#include <vector>
#include <peerlink/crypto/pointers.hpp>
#include <casket/nonstd/span.hpp>

namespace peerlink::crypto
{

class Cert final
{
public:
    static X509CertPtr shallowCopy(X509Cert* cert);

    static bool isEqual(const X509Cert* a, const X509Cert* b);

    static X509NamePtr subjectName(X509Cert* cert);

    /// @brief Reads the first certificate of a PEM bundle.
    ///
    /// Text before the first `BEGIN CERTIFICATE` marker and any certificates after the first one are ignored.
    ///
    /// @throw CryptoException if the buffer holds no decodable PEM certificate.
    static X509CertPtr fromPemBytes(nonstd::span<const uint8_t> input);

    static X509CertPtr fromBio(Bio* bio, Encoding encoding = Encoding::PEM);

    static std::vector<uint8_t> toDer(X509Cert* cert);
};

} // namespace peerlink::crypto
