#include <openssl/x509.h>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/err.h>

#include <peerlink/crypto/bio.hpp>
#include <peerlink/crypto/cert.hpp>
#include <peerlink/crypto/cert_name.hpp>

#include <peerlink/crypto/exception.hpp>
#include <peerlink/crypto/error_code.hpp>

namespace peerlink::crypto
{

X509CertPtr Cert::shallowCopy(X509Cert* cert)
{
    if (cert)
    {
        crypto::ThrowIfFalse(0 < X509_up_ref(cert), "X509_up_ref");
        return X509CertPtr{cert};
    }
    return nullptr;
}

bool Cert::isEqual(const X509Cert* a, const X509Cert* b)
{
    return X509_cmp(a, b) == 0;
}

X509NamePtr Cert::subjectName(X509Cert* cert)
{
    auto name = X509_get_subject_name(cert);
    crypto::ThrowIfTrue(name == nullptr, "X509_get_subject_name");

    auto result = CertName::deepCopy(name);
    crypto::ThrowIfTrue(result == nullptr, "X509_NAME_dup");

    return result;
}

X509CertPtr Cert::fromPemBytes(nonstd::span<const uint8_t> input)
{
    auto bio = BioTraits::createMemoryReader(input.data(), input.size());
    return fromBio(bio, Encoding::PEM);
}

X509CertPtr Cert::fromBio(Bio* bio, Encoding encoding)
{
    X509CertPtr result;

    switch (encoding)
    {
    case Encoding::DER:
    {
        result.reset(d2i_X509_bio(bio, nullptr));
        break;
    }

    case Encoding::PEM:
    {
        result.reset(PEM_read_bio_X509(bio, nullptr, nullptr, nullptr));
        break;
    }

    default:
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "Unsupported encoding");
    }
    }

    crypto::ThrowIfTrue(result == nullptr, "Failed to parse certificate");
    return result;
}

std::vector<uint8_t> Cert::toDer(X509Cert* cert)
{
    int length = i2d_X509(cert, nullptr);
    crypto::ThrowIfFalse(0 < length, "i2d_X509");

    std::vector<uint8_t> der(static_cast<size_t>(length));
    unsigned char* ptr = der.data();
    crypto::ThrowIfFalse(length == i2d_X509(cert, &ptr), "i2d_X509");

    return der;
}

} // namespace peerlink::crypto
