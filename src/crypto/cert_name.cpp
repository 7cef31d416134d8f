#include <openssl/x509.h>
#include <openssl/asn1.h>
#include <openssl/crypto.h>
#include <peerlink/crypto/cert_name.hpp>
#include <peerlink/crypto/exception.hpp>

namespace peerlink::crypto
{

X509NamePtr CertName::deepCopy(OSSL_CONST_COMPAT X509Name* name)
{
    return X509NamePtr{X509_NAME_dup(name)};
}

std::optional<std::string> CertName::commonName(OSSL_CONST_COMPAT X509Name* name)
{
    auto loc = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
    if (loc < 0)
    {
        return std::nullopt;
    }

    auto entry = X509_NAME_get_entry(name, loc);
    crypto::ThrowIfTrue(entry == nullptr, "X509_NAME_get_entry");

    auto value = X509_NAME_ENTRY_get_data(entry);
    crypto::ThrowIfTrue(value == nullptr, "X509_NAME_ENTRY_get_data");

    unsigned char* utf8{nullptr};
    int length = ASN1_STRING_to_UTF8(&utf8, value);
    crypto::ThrowIfTrue(length < 0, "ASN1_STRING_to_UTF8");

    std::string result(reinterpret_cast<char*>(utf8), static_cast<size_t>(length));
    OPENSSL_free(utf8);

    return result;
}

} // namespace peerlink::crypto
