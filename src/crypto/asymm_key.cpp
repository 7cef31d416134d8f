#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/err.h>

#include <peerlink/crypto/asymm_key.hpp>
#include <peerlink/crypto/bio.hpp>

#include <peerlink/crypto/exception.hpp>
#include <peerlink/crypto/error_code.hpp>

namespace
{

// Refuses to prompt for a passphrase: encrypted keys fail to decode instead.
int NoPassphrase(char*, int, int, void*)
{
    return -1;
}

} // namespace

namespace peerlink::crypto
{

bool AsymmKey::isAlgorithm(const Key* key, std::string_view alg)
{
#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    return EVP_PKEY_is_a(key, alg.data());
#else  // (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    const auto nid = OBJ_sn2nid(alg.data());
    return EVP_PKEY_base_id(key) == nid;
#endif // !(OPENSSL_VERSION_NUMBER >= 0x30000000L)
}

KeyPtr AsymmKey::privateKeyFromPemBytes(nonstd::span<const uint8_t> input)
{
    auto bio = BioTraits::createMemoryReader(input.data(), input.size());
    return privateKeyFromBio(bio, Encoding::PEM);
}

KeyPtr AsymmKey::privateKeyFromBio(Bio* in, Encoding inEncoding)
{
    KeyPtr result;

    switch (inEncoding)
    {
    case Encoding::DER:
    {
        result.reset(d2i_PrivateKey_bio(in, nullptr));
    }
    break;

    case Encoding::PEM:
    {
        result.reset(PEM_read_bio_PrivateKey(in, nullptr, &NoPassphrase, nullptr));
    }
    break;

    default:
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "Unsupported encoding");
    }
    break;
    }

    crypto::ThrowIfTrue(result == nullptr, "Failed to parse private key");
    return result;
}

bool AsymmKey::matchesCertificate(Key* key, X509Cert* cert)
{
    bool result = 0 < X509_check_private_key(cert, key);
    if (!result)
    {
        ClearErrors();
    }
    return result;
}

} // namespace peerlink::crypto
