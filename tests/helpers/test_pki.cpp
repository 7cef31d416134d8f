#include <atomic>
#include <fstream>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <unistd.h>

#include <peerlink/crypto/bio.hpp>
#include <peerlink/crypto/exception.hpp>

#include "test_pki.hpp"

using namespace peerlink::crypto;

namespace
{

DEFINE_CUSTOM_UNIQUE_PTR(KeyCtxPtr, EVP_PKEY_CTX, EVP_PKEY_CTX_free);
DEFINE_CUSTOM_UNIQUE_PTR(X509ExtensionPtr, X509_EXTENSION, X509_EXTENSION_free);

std::string ReadMemoryBio(Bio* bio)
{
    char* data{nullptr};
    auto length = BIO_get_mem_data(bio, &data);
    ThrowIfTrue(length < 0, "BIO_get_mem_data");
    return std::string(data, static_cast<size_t>(length));
}

BioPtr CreateMemoryWriter()
{
    BioPtr bio{BIO_new(BIO_s_mem())};
    ThrowIfTrue(bio == nullptr, "BIO_new");
    return bio;
}

void AddExtension(X509* cert, int nid, const char* value)
{
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);

    X509ExtensionPtr ext{X509V3_EXT_conf_nid(nullptr, &ctx, nid, value)};
    ThrowIfTrue(ext == nullptr, "X509V3_EXT_conf_nid");
    ThrowIfFalse(0 < X509_add_ext(cert, ext, -1), "X509_add_ext");
}

} // namespace

namespace peerlink::test
{

KeyPtr GenerateKey()
{
    KeyCtxPtr ctx{EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr)};
    ThrowIfTrue(ctx == nullptr, "EVP_PKEY_CTX_new_id");
    ThrowIfFalse(0 < EVP_PKEY_keygen_init(ctx), "EVP_PKEY_keygen_init");
    ThrowIfFalse(0 < EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, NID_X9_62_prime256v1),
                 "EVP_PKEY_CTX_set_ec_paramgen_curve_nid");

    EVP_PKEY* key{nullptr};
    ThrowIfFalse(0 < EVP_PKEY_keygen(ctx, &key), "EVP_PKEY_keygen");
    return KeyPtr{key};
}

X509CertPtr IssueSelfSigned(Key* key, std::optional<std::string_view> commonName)
{
    static std::atomic<long> serial{1};

    X509CertPtr cert{X509_new()};
    ThrowIfTrue(cert == nullptr, "X509_new");

    ThrowIfFalse(0 < X509_set_version(cert, 2), "X509_set_version");
    ThrowIfFalse(0 < ASN1_INTEGER_set(X509_get_serialNumber(cert), serial++), "ASN1_INTEGER_set");
    ThrowIfTrue(X509_gmtime_adj(X509_getm_notBefore(cert), -3600) == nullptr, "X509_gmtime_adj");
    ThrowIfTrue(X509_gmtime_adj(X509_getm_notAfter(cert), 24 * 3600) == nullptr, "X509_gmtime_adj");

    auto name = X509_get_subject_name(cert);
    ThrowIfFalse(0 < X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                                reinterpret_cast<const unsigned char*>("peerlink tests"), -1, -1, 0),
                 "X509_NAME_add_entry_by_txt");
    if (commonName.has_value())
    {
        std::string cn(commonName.value());
        ThrowIfFalse(0 < X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
                                                    reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0),
                     "X509_NAME_add_entry_by_txt");
    }
    ThrowIfFalse(0 < X509_set_issuer_name(cert, name), "X509_set_issuer_name");
    ThrowIfFalse(0 < X509_set_pubkey(cert, key), "X509_set_pubkey");

    AddExtension(cert, NID_basic_constraints, "critical,CA:TRUE");
    AddExtension(cert, NID_subject_key_identifier, "hash");

    ThrowIfFalse(0 < X509_sign(cert, key, EVP_sha256()), "X509_sign");
    return cert;
}

std::string ToPem(X509Cert* cert)
{
    auto bio = CreateMemoryWriter();
    ThrowIfFalse(0 < PEM_write_bio_X509(bio, cert), "PEM_write_bio_X509");
    return ReadMemoryBio(bio);
}

std::string ToPem(Key* key)
{
    auto bio = CreateMemoryWriter();
    ThrowIfFalse(0 < PEM_write_bio_PrivateKey(bio, key, nullptr, nullptr, 0, nullptr, nullptr),
                 "PEM_write_bio_PrivateKey");
    return ReadMemoryBio(bio);
}

Identity MakeIdentity(std::optional<std::string_view> commonName)
{
    Identity identity;
    identity.key = GenerateKey();
    identity.cert = IssueSelfSigned(identity.key, commonName);
    identity.keyPem = ToPem(identity.key.get());
    identity.certPem = ToPem(identity.cert.get());
    return identity;
}

rpc::Bytes ToBytes(std::string_view str)
{
    return rpc::Bytes(str.begin(), str.end());
}

TempFile::TempFile(std::string_view content)
{
    static std::atomic<unsigned> counter{0};

    path_ = std::filesystem::temp_directory_path() /
            ("peerlink-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++) + ".pem");

    std::ofstream stream(path_, std::ios::binary | std::ios::trunc);
    stream.write(content.data(), static_cast<std::streamsize>(content.size()));
}

TempFile::~TempFile()
{
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

} // namespace peerlink::test
