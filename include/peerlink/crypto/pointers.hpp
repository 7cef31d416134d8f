#pragma once
#include <memory>

#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/ssl.h>

#include <peerlink/crypto/typedefs.hpp>

template <typename T, void (*f)(T*)> struct static_function_deleter
{
    void operator()(T* t) const
    {
        f(t);
    }
};

#define DEFINE_CUSTOM_UNIQUE_PTR_WITH_DELETER(alias, object, deleter)          \
    struct alias : public std::unique_ptr<object, deleter>                     \
    {                                                                          \
        using unique_ptr::unique_ptr;                                          \
                                                                               \
        operator object*() const                                               \
        {                                                                      \
            return this->get();                                                \
        }                                                                      \
    }

#define DEFINE_CUSTOM_UNIQUE_PTR(alias, object, deleter)                       \
    using alias##Deleter = static_function_deleter<object, &deleter>;          \
    DEFINE_CUSTOM_UNIQUE_PTR_WITH_DELETER(alias, object, alias##Deleter)

namespace peerlink::crypto
{

DEFINE_CUSTOM_UNIQUE_PTR(BioPtr, Bio, BIO_free_all);

DEFINE_CUSTOM_UNIQUE_PTR(X509CertPtr, X509Cert, X509_free);
DEFINE_CUSTOM_UNIQUE_PTR(X509NamePtr, X509Name, X509_NAME_free);
DEFINE_CUSTOM_UNIQUE_PTR(X509StorePtr, X509Store, X509_STORE_free);

DEFINE_CUSTOM_UNIQUE_PTR(KeyPtr, Key, EVP_PKEY_free);
DEFINE_CUSTOM_UNIQUE_PTR(HashCtxPtr, HashCtx, EVP_MD_CTX_free);
DEFINE_CUSTOM_UNIQUE_PTR(EncodeCtxPtr, EncodeCtx, EVP_ENCODE_CTX_free);

DEFINE_CUSTOM_UNIQUE_PTR(SslCtxPtr, SslCtx, SSL_CTX_free);

} // namespace peerlink::crypto
