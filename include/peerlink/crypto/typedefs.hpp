#pragma once
#include <openssl/x509_vfy.h>

#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
#define OSSL_CONST_COMPAT const
#else
#define OSSL_CONST_COMPAT
#endif

enum class Encoding
{
    PEM,
    DER,
};

using Bio = struct bio_st;
using X509Cert = struct x509_st;
using X509Name = struct X509_name_st;
using X509Store = struct x509_store_st;
using Hash = struct evp_md_st;
using HashCtx = struct evp_md_ctx_st;
using Key = struct evp_pkey_st;
using EncodeCtx = struct evp_Encode_Ctx_st;
using SslCtx = struct ssl_ctx_st;
