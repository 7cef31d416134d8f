#include <openssl/ssl.h>
#include <openssl/x509_vfy.h>

#include <casket/log/log_manager.hpp>

#include <peerlink/crypto/asymm_key.hpp>
#include <peerlink/crypto/cert.hpp>
#include <peerlink/crypto/exception.hpp>

#include <peerlink/rpc/trust_context.hpp>
#include <peerlink/rpc/error_code.hpp>

using namespace peerlink::crypto;

namespace
{

X509StorePtr CreateTrustStore(X509Cert* anchor)
{
    X509StorePtr store{X509_STORE_new()};
    ThrowIfTrue(store == nullptr, "X509_STORE_new");
    ThrowIfFalse(0 < X509_STORE_add_cert(store, anchor), "X509_STORE_add_cert");
    return store;
}

void UseClientIdentity(SslCtx* ctx, const peerlink::rpc::CredentialBundle& credentials)
{
    auto cert = credentials.clientCertificates.front().get();
    ThrowIfFalse(0 < SSL_CTX_use_certificate(ctx, cert), "SSL_CTX_use_certificate");
    ThrowIfFalse(0 < SSL_CTX_use_PrivateKey(ctx, credentials.clientKey), "SSL_CTX_use_PrivateKey");
    ThrowIfFalse(0 < SSL_CTX_check_private_key(ctx), "client key does not match client certificate");
}

} // namespace

namespace peerlink::rpc
{

TrustContext::TrustContext(PrivateTag, SslCtxPtr ctx, X509CertPtr anchor)
    : ctx_(std::move(ctx))
    , anchor_(std::move(anchor))
{
}

TrustContext::~TrustContext() noexcept
{
}

std::shared_ptr<const TrustContext> TrustContext::build(const Bytes& caTrustBytes,
                                                        const CredentialBundle& credentials, std::error_code& ec)
{
    ec.clear();

    X509CertPtr anchor;
    try
    {
        anchor = Cert::fromPemBytes(caTrustBytes);
    }
    catch (const CryptoException& e)
    {
        casket::error("cannot decode trust anchor: {}", e.what());
        ec = Error::TrustAnchorDecoding;
        return nullptr;
    }

    SslCtxPtr ctx;
    try
    {
        auto store = CreateTrustStore(anchor);

        ctx.reset(SSL_CTX_new(TLS_client_method()));
        crypto::ThrowIfTrue(ctx == nullptr, "SSL_CTX_new");

        if (credentials.hasClientIdentity())
        {
            UseClientIdentity(ctx, credentials);
        }

        // The context takes ownership of the store.
        SSL_CTX_set_cert_store(ctx, store.release());
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
    }
    catch (const CryptoException& e)
    {
        casket::error("cannot build trust store: {}", e.what());
        ec = Error::TrustStoreFailure;
        return nullptr;
    }

    std::shared_ptr<const TrustContext> result =
        std::make_shared<TrustContext>(PrivateTag{}, std::move(ctx), std::move(anchor));

    auto anchors = result->countTrustAnchors();
    if (anchors != 1)
    {
        casket::error("trust context holds {} trust anchors, exactly one expected", anchors);
        ec = Error::UnexpectedTrustManagers;
        return nullptr;
    }

    casket::debug("trust context ready (mutual TLS: {})", result->hasClientIdentity() ? "yes" : "no");
    return result;
}

SslCtx* TrustContext::nativeHandle() const noexcept
{
    return ctx_.get();
}

X509Cert* TrustContext::getTrustAnchor() const noexcept
{
    return anchor_.get();
}

X509Cert* TrustContext::getClientCertificate() const noexcept
{
    return SSL_CTX_get0_certificate(ctx_);
}

bool TrustContext::hasClientIdentity() const noexcept
{
    return getClientCertificate() != nullptr;
}

std::size_t TrustContext::countTrustAnchors() const
{
    auto store = SSL_CTX_get_cert_store(ctx_);
    if (store == nullptr)
    {
        return 0;
    }

    auto objects = X509_STORE_get0_objects(store);
    if (objects == nullptr)
    {
        return 0;
    }

    std::size_t count{0};
    for (int i = 0; i < sk_X509_OBJECT_num(objects); ++i)
    {
        if (X509_OBJECT_get_type(sk_X509_OBJECT_value(objects, i)) == X509_LU_X509)
        {
            ++count;
        }
    }
    return count;
}

int TrustContext::getVerifyMode() const noexcept
{
    return SSL_CTX_get_verify_mode(ctx_);
}

} // namespace peerlink::rpc
