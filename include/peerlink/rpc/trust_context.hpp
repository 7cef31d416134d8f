/// @file
/// @brief Declaration of the TrustContext class.

#pragma once
#include <cstddef>
#include <memory>
#include <system_error>
#include <casket/utils/noncopyable.hpp>
#include <peerlink/crypto/pointers.hpp>
#include <peerlink/rpc/credential_bundle.hpp>

namespace peerlink::rpc
{

/// @brief TLS client context holding one trust anchor and an optional client identity.
///
/// The context is complete once built and is shared read-only afterwards.
class TrustContext final : public casket::NonCopyable
{
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

public:
    /// @brief Builds a client context trusting the first certificate of @p caTrustBytes.
    ///
    /// When @p credentials carries a client identity, its certificate and private key are installed
    /// and must match. Peer verification is enabled.
    ///
    /// @param[in] caTrustBytes PEM text of the trust anchors.
    /// @param[in] credentials Resolved credentials.
    /// @param[out] ec Error::TrustAnchorDecoding, Error::TrustStoreFailure or Error::UnexpectedTrustManagers.
    ///
    /// @return Built context, or nullptr on failure.
    static std::shared_ptr<const TrustContext> build(const Bytes& caTrustBytes, const CredentialBundle& credentials,
                                                     std::error_code& ec);

    TrustContext(PrivateTag, crypto::SslCtxPtr ctx, crypto::X509CertPtr anchor);

    ~TrustContext() noexcept;

    /// @brief Gets the native OpenSSL context, ready for SSL_new().
    SslCtx* nativeHandle() const noexcept;

    /// @brief Gets the trust anchor.
    X509Cert* getTrustAnchor() const noexcept;

    /// @brief Gets the installed client certificate, or nullptr without mutual TLS.
    X509Cert* getClientCertificate() const noexcept;

    bool hasClientIdentity() const noexcept;

    /// @brief Counts the certificates in the certificate store attached to the context.
    std::size_t countTrustAnchors() const;

    /// @brief Gets the SSL_VERIFY_* flags of the context.
    int getVerifyMode() const noexcept;

private:
    crypto::SslCtxPtr ctx_;
    crypto::X509CertPtr anchor_;
};

} // namespace peerlink::rpc
