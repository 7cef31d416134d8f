#pragma once
#include <optional>
#include <vector>
#include <peerlink/crypto/pointers.hpp>
#include <peerlink/rpc/types.hpp>

namespace peerlink::rpc
{

/// @brief Certificate material resolved from connection properties.
///
/// The client key and the client certificate are either both set or both empty.
struct CredentialBundle
{
    /// PEM text of the trust anchors, possibly several certificates back to back.
    std::optional<Bytes> caTrustBytes;

    crypto::KeyPtr clientKey;

    /// Holds exactly one certificate when a client identity is present.
    std::vector<crypto::X509CertPtr> clientCertificates;

    /// Exact bytes the client certificate was decoded from.
    std::optional<Bytes> clientCertificatePEM;

    bool hasTrustBytes() const noexcept
    {
        return caTrustBytes.has_value() && !caTrustBytes->empty();
    }

    bool hasClientIdentity() const noexcept
    {
        return clientKey != nullptr && !clientCertificates.empty();
    }
};

} // namespace peerlink::rpc
