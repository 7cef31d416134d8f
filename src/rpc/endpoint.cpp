#include <peerlink/rpc/endpoint.hpp>
#include <peerlink/rpc/identity_digest.hpp>

namespace peerlink::rpc
{

Endpoint::Endpoint(std::string url, Url address, ChannelBuilder channelBuilder, std::optional<std::string> authority,
                   std::optional<Bytes> clientCertificatePEM)
    : url_(std::move(url))
    , address_(std::move(address))
    , channelBuilder_(std::move(channelBuilder))
    , authority_(std::move(authority))
    , clientCertificatePEM_(std::move(clientCertificatePEM))
{
}

Endpoint::~Endpoint() noexcept
{
}

std::optional<Bytes> Endpoint::getClientTLSCertificateDigest() const
{
    if (!clientCertificatePEM_.has_value())
    {
        return std::nullopt;
    }

    std::call_once(digestFlag_, [this]() { digest_ = ComputeIdentityDigest(clientCertificatePEM_.value()); });
    return digest_;
}

} // namespace peerlink::rpc
