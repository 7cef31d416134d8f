/// @file
/// @brief Declaration of the Endpoint class.

#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <casket/utils/noncopyable.hpp>
#include <peerlink/rpc/channel_builder.hpp>
#include <peerlink/rpc/types.hpp>
#include <peerlink/rpc/url.hpp>

namespace peerlink::rpc
{

/// @brief Verified description of an RPC peer: its address, the configured channel and the client identity.
class Endpoint final : public casket::NonCopyable
{
public:
    Endpoint(std::string url, Url address, ChannelBuilder channelBuilder, std::optional<std::string> authority,
             std::optional<Bytes> clientCertificatePEM);

    ~Endpoint() noexcept;

    /// @brief Gets the URL the endpoint was created from.
    const std::string& getUrl() const noexcept
    {
        return url_;
    }

    const std::string& getHost() const noexcept
    {
        return address_.getHost();
    }

    uint16_t getPort() const noexcept
    {
        return address_.getPort();
    }

    Protocol getProtocol() const noexcept
    {
        return address_.getProtocol();
    }

    /// @brief Gets the authority override applied to the channel, if any.
    const std::optional<std::string>& getAuthority() const noexcept
    {
        return authority_;
    }

    const ChannelBuilder& getChannelBuilder() const noexcept
    {
        return channelBuilder_;
    }

    ChannelBuilder& getChannelBuilder() noexcept
    {
        return channelBuilder_;
    }

    /// @brief Gets SHA-256 of the DER form of the client certificate.
    ///
    /// Computed on the first call and reused afterwards. Safe to call from several threads.
    ///
    /// @return Empty optional when no client certificate was configured.
    ///
    /// @throw crypto::CryptoException if the certificate body is not valid base64.
    std::optional<Bytes> getClientTLSCertificateDigest() const;

private:
    std::string url_;
    Url address_;
    ChannelBuilder channelBuilder_;
    std::optional<std::string> authority_;
    std::optional<Bytes> clientCertificatePEM_;

    mutable std::once_flag digestFlag_;
    mutable std::optional<Bytes> digest_;
};

} // namespace peerlink::rpc
