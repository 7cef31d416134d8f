/// @file
/// @brief Declaration of the ChannelBuilder class.

#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <peerlink/rpc/types.hpp>

namespace peerlink::rpc
{

class TrustContext;

/// @brief Collects the transport settings of an RPC channel to one peer.
///
/// Setters validate their arguments and throw casket::RuntimeError on invalid values.
class ChannelBuilder final
{
public:
    /// @brief Default maximum size of an inbound message.
    static constexpr int32_t kDefaultMaxInboundMessageSize{4 * 1024 * 1024};

    /// @brief Default maximum size of inbound metadata.
    static constexpr int32_t kDefaultMaxInboundMetadataSize{8 * 1024};

    /// @brief Default flow control window.
    static constexpr int32_t kDefaultFlowControlWindow{1024 * 1024};

    static constexpr int32_t kDefaultMaxRetryAttempts{5};

    static constexpr int64_t kDefaultPerRpcBufferLimit{1024 * 1024};

    static constexpr int64_t kDefaultRetryBufferSize{16 * 1024 * 1024};

    /// @brief Creates a builder for the channel to @p host and @p port.
    static ChannelBuilder forAddress(std::string host, uint16_t port);

    /// @brief Sends traffic without encryption.
    ChannelBuilder& usePlaintext();

    /// @brief Encrypts traffic with TLS.
    ChannelBuilder& useTransportSecurity();

    /// @brief Sets how the transport negotiates security.
    ChannelBuilder& negotiationType(NegotiationType type);

    /// @brief Binds the TLS context used to verify the peer and present the client identity.
    ///
    /// Without a bound context the transport falls back to the default trust roots.
    ChannelBuilder& sslContext(std::shared_ptr<const TrustContext> context);

    ChannelBuilder& sslProvider(SslProvider provider);

    /// @brief Overrides the authority the server certificate is validated against.
    ChannelBuilder& overrideAuthority(std::string authority);

    ChannelBuilder& maxInboundMessageSize(int32_t bytes);

    ChannelBuilder& maxInboundMetadataSize(int32_t bytes);

    ChannelBuilder& flowControlWindow(int32_t bytes);

    ChannelBuilder& keepAliveTime(int64_t value, TimeUnit unit);

    ChannelBuilder& keepAliveTimeout(int64_t value, TimeUnit unit);

    ChannelBuilder& keepAliveWithoutCalls(bool enable);

    ChannelBuilder& idleTimeout(int64_t value, TimeUnit unit);

    ChannelBuilder& userAgent(std::string agent);

    ChannelBuilder& maxRetryAttempts(int32_t attempts);

    ChannelBuilder& enableRetry();

    ChannelBuilder& disableRetry();

    ChannelBuilder& perRpcBufferLimit(int64_t bytes);

    ChannelBuilder& retryBufferSize(int64_t bytes);

    const std::string& getHost() const noexcept
    {
        return host_;
    }

    uint16_t getPort() const noexcept
    {
        return port_;
    }

    NegotiationType getNegotiationType() const noexcept
    {
        return negotiationType_;
    }

    bool isPlaintext() const noexcept
    {
        return negotiationType_ == NegotiationType::Plaintext;
    }

    const std::shared_ptr<const TrustContext>& getSslContext() const noexcept
    {
        return sslContext_;
    }

    const std::optional<SslProvider>& getSslProvider() const noexcept
    {
        return sslProvider_;
    }

    const std::optional<std::string>& getAuthority() const noexcept
    {
        return authority_;
    }

    int32_t getMaxInboundMessageSize() const noexcept
    {
        return maxInboundMessageSize_;
    }

    int32_t getMaxInboundMetadataSize() const noexcept
    {
        return maxInboundMetadataSize_;
    }

    int32_t getFlowControlWindow() const noexcept
    {
        return flowControlWindow_;
    }

    const std::optional<std::chrono::nanoseconds>& getKeepAliveTime() const noexcept
    {
        return keepAliveTime_;
    }

    const std::optional<std::chrono::nanoseconds>& getKeepAliveTimeout() const noexcept
    {
        return keepAliveTimeout_;
    }

    bool getKeepAliveWithoutCalls() const noexcept
    {
        return keepAliveWithoutCalls_;
    }

    const std::optional<std::chrono::nanoseconds>& getIdleTimeout() const noexcept
    {
        return idleTimeout_;
    }

    const std::string& getUserAgent() const noexcept
    {
        return userAgent_;
    }

    int32_t getMaxRetryAttempts() const noexcept
    {
        return maxRetryAttempts_;
    }

    bool isRetryEnabled() const noexcept
    {
        return retryEnabled_;
    }

    int64_t getPerRpcBufferLimit() const noexcept
    {
        return perRpcBufferLimit_;
    }

    int64_t getRetryBufferSize() const noexcept
    {
        return retryBufferSize_;
    }

private:
    ChannelBuilder(std::string host, uint16_t port);

private:
    std::string host_;
    uint16_t port_;
    NegotiationType negotiationType_;
    std::shared_ptr<const TrustContext> sslContext_;
    std::optional<SslProvider> sslProvider_;
    std::optional<std::string> authority_;
    int32_t maxInboundMessageSize_;
    int32_t maxInboundMetadataSize_;
    int32_t flowControlWindow_;
    std::optional<std::chrono::nanoseconds> keepAliveTime_;
    std::optional<std::chrono::nanoseconds> keepAliveTimeout_;
    bool keepAliveWithoutCalls_;
    std::optional<std::chrono::nanoseconds> idleTimeout_;
    std::string userAgent_;
    int32_t maxRetryAttempts_;
    bool retryEnabled_;
    int64_t perRpcBufferLimit_;
    int64_t retryBufferSize_;
};

} // namespace peerlink::rpc
