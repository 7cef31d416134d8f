#include <casket/utils/exception.hpp>
#include <peerlink/rpc/channel_builder.hpp>
#include <peerlink/rpc/trust_context.hpp>

namespace peerlink::rpc
{

ChannelBuilder::ChannelBuilder(std::string host, uint16_t port)
    : host_(std::move(host))
    , port_(port)
    , negotiationType_(NegotiationType::Tls)
    , maxInboundMessageSize_(kDefaultMaxInboundMessageSize)
    , maxInboundMetadataSize_(kDefaultMaxInboundMetadataSize)
    , flowControlWindow_(kDefaultFlowControlWindow)
    , keepAliveWithoutCalls_(false)
    , maxRetryAttempts_(kDefaultMaxRetryAttempts)
    , retryEnabled_(true)
    , perRpcBufferLimit_(kDefaultPerRpcBufferLimit)
    , retryBufferSize_(kDefaultRetryBufferSize)
{
}

ChannelBuilder ChannelBuilder::forAddress(std::string host, uint16_t port)
{
    casket::ThrowIfTrue(host.empty(), "host must not be empty");
    casket::ThrowIfTrue(port == 0, "port must be positive");
    return ChannelBuilder(std::move(host), port);
}

ChannelBuilder& ChannelBuilder::usePlaintext()
{
    negotiationType_ = NegotiationType::Plaintext;
    return *this;
}

ChannelBuilder& ChannelBuilder::useTransportSecurity()
{
    negotiationType_ = NegotiationType::Tls;
    return *this;
}

ChannelBuilder& ChannelBuilder::negotiationType(NegotiationType type)
{
    negotiationType_ = type;
    return *this;
}

ChannelBuilder& ChannelBuilder::sslContext(std::shared_ptr<const TrustContext> context)
{
    casket::ThrowIfTrue(context == nullptr, "SSL context must not be null");
    sslContext_ = std::move(context);
    return *this;
}

ChannelBuilder& ChannelBuilder::sslProvider(SslProvider provider)
{
    sslProvider_ = provider;
    return *this;
}

ChannelBuilder& ChannelBuilder::overrideAuthority(std::string authority)
{
    casket::ThrowIfTrue(authority.empty(), "authority must not be empty");
    authority_ = std::move(authority);
    return *this;
}

ChannelBuilder& ChannelBuilder::maxInboundMessageSize(int32_t bytes)
{
    casket::ThrowIfTrue(bytes < 0, "negative max inbound message size: {}", bytes);
    maxInboundMessageSize_ = bytes;
    return *this;
}

ChannelBuilder& ChannelBuilder::maxInboundMetadataSize(int32_t bytes)
{
    casket::ThrowIfTrue(bytes <= 0, "max inbound metadata size must be positive: {}", bytes);
    maxInboundMetadataSize_ = bytes;
    return *this;
}

ChannelBuilder& ChannelBuilder::flowControlWindow(int32_t bytes)
{
    casket::ThrowIfTrue(bytes <= 0, "flow control window must be positive: {}", bytes);
    flowControlWindow_ = bytes;
    return *this;
}

ChannelBuilder& ChannelBuilder::keepAliveTime(int64_t value, TimeUnit unit)
{
    casket::ThrowIfTrue(value <= 0, "keepalive time must be positive: {}", value);
    keepAliveTime_ = ToNanoseconds(value, unit);
    return *this;
}

ChannelBuilder& ChannelBuilder::keepAliveTimeout(int64_t value, TimeUnit unit)
{
    casket::ThrowIfTrue(value <= 0, "keepalive timeout must be positive: {}", value);
    keepAliveTimeout_ = ToNanoseconds(value, unit);
    return *this;
}

ChannelBuilder& ChannelBuilder::keepAliveWithoutCalls(bool enable)
{
    keepAliveWithoutCalls_ = enable;
    return *this;
}

ChannelBuilder& ChannelBuilder::idleTimeout(int64_t value, TimeUnit unit)
{
    casket::ThrowIfTrue(value <= 0, "idle timeout must be positive: {}", value);
    idleTimeout_ = ToNanoseconds(value, unit);
    return *this;
}

ChannelBuilder& ChannelBuilder::userAgent(std::string agent)
{
    userAgent_ = std::move(agent);
    return *this;
}

ChannelBuilder& ChannelBuilder::maxRetryAttempts(int32_t attempts)
{
    casket::ThrowIfTrue(attempts < 0, "negative max retry attempts: {}", attempts);
    maxRetryAttempts_ = attempts;
    return *this;
}

ChannelBuilder& ChannelBuilder::enableRetry()
{
    retryEnabled_ = true;
    return *this;
}

ChannelBuilder& ChannelBuilder::disableRetry()
{
    retryEnabled_ = false;
    return *this;
}

ChannelBuilder& ChannelBuilder::perRpcBufferLimit(int64_t bytes)
{
    casket::ThrowIfTrue(bytes <= 0, "per RPC buffer limit must be positive: {}", bytes);
    perRpcBufferLimit_ = bytes;
    return *this;
}

ChannelBuilder& ChannelBuilder::retryBufferSize(int64_t bytes)
{
    casket::ThrowIfTrue(bytes <= 0, "retry buffer size must be positive: {}", bytes);
    retryBufferSize_ = bytes;
    return *this;
}

} // namespace peerlink::rpc
