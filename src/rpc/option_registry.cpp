#include <algorithm>
#include <casket/utils/string.hpp>
#include <peerlink/rpc/option_registry.hpp>

namespace peerlink::rpc
{

std::string_view EnumTypeName(std::string_view type) noexcept
{
    auto pos = type.find_first_of(".$");
    if (pos != std::string_view::npos)
    {
        type = type.substr(0, pos);
    }
    return type;
}

std::optional<NegotiationType> ParseNegotiationTypeName(std::string_view name) noexcept
{
    for (auto type : {NegotiationType::Tls, NegotiationType::Plaintext})
    {
        if (casket::iequals(name, toString(type)))
        {
            return type;
        }
    }
    return std::nullopt;
}

bool OptionRegistry::Overload::matches(const Arguments& args) const
{
    if (args.size() != signature.size())
    {
        return false;
    }

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (!signature[i].accepts(args[i]))
        {
            return false;
        }
    }
    return true;
}

std::string OptionRegistry::Overload::toString(std::string_view name) const
{
    std::string result(name);
    result += '(';
    for (std::size_t i = 0; i < signature.size(); ++i)
    {
        if (i > 0)
        {
            result += ", ";
        }
        result += signature[i].typeName;
    }
    result += ')';
    return result;
}

bool OptionRegistry::contains(std::string_view name) const
{
    return options_.find(name) != options_.end();
}

const OptionRegistry::Overload* OptionRegistry::match(std::string_view name, const Arguments& args) const
{
    auto found = options_.find(name);
    if (found == options_.end())
    {
        return nullptr;
    }

    auto overload = std::find_if(found->second.begin(), found->second.end(),
                                 [&args](const Overload& candidate) { return candidate.matches(args); });
    return overload != found->second.end() ? &(*overload) : nullptr;
}

std::string OptionRegistry::describe(std::string_view name) const
{
    std::string result;

    auto found = options_.find(name);
    if (found != options_.end())
    {
        for (const auto& overload : found->second)
        {
            result += overload.toString(name);
            result += '\n';
        }
    }
    return result;
}

std::vector<std::string> OptionRegistry::names() const
{
    std::vector<std::string> result;
    result.reserve(options_.size());
    for (const auto& [name, overloads] : options_)
    {
        result.push_back(name);
    }
    return result;
}

const OptionRegistry& OptionRegistry::channelOptions()
{
    // clang-format off
    static const OptionRegistry registry = OptionRegistry()
        .add("maxInboundMessageSize",  &ChannelBuilder::maxInboundMessageSize)
        .add("maxInboundMetadataSize", &ChannelBuilder::maxInboundMetadataSize)
        .add("flowControlWindow",      &ChannelBuilder::flowControlWindow)
        .add("keepAliveTime",          &ChannelBuilder::keepAliveTime)
        .add("keepAliveTimeout",       &ChannelBuilder::keepAliveTimeout)
        .add("keepAliveWithoutCalls",  &ChannelBuilder::keepAliveWithoutCalls)
        .add("idleTimeout",            &ChannelBuilder::idleTimeout)
        .add("userAgent",              &ChannelBuilder::userAgent)
        .add("maxRetryAttempts",       &ChannelBuilder::maxRetryAttempts)
        .add("enableRetry",            &ChannelBuilder::enableRetry)
        .add("disableRetry",           &ChannelBuilder::disableRetry)
        .add("perRpcBufferLimit",      &ChannelBuilder::perRpcBufferLimit)
        .add("retryBufferSize",        &ChannelBuilder::retryBufferSize)
        .add("negotiationType",        &ChannelBuilder::negotiationType);
    // clang-format on
    return registry;
}

} // namespace peerlink::rpc
