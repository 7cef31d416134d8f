#include <exception>
#include <casket/log/log_manager.hpp>
#include <casket/utils/string.hpp>

#include <peerlink/rpc/option_applier.hpp>
#include <peerlink/rpc/error_code.hpp>

namespace
{

peerlink::rpc::Arguments ToArguments(const peerlink::rpc::PropertyValue& value)
{
    if (auto list = std::get_if<peerlink::rpc::ScalarList>(&value))
    {
        return *list;
    }
    return {std::get<peerlink::rpc::Scalar>(value)};
}

bool StartsWith(std::string_view str, std::string_view prefix)
{
    return str.rfind(prefix, 0) == 0;
}

std::string DescribeArguments(const peerlink::rpc::Arguments& args)
{
    std::string result;
    for (const auto& arg : args)
    {
        if (!result.empty())
        {
            result += ", ";
        }
        result += peerlink::rpc::TypeName(arg);
    }
    return result;
}

} // namespace

namespace peerlink::rpc
{

OptionApplier::OptionApplier(OptionRegistry registry)
    : registry_(std::move(registry))
{
}

std::optional<std::string> OptionApplier::optionName(std::string_view key)
{
    std::string_view suffix;
    if (StartsWith(key, keys::kChannelOptionPrefix))
    {
        suffix = key.substr(keys::kChannelOptionPrefix.size());
    }
    else if (StartsWith(key, keys::kNettyChannelOptionPrefix))
    {
        suffix = key.substr(keys::kNettyChannelOptionPrefix.size());
    }
    else
    {
        return std::nullopt;
    }

    if (suffix.find('.') != std::string_view::npos)
    {
        return std::nullopt;
    }

    std::string name(suffix);
    casket::ltrim(name);
    casket::rtrim(name);
    return name;
}

bool OptionApplier::isReserved(std::string_view name) noexcept
{
    return name == "forAddress" || name == "build";
}

void OptionApplier::apply(ChannelBuilder& builder, const ConnectionProperties& properties, std::error_code& ec) const
{
    std::string failedOption;
    apply(builder, properties, ec, failedOption);
}

void OptionApplier::apply(ChannelBuilder& builder, const ConnectionProperties& properties, std::error_code& ec,
                          std::string& failedOption) const
{
    ec.clear();
    failedOption.clear();

    for (const auto& [key, value] : properties.entries())
    {
        auto name = optionName(key);
        if (!name.has_value() || isReserved(name.value()))
        {
            continue;
        }

        auto args = ToArguments(value);

        auto overload = registry_.match(name.value(), args);
        if (overload == nullptr)
        {
            if (registry_.contains(name.value()))
            {
                casket::error("option '{}' does not accept arguments ({}), expected one of:\n{}", name.value(),
                              DescribeArguments(args), registry_.describe(name.value()));
            }
            else
            {
                casket::error("unsupported option '{}'", name.value());
            }
            ec = Error::UnsupportedOption;
            failedOption = name.value();
            return;
        }

        try
        {
            overload->setter(builder, args);
        }
        catch (const std::exception& e)
        {
            casket::error("option '{}' failed: {}", name.value(), e.what());
            ec = Error::OptionInvocation;
            failedOption = name.value();
            return;
        }

        casket::debug("option '{}' applied", name.value());
    }
}

} // namespace peerlink::rpc
