#include <casket/log/log_manager.hpp>
#include <casket/utils/exception.hpp>

#include <peerlink/rpc/endpoint_factory.hpp>
#include <peerlink/rpc/credential_resolver.hpp>
#include <peerlink/rpc/trust_context.hpp>
#include <peerlink/rpc/error_code.hpp>
#include <peerlink/rpc/exception.hpp>

namespace peerlink::rpc
{

std::string_view toString(AssemblyState state) noexcept
{
    switch (state)
    {
    case AssemblyState::ParsingUrl:
        return "ParsingUrl";
    case AssemblyState::ResolvingCredentials:
        return "ResolvingCredentials";
    case AssemblyState::SkipTrust:
        return "SkipTrust";
    case AssemblyState::BuildingTrust:
        return "BuildingTrust";
    case AssemblyState::ApplyingOptions:
        return "ApplyingOptions";
    case AssemblyState::Ready:
        return "Ready";
    case AssemblyState::Failed:
        return "Failed";
    }
    return "Unknown";
}

EndpointFactory::EndpointFactory()
    : EndpointFactory(Config(), std::make_shared<AuthorityCache>())
{
}

EndpointFactory::EndpointFactory(Config config, std::shared_ptr<AuthorityCache> cache,
                                 OptionRegistry registry)
    : config_(std::move(config))
    , authorityResolver_(std::move(cache))
    , optionApplier_(std::move(registry))
{
}

EndpointFactory::~EndpointFactory() noexcept
{
}

void EndpointFactory::setStateObserver(StateObserver observer)
{
    observer_ = std::move(observer);
}

void EndpointFactory::transition(std::string_view url, AssemblyState state) const
{
    casket::debug("endpoint '{}': {}", url, toString(state));
    if (observer_)
    {
        observer_(state);
    }
}

std::unique_ptr<Endpoint> EndpointFactory::createEndpoint(std::string_view url,
                                                          const ConnectionProperties& properties) const
{
    std::error_code ec;
    std::string reason;

    auto endpoint = assemble(url, properties, ec, reason);
    ThrowIfError(ec, casket::format("endpoint '{}': {}", url, reason));
    return endpoint;
}

std::unique_ptr<Endpoint> EndpointFactory::createEndpoint(std::string_view url,
                                                          const ConnectionProperties& properties,
                                                          std::error_code& ec) const
{
    std::string reason;
    auto endpoint = assemble(url, properties, ec, reason);
    if (ec)
    {
        return nullptr;
    }
    return endpoint;
}

std::unique_ptr<Endpoint> EndpointFactory::assemble(std::string_view url, const ConnectionProperties& properties,
                                                    std::error_code& ec, std::string& reason) const
{
    ec.clear();

    auto fail = [&](std::string what) -> std::unique_ptr<Endpoint> {
        reason = std::move(what);
        casket::error("endpoint '{}': {} ({})", url, reason, ec.message());
        transition(url, AssemblyState::Failed);
        return nullptr;
    };

    transition(url, AssemblyState::ParsingUrl);

    auto address = Url::parse(url, ec);
    if (ec == Error::UnsupportedProtocol)
    {
        return fail("invalid protocol");
    }
    else if (ec)
    {
        return fail("invalid URL");
    }

    auto builder = ChannelBuilder::forAddress(address->getHost(), address->getPort());
    std::optional<std::string> authority;
    std::optional<Bytes> clientCertificatePEM;

    if (address->getProtocol() == Protocol::Plaintext)
    {
        builder.usePlaintext();
    }
    else
    {
        transition(url, AssemblyState::ResolvingCredentials);

        auto credentials = CredentialResolver::resolve(properties, ec);
        if (ec)
        {
            return fail("cannot resolve TLS credentials");
        }

        auto provider = properties.getString(keys::kSslProvider).value_or(config_.getDefaultSslProvider());
        auto sslProvider = ParseSslProvider(provider);
        if (!sslProvider.has_value())
        {
            ec = Error::InvalidSslProvider;
            return fail(casket::format("property of sslProvider has to be either openSSL or JDK. value: '{}'",
                                       provider));
        }

        auto negotiation =
            properties.getString(keys::kNegotiationType).value_or(config_.getDefaultNegotiationType());
        auto negotiationType = ParseNegotiationType(negotiation);
        if (!negotiationType.has_value())
        {
            ec = Error::InvalidNegotiationType;
            return fail(casket::format("property of negotiationType has to be either TLS or plainText. value: '{}'",
                                       negotiation));
        }

        builder.sslProvider(sslProvider.value());
        clientCertificatePEM = credentials.clientCertificatePEM;

        if (!credentials.hasTrustBytes())
        {
            transition(url, AssemblyState::SkipTrust);
            casket::warning("endpoint '{}' is grpcs with no CA certificates, default trust roots are used", url);
            builder.useTransportSecurity();
        }
        else
        {
            transition(url, AssemblyState::BuildingTrust);

            authority = authorityResolver_.resolve(properties, credentials.caTrustBytes);

            auto context = TrustContext::build(credentials.caTrustBytes.value(), credentials, ec);
            if (ec)
            {
                return fail("cannot build TLS trust context");
            }
            builder.sslContext(std::move(context));

            if (negotiationType == NegotiationType::Tls)
            {
                builder.useTransportSecurity();
            }
            else
            {
                builder.usePlaintext();
            }

            if (authority.has_value() && authority->empty())
            {
                casket::warning("endpoint '{}': empty authority override ignored", url);
                authority.reset();
            }
            if (authority.has_value())
            {
                casket::debug("endpoint '{}': using CN overrideAuthority '{}'", url, authority.value());
                builder.overrideAuthority(authority.value());
            }
        }
    }

    transition(url, AssemblyState::ApplyingOptions);

    std::string failedOption;
    optionApplier_.apply(builder, properties, ec, failedOption);
    if (ec)
    {
        return fail(casket::format("cannot apply option '{}'", failedOption));
    }

    transition(url, AssemblyState::Ready);

    return std::make_unique<Endpoint>(std::string(url), std::move(address.value()), std::move(builder),
                                      std::move(authority), std::move(clientCertificatePEM));
}

} // namespace peerlink::rpc
