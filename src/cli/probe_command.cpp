#include <iostream>
#include <iomanip>

#include <casket/log/log_manager.hpp>
#include <casket/opt/option_builder.hpp>
#include <casket/opt/cmd_line_options_parser.hpp>
#include <casket/utils/hexlify.hpp>

#include <peerlink/cli/command_dispatcher.hpp>
#include <peerlink/rpc/endpoint_factory.hpp>
#include <peerlink/rpc/trust_context.hpp>

using namespace casket;
using namespace casket::opt;
using namespace peerlink::rpc;

namespace peerlink
{

static constexpr int columnWidth = 14;

struct Options
{
    std::string url;
    std::string pemFile;
    std::string clientKeyFile;
    std::string clientCertFile;
    std::string hostnameOverride;
    std::string sslProvider;
    std::string negotiationType;
    std::string configPath;
    std::string logLevel;
};

class ProbeCommand final : public cmd::Command
{
public:
    ProbeCommand()
    {
        // clang-format off
        parser_.add(
            OptionBuilder("help")
                .setDescription("Print help message")
                .build()
        );
        parser_.add(
            OptionBuilder("list-options")
                .setDescription("Print the channel options accepted as grpc.ChannelBuilderOption.<name>")
                .build()
        );
        parser_.add(
            OptionBuilder("url", Value(&options_.url))
                .setDescription("Peer address, grpc://host:port or grpcs://host:port")
                .setRequired()
                .build()
        );
        parser_.add(
            OptionBuilder("pem-file", Value(&options_.pemFile))
                .setDescription("Comma-separated list of CA certificate files")
                .build()
        );
        parser_.add(
            OptionBuilder("client-key-file", Value(&options_.clientKeyFile))
                .setDescription("Client private key for mutual TLS")
                .build()
        );
        parser_.add(
            OptionBuilder("client-cert-file", Value(&options_.clientCertFile))
                .setDescription("Client certificate for mutual TLS")
                .build()
        );
        parser_.add(
            OptionBuilder("hostname-override", Value(&options_.hostnameOverride))
                .setDescription("Authority the server certificate is validated against")
                .build()
        );
        parser_.add(
            OptionBuilder("trust-server-cert")
                .setDescription("Use the Subject CN of the CA certificate as authority")
                .build()
        );
        parser_.add(
            OptionBuilder("ssl-provider", Value(&options_.sslProvider))
                .setDescription("SSL provider: openSSL, JDK")
                .build()
        );
        parser_.add(
            OptionBuilder("negotiation-type", Value(&options_.negotiationType))
                .setDescription("Negotiation type: TLS, plainText")
                .build()
        );
        parser_.add(
            OptionBuilder("config", Value(&options_.configPath))
                .setDescription("Configuration file with default values")
                .build()
        );
        parser_.add(
            OptionBuilder("log-level", Value(&options_.logLevel))
                .setDescription("Log level: emerg, alert, crit, error, warn, notice, info, debug")
                .build()
        );
        // clang-format on
    }

    ~ProbeCommand() = default;

    void execute(const std::vector<std::string_view>& args) override
    {
        parser_.parse(args);
        if (parser_.isUsed("help"))
        {
            parser_.help(std::cout);
            return;
        }
        if (parser_.isUsed("list-options"))
        {
            const auto& registry = OptionRegistry::channelOptions();
            for (const auto& name : registry.names())
            {
                std::cout << registry.describe(name);
            }
            return;
        }
        parser_.validate();

        auto config = Config::fromEnvironment();
        if (!options_.configPath.empty())
        {
            config.loadFile(options_.configPath);
        }
        if (!options_.logLevel.empty())
        {
            config.setLogLevel(options_.logLevel);
        }

        LogManager::Instance().enable(Type::Console);
        LogManager::Instance().setLevel(ParseLogLevel(config.getLogLevel()));

        EndpointFactory factory(config, std::make_shared<AuthorityCache>());
        auto endpoint = factory.createEndpoint(options_.url, makeProperties());

        print(*endpoint);
    }

private:
    ConnectionProperties makeProperties() const
    {
        ConnectionProperties properties;

        setIfNotEmpty(properties, keys::kPemFile, options_.pemFile);
        setIfNotEmpty(properties, keys::kClientKeyFile, options_.clientKeyFile);
        setIfNotEmpty(properties, keys::kClientCertFile, options_.clientCertFile);
        setIfNotEmpty(properties, keys::kHostnameOverride, options_.hostnameOverride);
        setIfNotEmpty(properties, keys::kSslProvider, options_.sslProvider);
        setIfNotEmpty(properties, keys::kNegotiationType, options_.negotiationType);

        if (parser_.isUsed("trust-server-cert"))
        {
            properties.set(std::string(keys::kTrustServerCertificate), "true");
        }
        return properties;
    }

    static void setIfNotEmpty(ConnectionProperties& properties, std::string_view key, const std::string& value)
    {
        if (!value.empty())
        {
            properties.set(std::string(key), Scalar{value});
        }
    }

    static std::string_view securityMode(const ChannelBuilder& builder)
    {
        if (builder.isPlaintext())
        {
            return "plaintext";
        }
        else if (builder.getSslContext() == nullptr)
        {
            return "TLS (default trust roots)";
        }
        else if (builder.getSslContext()->hasClientIdentity())
        {
            return "mutual TLS";
        }
        return "TLS";
    }

    static void print(const Endpoint& endpoint)
    {
        const auto& builder = endpoint.getChannelBuilder();
        auto digest = endpoint.getClientTLSCertificateDigest();

        // clang-format off
        std::cout << std::left
                  << std::setw(columnWidth) << "Host" << endpoint.getHost() << std::endl
                  << std::setw(columnWidth) << "Port" << endpoint.getPort() << std::endl
                  << std::setw(columnWidth) << "Protocol" << toString(endpoint.getProtocol()) << std::endl
                  << std::setw(columnWidth) << "Security" << securityMode(builder) << std::endl
                  << std::setw(columnWidth) << "Authority" << endpoint.getAuthority().value_or("-") << std::endl
                  << std::setw(columnWidth) << "Client cert" << (digest ? casket::hexlify(digest.value()) : "-") << std::endl;
        // clang-format on
    }

private:
    CmdLineOptionsParser parser_;
    Options options_;
};

REGISTER_COMMAND("probe", "Build an endpoint descriptor and print it", ProbeCommand);

} // namespace peerlink
