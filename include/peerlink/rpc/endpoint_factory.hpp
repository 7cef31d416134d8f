/// @file
/// @brief Declaration of the EndpointFactory class.

#pragma once
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include <peerlink/rpc/authority_cache.hpp>
#include <peerlink/rpc/authority_resolver.hpp>
#include <peerlink/rpc/config.hpp>
#include <peerlink/rpc/endpoint.hpp>
#include <peerlink/rpc/option_applier.hpp>
#include <peerlink/rpc/option_registry.hpp>
#include <peerlink/rpc/properties.hpp>

namespace peerlink::rpc
{

/// @brief Stages of endpoint assembly.
enum class AssemblyState
{
    ParsingUrl,
    ResolvingCredentials,
    SkipTrust,
    BuildingTrust,
    ApplyingOptions,
    Ready,
    Failed,
};

std::string_view toString(AssemblyState state) noexcept;

/// @brief Builds endpoints from a URL and connection properties.
///
/// A factory may be shared by several threads. Endpoints built by one factory share its authority cache.
class EndpointFactory final
{
public:
    using StateObserver = std::function<void(AssemblyState)>;

    /// @brief Creates a factory with default configuration, a private authority cache and the
    /// channel option registry.
    EndpointFactory();

    EndpointFactory(Config config, std::shared_ptr<AuthorityCache> cache,
                    OptionRegistry registry = OptionRegistry::channelOptions());

    ~EndpointFactory() noexcept;

    /// @brief Builds an endpoint.
    ///
    /// @param[in] url Address in the `grpc://host:port` or `grpcs://host:port` form.
    /// @param[in] properties Connection properties.
    ///
    /// @return Endpoint ready to open a channel.
    ///
    /// @throw EndpointException naming the URL and the failed stage.
    std::unique_ptr<Endpoint> createEndpoint(std::string_view url, const ConnectionProperties& properties) const;

    /// @brief Builds an endpoint, reporting assembly errors through @p ec.
    ///
    /// @return Endpoint, or nullptr with @p ec set.
    std::unique_ptr<Endpoint> createEndpoint(std::string_view url, const ConnectionProperties& properties,
                                             std::error_code& ec) const;

    /// @brief Installs a callback invoked on every state transition. Used for diagnostics.
    void setStateObserver(StateObserver observer);

    const Config& getConfig() const noexcept
    {
        return config_;
    }

    const std::shared_ptr<AuthorityCache>& getAuthorityCache() const noexcept
    {
        return authorityResolver_.getCache();
    }

private:
    std::unique_ptr<Endpoint> assemble(std::string_view url, const ConnectionProperties& properties,
                                       std::error_code& ec, std::string& reason) const;

    void transition(std::string_view url, AssemblyState state) const;

private:
    Config config_;
    AuthorityResolver authorityResolver_;
    OptionApplier optionApplier_;
    StateObserver observer_;
};

} // namespace peerlink::rpc
