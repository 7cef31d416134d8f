#pragma once
#include <memory>
#include <optional>
#include <string>
#include <peerlink/rpc/authority_cache.hpp>
#include <peerlink/rpc/properties.hpp>

namespace peerlink::rpc
{

/// @brief Picks the authority name a server certificate is validated against.
class AuthorityResolver final
{
public:
    explicit AuthorityResolver(std::shared_ptr<AuthorityCache> cache);

    /// @brief Resolves the authority override.
    ///
    /// `hostnameOverride` wins when set. Otherwise, when `trustServerCertificate` is "true" and
    /// @p caTrustBytes is not empty, the Subject CN of the first CA certificate is used.
    ///
    /// A certificate that cannot be decoded, or has no CN, is logged and yields no override.
    std::optional<std::string> resolve(const ConnectionProperties& properties,
                                       const std::optional<Bytes>& caTrustBytes) const;

    const std::shared_ptr<AuthorityCache>& getCache() const noexcept
    {
        return cache_;
    }

private:
    std::optional<std::string> lookupCommonName(const Bytes& caTrustBytes) const;

private:
    std::shared_ptr<AuthorityCache> cache_;
};

} // namespace peerlink::rpc
