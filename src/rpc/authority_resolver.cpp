#include <casket/log/log_manager.hpp>
#include <casket/utils/exception.hpp>

#include <peerlink/crypto/cert.hpp>
#include <peerlink/crypto/cert_name.hpp>
#include <peerlink/crypto/exception.hpp>

#include <peerlink/rpc/authority_resolver.hpp>

using namespace peerlink::crypto;

namespace peerlink::rpc
{

AuthorityResolver::AuthorityResolver(std::shared_ptr<AuthorityCache> cache)
    : cache_(std::move(cache))
{
    casket::ThrowIfTrue(cache_ == nullptr, "authority cache is not set");
}

std::optional<std::string> AuthorityResolver::resolve(const ConnectionProperties& properties,
                                                      const std::optional<Bytes>& caTrustBytes) const
{
    auto hostnameOverride = properties.getString(keys::kHostnameOverride);
    if (hostnameOverride.has_value())
    {
        return hostnameOverride;
    }

    auto trustServerCertificate = properties.getString(keys::kTrustServerCertificate);
    if (trustServerCertificate != "true" || !caTrustBytes.has_value() || caTrustBytes->empty())
    {
        return std::nullopt;
    }

    return lookupCommonName(caTrustBytes.value());
}

std::optional<std::string> AuthorityResolver::lookupCommonName(const Bytes& caTrustBytes) const
{
    const std::string key(caTrustBytes.begin(), caTrustBytes.end());

    auto cached = cache_->find(key);
    if (cached.has_value())
    {
        return cached;
    }

    try
    {
        auto cert = Cert::fromPemBytes(caTrustBytes);
        auto subject = Cert::subjectName(cert);
        auto commonName = CertName::commonName(subject);
        if (!commonName.has_value())
        {
            casket::error("CA certificate has no Subject CN. Try setting it specifically with the '{}' property",
                          keys::kHostnameOverride);
            return std::nullopt;
        }

        casket::debug("authority '{}' resolved from CA certificate", commonName.value());
        cache_->insert(key, commonName.value());
        return commonName;
    }
    catch (const CryptoException& e)
    {
        casket::error("Error getting Subject CN from certificate ({}). Try setting it specifically with the '{}' "
                      "property",
                      e.what(), keys::kHostnameOverride);
    }
    return std::nullopt;
}

} // namespace peerlink::rpc
