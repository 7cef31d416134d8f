#include <casket/log/log_manager.hpp>
#include <casket/utils/string.hpp>

#include <peerlink/crypto/asymm_key.hpp>
#include <peerlink/crypto/bio.hpp>
#include <peerlink/crypto/cert.hpp>
#include <peerlink/crypto/exception.hpp>

#include <peerlink/rpc/credential_resolver.hpp>
#include <peerlink/rpc/error_code.hpp>

using namespace peerlink::crypto;

namespace peerlink::rpc
{

std::optional<Bytes> CredentialResolver::readFile(const std::filesystem::path& path, std::error_code& ec)
{
    try
    {
        return BioTraits::readFile(path);
    }
    catch (const CryptoException& e)
    {
        casket::error("cannot read '{}': {}", path.c_str(), e.what());
        ec = Error::UnreadableFile;
    }
    return std::nullopt;
}

std::optional<Bytes> CredentialResolver::resolveTrustBytes(const ConnectionProperties& properties,
                                                            std::error_code& ec)
{
    Bytes result;

    auto pemBytes = properties.getBytes(keys::kPemBytes);
    if (pemBytes.has_value())
    {
        result = std::move(pemBytes.value());
    }
    else if (properties.contains(keys::kPemBytes))
    {
        casket::error("property '{}' must hold bytes or a string", keys::kPemBytes);
        ec = Error::InvalidTrustSource;
        return std::nullopt;
    }

    auto pemFiles = properties.getString(keys::kPemFile);
    if (!pemFiles.has_value() && properties.contains(keys::kPemFile))
    {
        casket::error("property '{}' must hold a comma-separated list of paths", keys::kPemFile);
        ec = Error::InvalidTrustSource;
        return std::nullopt;
    }
    else if (pemFiles.has_value())
    {
        for (const auto& entry : casket::split(pemFiles.value(), ","))
        {
            std::string path(entry);
            casket::ltrim(path);
            casket::rtrim(path);
            if (path.empty())
            {
                continue;
            }

            auto content = readFile(path, ec);
            if (ec)
            {
                return std::nullopt;
            }
            result.insert(result.end(), content->begin(), content->end());
        }
    }

    if (result.empty())
    {
        return std::nullopt;
    }
    return result;
}

CredentialBundle CredentialResolver::resolve(const ConnectionProperties& properties, std::error_code& ec)
{
    ec.clear();

    CredentialBundle bundle;
    bundle.caTrustBytes = resolveTrustBytes(properties, ec);
    if (ec)
    {
        return {};
    }

    const bool keyFile = properties.contains(keys::kClientKeyFile);
    const bool certFile = properties.contains(keys::kClientCertFile);
    const bool keyBytes = properties.contains(keys::kClientKeyBytes);
    const bool certBytes = properties.contains(keys::kClientCertBytes);

    if (keyFile && keyBytes)
    {
        casket::error("properties '{}' and '{}' are mutually exclusive", keys::kClientKeyFile,
                      keys::kClientKeyBytes);
        ec = Error::ConflictingKeySources;
        return {};
    }
    if (certFile && certBytes)
    {
        casket::error("properties '{}' and '{}' are mutually exclusive", keys::kClientCertFile,
                      keys::kClientCertBytes);
        ec = Error::ConflictingCertSources;
        return {};
    }

    std::optional<Bytes> key;
    std::optional<Bytes> cert;

    if (keyFile || certFile)
    {
        auto keyPath = properties.getString(keys::kClientKeyFile);
        auto certPath = properties.getString(keys::kClientCertFile);
        if (!keyPath.has_value() || !certPath.has_value())
        {
            casket::error("properties '{}' and '{}' must both be set to file paths", keys::kClientKeyFile,
                          keys::kClientCertFile);
            ec = Error::PartialFileCredentials;
            return {};
        }

        key = readFile(keyPath.value(), ec);
        if (ec)
        {
            return {};
        }
        cert = readFile(certPath.value(), ec);
        if (ec)
        {
            return {};
        }
        casket::debug("client identity loaded from '{}' and '{}'", keyPath.value(), certPath.value());
    }
    else if (keyBytes || certBytes)
    {
        key = properties.getBytes(keys::kClientKeyBytes);
        cert = properties.getBytes(keys::kClientCertBytes);
        if (!key.has_value() || !cert.has_value())
        {
            casket::error("properties '{}' and '{}' must both be set to byte values", keys::kClientKeyBytes,
                          keys::kClientCertBytes);
            ec = Error::PartialBytesCredentials;
            return {};
        }
    }

    if (key.has_value() && cert.has_value())
    {
        try
        {
            bundle.clientKey = AsymmKey::privateKeyFromPemBytes(key.value());
        }
        catch (const CryptoException& e)
        {
            casket::error("cannot decode client private key: {}", e.what());
            ec = Error::PrivateKeyDecoding;
            return {};
        }

        try
        {
            bundle.clientCertificates.emplace_back(Cert::fromPemBytes(cert.value()));
        }
        catch (const CryptoException& e)
        {
            casket::error("cannot decode client certificate: {}", e.what());
            ec = Error::CertificateDecoding;
            return {};
        }

        bundle.clientCertificatePEM = std::move(cert);
    }

    return bundle;
}

} // namespace peerlink::rpc
