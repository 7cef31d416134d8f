#include <cctype>
#include <regex>
#include <string>

#include <peerlink/crypto/base64.hpp>
#include <peerlink/crypto/hash_traits.hpp>

#include <peerlink/rpc/identity_digest.hpp>

using namespace peerlink::crypto;

namespace peerlink::rpc
{

std::string StripCertificateArmor(std::string_view pem)
{
    static const std::regex kArmor("-+[ \\t]*(BEGIN|END)[ \\t]+CERTIFICATE[ \\t]*-+");

    auto body = std::regex_replace(std::string(pem), kArmor, "");

    std::string result;
    result.reserve(body.size());
    for (char c : body)
    {
        if (!std::isspace(static_cast<unsigned char>(c)))
        {
            result.push_back(c);
        }
    }
    return result;
}

Bytes ComputeIdentityDigest(const Bytes& certificatePem)
{
    std::string_view pem(reinterpret_cast<const char*>(certificatePem.data()), certificatePem.size());
    auto der = Base64::decode(StripCertificateArmor(pem));
    return HashTraits::sha256(der);
}

} // namespace peerlink::rpc
