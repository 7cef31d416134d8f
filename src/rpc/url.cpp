#include <algorithm>
#include <cctype>
#include <casket/utils/string.hpp>
#include <peerlink/rpc/url.hpp>
#include <peerlink/rpc/error_code.hpp>

namespace
{

constexpr std::string_view kSchemeSeparator{"://"};

bool IsValidHost(std::string_view host)
{
    return !host.empty() && std::none_of(host.begin(), host.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) || c == '/' || c == '@' || c == '?' || c == '#';
    });
}

} // namespace

namespace peerlink::rpc
{

Url::Url(std::string scheme, Protocol protocol, std::string host, uint16_t port)
    : scheme_(std::move(scheme))
    , protocol_(protocol)
    , host_(std::move(host))
    , port_(port)
{
}

std::optional<Url> Url::parse(std::string_view url, std::error_code& ec)
{
    ec.clear();

    auto pos = url.find(kSchemeSeparator);
    if (pos == std::string_view::npos || pos == 0)
    {
        ec = Error::InvalidUrl;
        return std::nullopt;
    }

    auto scheme = url.substr(0, pos);
    auto authority = url.substr(pos + kSchemeSeparator.size());

    // A trailing slash is tolerated, a path is not.
    if (!authority.empty() && authority.back() == '/')
    {
        authority.remove_suffix(1);
    }

    std::string_view host;
    std::string_view port;

    if (!authority.empty() && authority.front() == '[')
    {
        auto close = authority.find(']');
        if (close == std::string_view::npos || close + 1 >= authority.size() || authority[close + 1] != ':')
        {
            ec = Error::InvalidUrl;
            return std::nullopt;
        }
        host = authority.substr(1, close - 1);
        port = authority.substr(close + 2);
    }
    else
    {
        auto colon = authority.rfind(':');
        if (colon == std::string_view::npos)
        {
            ec = Error::InvalidUrl;
            return std::nullopt;
        }
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
        if (host.find(':') != std::string_view::npos)
        {
            ec = Error::InvalidUrl;
            return std::nullopt;
        }
    }

    if (!IsValidHost(host) || port.empty() ||
        !std::all_of(port.begin(), port.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
    {
        ec = Error::InvalidUrl;
        return std::nullopt;
    }

    Protocol protocol;
    if (casket::iequals(scheme, "grpc"))
    {
        protocol = Protocol::Plaintext;
    }
    else if (casket::iequals(scheme, "grpcs"))
    {
        protocol = Protocol::Encrypted;
    }
    else
    {
        ec = Error::UnsupportedProtocol;
        return std::nullopt;
    }

    // More than five digits is out of range whatever the value.
    if (port.size() > 5)
    {
        ec = Error::InvalidPort;
        return std::nullopt;
    }

    unsigned long portNumber{0};
    for (char c : port)
    {
        portNumber = portNumber * 10 + static_cast<unsigned long>(c - '0');
    }
    if (portNumber < 1 || portNumber > 65535)
    {
        ec = Error::InvalidPort;
        return std::nullopt;
    }

    return Url(std::string(scheme), protocol, std::string(host), static_cast<uint16_t>(portNumber));
}

std::string Url::toString() const
{
    std::string result(scheme_);
    result += kSchemeSeparator;
    if (host_.find(':') != std::string::npos)
    {
        result += '[';
        result += host_;
        result += ']';
    }
    else
    {
        result += host_;
    }
    result += ':';
    result += std::to_string(port_);
    return result;
}

} // namespace peerlink::rpc
