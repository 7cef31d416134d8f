#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <peerlink/rpc/types.hpp>

namespace peerlink::rpc
{

/// @brief Parsed `protocol://host:port` endpoint address.
class Url final
{
public:
    /// @brief Parses @p url.
    ///
    /// The protocol is matched case-insensitively against `grpc` and `grpcs`. IPv6 hosts are
    /// written in brackets (`grpcs://[::1]:7051`) and are stored without them.
    ///
    /// @param[in] url Address to parse.
    /// @param[out] ec Error::InvalidUrl for a malformed address, Error::InvalidPort for a port outside
    ///                1..65535, Error::UnsupportedProtocol for any protocol other than grpc/grpcs.
    ///
    /// @return Parsed address, or an empty optional on failure.
    static std::optional<Url> parse(std::string_view url, std::error_code& ec);

    const std::string& getScheme() const noexcept
    {
        return scheme_;
    }

    Protocol getProtocol() const noexcept
    {
        return protocol_;
    }

    const std::string& getHost() const noexcept
    {
        return host_;
    }

    uint16_t getPort() const noexcept
    {
        return port_;
    }

    std::string toString() const;

private:
    Url(std::string scheme, Protocol protocol, std::string host, uint16_t port);

private:
    std::string scheme_;
    Protocol protocol_;
    std::string host_;
    uint16_t port_;
};

} // namespace peerlink::rpc
