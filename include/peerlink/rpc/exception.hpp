/// @file
/// @brief Exception raised when an endpoint cannot be assembled.

#pragma once
#include <string>
#include <string_view>
#include <system_error>
#include <peerlink/rpc/error_code.hpp>

namespace peerlink::rpc
{

class EndpointException final : public std::system_error
{
public:
    EndpointException(std::error_code ec, std::string_view what)
        : std::system_error(ec, std::string(what))
    {
    }
};

/// @brief Throws EndpointException if @p ec holds an error.
inline void ThrowIfError(const std::error_code& ec, std::string_view message)
{
    if (ec)
    {
        throw EndpointException(ec, message);
    }
}

} // namespace peerlink::rpc
