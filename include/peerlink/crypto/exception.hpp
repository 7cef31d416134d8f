/// @file
/// @brief Exception type for OpenSSL failures.

#pragma once

#include <string>
#include <string_view>
#include <system_error>

#include <peerlink/crypto/error_code.hpp>

namespace peerlink::crypto
{

/// @brief Raised when an OpenSSL primitive reports a failure.
///
/// The error code carries the first entry of the OpenSSL error queue at the
/// time of the failure, the message names the operation that failed.
class CryptoException final : public std::system_error
{
public:
    CryptoException(std::error_code ec, std::string_view what)
        : std::system_error(ec, std::string(what))
    {
    }
};

/// @brief Throws CryptoException built from the OpenSSL error queue.
///
/// @param[in] message Name of the failed operation.
///
[[noreturn]] inline void ThrowLastError(std::string_view message)
{
    auto ec = GetLastError();
    ClearErrors();
    throw CryptoException(ec, message);
}

/// @brief Throws an exception if @p expression is true.
///
/// @param[in] expression Result of the expression to check.
/// @param[in] message Name of the failed operation.
///
inline void ThrowIfTrue(bool expression, std::string_view message)
{
    if (expression)
    {
        ThrowLastError(message);
    }
}

/// @brief Throws an exception if @p expression is false.
///
/// @param[in] expression Result of the expression to check.
/// @param[in] message Name of the failed operation.
///
inline void ThrowIfFalse(bool expression, std::string_view message)
{
    ThrowIfTrue(!expression, message);
}

} // namespace peerlink::crypto
