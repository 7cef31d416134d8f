/// @file
/// @brief Declaration of error handling functions for cryptography.

#pragma once
#include <system_error>

namespace peerlink::crypto
{

/// @brief Translates an OpenSSL packed error to a std::error_code.
/// @param error The error code to translate.
/// @return The corresponding std::error_code.
std::error_code TranslateError(unsigned long error);

/// @brief Pops the earliest error from the OpenSSL error queue.
/// @return The error as a std::error_code, or a generic failure code if the queue is empty.
std::error_code GetLastError();

/// @brief Drops every pending error from the OpenSSL error queue.
void ClearErrors() noexcept;

} // namespace peerlink::crypto
