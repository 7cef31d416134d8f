#pragma once
#include <string>
#include <system_error>
#include <casket/utils/singleton.hpp>

namespace peerlink::crypto
{

/// @brief Error category for errors reported by the OpenSSL library.
class ErrorCategory final : public casket::utils::Singleton<ErrorCategory>,
                            public std::error_category
{
public:
    /// @brief Gets the name of the error category.
    /// @return The name of the error category.
    const char* name() const noexcept override;

    /// @brief Gets the error message corresponding to an error value.
    /// @param value The packed OpenSSL error.
    /// @return The error message.
    std::string message(int value) const override;
};

} // namespace peerlink::crypto
