/// @file
/// @brief Declaration of the error categories for endpoint assembly.

#pragma once
#include <string>
#include <system_error>
#include <casket/utils/singleton.hpp>

namespace peerlink::rpc
{

/// @brief Category of the concrete errors listed in rpc::Error.
class ErrorCategory final : public casket::utils::Singleton<ErrorCategory>,
                            public std::error_category
{
public:
    /// @brief Gets the name of the error category.
    /// @return The name of the error category.
    const char* name() const noexcept override;

    /// @brief Gets the error message corresponding to an error value.
    /// @param value The error value.
    /// @return The error message.
    std::string message(int value) const override;

    /// @brief Maps an rpc::Error onto its rpc::ErrorKind condition.
    std::error_condition default_error_condition(int value) const noexcept override;
};

/// @brief Category of the error kinds listed in rpc::ErrorKind.
class ErrorKindCategory final : public casket::utils::Singleton<ErrorKindCategory>,
                                public std::error_category
{
public:
    const char* name() const noexcept override;

    std::string message(int value) const override;
};

} // namespace peerlink::rpc
