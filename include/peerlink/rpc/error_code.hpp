/// @file
/// @brief Error codes reported while assembling an endpoint.

#pragma once
#include <system_error>
#include <type_traits>

namespace peerlink::rpc
{

/// @brief Concrete failure reported by one stage of endpoint assembly.
enum class Error
{
    Success = 0,

    InvalidUrl,
    InvalidPort,
    UnsupportedProtocol,

    ConflictingKeySources,
    ConflictingCertSources,
    PartialFileCredentials,
    PartialBytesCredentials,
    UnreadableFile,
    InvalidTrustSource,
    InvalidSslProvider,
    InvalidNegotiationType,

    PrivateKeyDecoding,
    CertificateDecoding,

    TrustAnchorDecoding,
    TrustStoreFailure,
    UnexpectedTrustManagers,

    UnsupportedOption,
    OptionInvocation,
};

/// @brief Class of failure, used to compare error codes without naming every concrete error.
enum class ErrorKind
{
    Configuration = 1,
    UnsupportedProtocol,
    CredentialDecoding,
    TrustConstruction,
    UnsupportedOption,
    OptionInvocation,
};

std::error_code make_error_code(Error e) noexcept;

std::error_condition make_error_condition(ErrorKind kind) noexcept;

/// @brief Maps a concrete error onto its kind.
ErrorKind GetErrorKind(Error e) noexcept;

} // namespace peerlink::rpc

namespace std
{

template <>
struct is_error_code_enum<peerlink::rpc::Error> : true_type
{
};

template <>
struct is_error_condition_enum<peerlink::rpc::ErrorKind> : true_type
{
};

} // namespace std
