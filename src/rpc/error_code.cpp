#include <peerlink/rpc/error_code.hpp>
#include <peerlink/rpc/error_category.hpp>

namespace peerlink::rpc
{

std::error_code make_error_code(Error e) noexcept
{
    return std::error_code{static_cast<int>(e), ErrorCategory::Instance()};
}

std::error_condition make_error_condition(ErrorKind kind) noexcept
{
    return std::error_condition{static_cast<int>(kind), ErrorKindCategory::Instance()};
}

ErrorKind GetErrorKind(Error e) noexcept
{
    switch (e)
    {
    case Error::UnsupportedProtocol:
        return ErrorKind::UnsupportedProtocol;

    case Error::PrivateKeyDecoding:
    case Error::CertificateDecoding:
        return ErrorKind::CredentialDecoding;

    case Error::TrustAnchorDecoding:
    case Error::TrustStoreFailure:
    case Error::UnexpectedTrustManagers:
        return ErrorKind::TrustConstruction;

    case Error::UnsupportedOption:
        return ErrorKind::UnsupportedOption;

    case Error::OptionInvocation:
        return ErrorKind::OptionInvocation;

    default:
        return ErrorKind::Configuration;
    }
}

} // namespace peerlink::rpc
