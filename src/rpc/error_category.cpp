#include <peerlink/rpc/error_category.hpp>
#include <peerlink/rpc/error_code.hpp>

namespace peerlink::rpc
{

const char* ErrorCategory::name() const noexcept
{
    return "peerlink.rpc";
}

std::string ErrorCategory::message(int value) const
{
    switch (static_cast<Error>(value))
    {
    case Error::Success:
        return "success";
    case Error::InvalidUrl:
        return "malformed endpoint URL";
    case Error::InvalidPort:
        return "port out of range";
    case Error::UnsupportedProtocol:
        return "unsupported protocol";
    case Error::ConflictingKeySources:
        return "client key given both as a file and as bytes";
    case Error::ConflictingCertSources:
        return "client certificate given both as a file and as bytes";
    case Error::PartialFileCredentials:
        return "client key file and certificate file must be given together";
    case Error::PartialBytesCredentials:
        return "client key bytes and certificate bytes must be given together";
    case Error::UnreadableFile:
        return "cannot read file";
    case Error::InvalidTrustSource:
        return "CA certificate property has an unexpected value type";
    case Error::InvalidSslProvider:
        return "invalid SSL provider";
    case Error::InvalidNegotiationType:
        return "invalid negotiation type";
    case Error::PrivateKeyDecoding:
        return "cannot decode client private key";
    case Error::CertificateDecoding:
        return "cannot decode client certificate";
    case Error::TrustAnchorDecoding:
        return "cannot decode trust anchor certificate";
    case Error::TrustStoreFailure:
        return "cannot build trust store";
    case Error::UnexpectedTrustManagers:
        return "trust context does not hold exactly one trust anchor";
    case Error::UnsupportedOption:
        return "unsupported channel option";
    case Error::OptionInvocation:
        return "channel option rejected its arguments";
    }
    return "unknown error";
}

std::error_condition ErrorCategory::default_error_condition(int value) const noexcept
{
    auto e = static_cast<Error>(value);
    if (e == Error::Success)
    {
        return std::error_condition(value, *this);
    }
    return make_error_condition(GetErrorKind(e));
}

const char* ErrorKindCategory::name() const noexcept
{
    return "peerlink.rpc.kind";
}

std::string ErrorKindCategory::message(int value) const
{
    switch (static_cast<ErrorKind>(value))
    {
    case ErrorKind::Configuration:
        return "configuration error";
    case ErrorKind::UnsupportedProtocol:
        return "unsupported protocol";
    case ErrorKind::CredentialDecoding:
        return "credential decoding error";
    case ErrorKind::TrustConstruction:
        return "trust construction error";
    case ErrorKind::UnsupportedOption:
        return "unsupported option";
    case ErrorKind::OptionInvocation:
        return "option invocation error";
    }
    return "unknown error kind";
}

} // namespace peerlink::rpc
