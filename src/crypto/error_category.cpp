#include <openssl/err.h>
#include <peerlink/crypto/error_category.hpp>

namespace peerlink::crypto
{

const char* ErrorCategory::name() const noexcept
{
    return "OpenSSL";
}

std::string ErrorCategory::message(int value) const
{
    const auto packed = static_cast<unsigned long>(value);
    const char* reason = ::ERR_reason_error_string(packed);
    if (!reason)
    {
        return "OpenSSL error";
    }

    std::string result(reason);
    const char* lib = ::ERR_lib_error_string(packed);
    if (lib)
    {
        result += " (";
        result += lib;
        result += ")";
    }
    return result;
}

} // namespace peerlink::crypto
