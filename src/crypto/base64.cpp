#include <limits>
#include <openssl/evp.h>
#include <openssl/err.h>

#include <peerlink/crypto/base64.hpp>
#include <peerlink/crypto/pointers.hpp>
#include <peerlink/crypto/exception.hpp>
#include <peerlink/crypto/error_code.hpp>

namespace peerlink::crypto
{

std::vector<uint8_t> Base64::decode(std::string_view input)
{
    if (input.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "base64 input too large");
    }

    EncodeCtxPtr ctx{EVP_ENCODE_CTX_new()};
    ThrowIfTrue(ctx == nullptr, "EVP_ENCODE_CTX_new");
    EVP_DecodeInit(ctx);

    // Every 4 input characters yield at most 3 bytes.
    std::vector<uint8_t> output((input.size() / 4 + 1) * 3);
    int length{0};

    auto in = reinterpret_cast<const unsigned char*>(input.data());
    if (0 > EVP_DecodeUpdate(ctx, output.data(), &length, in, static_cast<int>(input.size())))
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "invalid base64 data");
    }

    int tail{0};
    if (0 > EVP_DecodeFinal(ctx, output.data() + length, &tail))
    {
        throw CryptoException(TranslateError(ERR_R_PASSED_INVALID_ARGUMENT), "truncated base64 data");
    }

    output.resize(static_cast<size_t>(length + tail));
    return output;
}

} // namespace peerlink::crypto
