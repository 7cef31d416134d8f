#pragma once
#include <cstdint>
#include <string_view>
#include <vector>

namespace peerlink::crypto
{

class Base64 final
{
public:
    /// @brief Decodes standard (RFC 4648) base64 text with optional padding.
    ///
    /// @param[in] input Base64 text. Line breaks are accepted, other characters outside the alphabet are not.
    ///
    /// @return Decoded bytes.
    ///
    /// @throw CryptoException if @p input is not valid base64.
    static std::vector<uint8_t> decode(std::string_view input);
};

} // namespace peerlink::crypto
