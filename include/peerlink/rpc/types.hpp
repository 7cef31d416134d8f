#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace peerlink::rpc
{

using Bytes = std::vector<uint8_t>;

enum class Protocol
{
    Plaintext, ///< grpc://
    Encrypted, ///< grpcs://
};

enum class SslProvider
{
    OpenSsl,
    Jdk,
};

enum class NegotiationType
{
    Tls,
    Plaintext,
};

enum class TimeUnit
{
    Nanoseconds,
    Microseconds,
    Milliseconds,
    Seconds,
    Minutes,
    Hours,
    Days,
};

std::string_view toString(Protocol protocol) noexcept;

std::string_view toString(SslProvider provider) noexcept;

std::string_view toString(NegotiationType type) noexcept;

std::string_view toString(TimeUnit unit) noexcept;

/// @brief Parses the property spelling of an SSL provider: "openSSL" or "JDK".
std::optional<SslProvider> ParseSslProvider(std::string_view value) noexcept;

/// @brief Parses the property spelling of a negotiation type: "TLS" or "plainText".
std::optional<NegotiationType> ParseNegotiationType(std::string_view value) noexcept;

/// @brief Parses a time unit name such as "SECONDS" or "Seconds" (case-insensitive).
std::optional<TimeUnit> ParseTimeUnit(std::string_view value) noexcept;

/// @brief Converts @p value in @p unit to nanoseconds, saturating at the limits of the representation.
std::chrono::nanoseconds ToNanoseconds(int64_t value, TimeUnit unit) noexcept;

} // namespace peerlink::rpc
