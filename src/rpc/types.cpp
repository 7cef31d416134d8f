#include <array>
#include <limits>
#include <utility>
#include <casket/utils/string.hpp>
#include <peerlink/rpc/types.hpp>

namespace
{

using namespace peerlink::rpc;

// clang-format off
constexpr std::array<std::pair<TimeUnit, std::string_view>, 7> gTimeUnits{{
    {TimeUnit::Nanoseconds,  "NANOSECONDS"},
    {TimeUnit::Microseconds, "MICROSECONDS"},
    {TimeUnit::Milliseconds, "MILLISECONDS"},
    {TimeUnit::Seconds,      "SECONDS"},
    {TimeUnit::Minutes,      "MINUTES"},
    {TimeUnit::Hours,        "HOURS"},
    {TimeUnit::Days,         "DAYS"},
}};
// clang-format on

} // namespace

namespace peerlink::rpc
{

std::string_view toString(Protocol protocol) noexcept
{
    switch (protocol)
    {
    case Protocol::Plaintext:
        return "grpc";
    case Protocol::Encrypted:
        return "grpcs";
    }
    return "unknown";
}

std::string_view toString(SslProvider provider) noexcept
{
    switch (provider)
    {
    case SslProvider::OpenSsl:
        return "openSSL";
    case SslProvider::Jdk:
        return "JDK";
    }
    return "unknown";
}

std::string_view toString(NegotiationType type) noexcept
{
    switch (type)
    {
    case NegotiationType::Tls:
        return "TLS";
    case NegotiationType::Plaintext:
        return "plainText";
    }
    return "unknown";
}

std::string_view toString(TimeUnit unit) noexcept
{
    for (const auto& [value, name] : gTimeUnits)
    {
        if (value == unit)
        {
            return name;
        }
    }
    return "unknown";
}

std::optional<SslProvider> ParseSslProvider(std::string_view value) noexcept
{
    if (value == "openSSL")
    {
        return SslProvider::OpenSsl;
    }
    else if (value == "JDK")
    {
        return SslProvider::Jdk;
    }
    return std::nullopt;
}

std::optional<NegotiationType> ParseNegotiationType(std::string_view value) noexcept
{
    if (value == "TLS")
    {
        return NegotiationType::Tls;
    }
    else if (value == "plainText")
    {
        return NegotiationType::Plaintext;
    }
    return std::nullopt;
}

std::optional<TimeUnit> ParseTimeUnit(std::string_view value) noexcept
{
    for (const auto& [unit, name] : gTimeUnits)
    {
        if (casket::iequals(value, name))
        {
            return unit;
        }
    }
    return std::nullopt;
}

std::chrono::nanoseconds ToNanoseconds(int64_t value, TimeUnit unit) noexcept
{
    int64_t factor{1};
    switch (unit)
    {
    case TimeUnit::Nanoseconds:
        factor = 1;
        break;
    case TimeUnit::Microseconds:
        factor = 1000;
        break;
    case TimeUnit::Milliseconds:
        factor = 1000 * 1000;
        break;
    case TimeUnit::Seconds:
        factor = 1000 * 1000 * 1000;
        break;
    case TimeUnit::Minutes:
        factor = 60LL * 1000 * 1000 * 1000;
        break;
    case TimeUnit::Hours:
        factor = 60LL * 60 * 1000 * 1000 * 1000;
        break;
    case TimeUnit::Days:
        factor = 24LL * 60 * 60 * 1000 * 1000 * 1000;
        break;
    }

    constexpr auto kMax = std::numeric_limits<int64_t>::max();
    constexpr auto kMin = std::numeric_limits<int64_t>::min();

    if (value > kMax / factor)
    {
        return std::chrono::nanoseconds(kMax);
    }
    else if (value < kMin / factor)
    {
        return std::chrono::nanoseconds(kMin);
    }
    return std::chrono::nanoseconds(value * factor);
}

} // namespace peerlink::rpc
