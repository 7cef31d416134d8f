/// @file
/// @brief Typed key-value properties supplied by callers to describe a connection.

#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <peerlink/rpc/types.hpp>

namespace peerlink::rpc
{

namespace keys
{

inline constexpr std::string_view kPemBytes{"pemBytes"};
inline constexpr std::string_view kPemFile{"pemFile"};
inline constexpr std::string_view kHostnameOverride{"hostnameOverride"};
inline constexpr std::string_view kTrustServerCertificate{"trustServerCertificate"};
inline constexpr std::string_view kClientKeyFile{"clientKeyFile"};
inline constexpr std::string_view kClientCertFile{"clientCertFile"};
inline constexpr std::string_view kClientKeyBytes{"clientKeyBytes"};
inline constexpr std::string_view kClientCertBytes{"clientCertBytes"};
inline constexpr std::string_view kSslProvider{"sslProvider"};
inline constexpr std::string_view kNegotiationType{"negotiationType"};
inline constexpr std::string_view kChannelOptionPrefix{"grpc.ChannelBuilderOption."};
inline constexpr std::string_view kNettyChannelOptionPrefix{"grpc.NettyChannelBuilderOption."};

} // namespace keys

/// @brief Enumeration value carried by a property: declared type name plus enumerator name.
struct EnumValue
{
    std::string type;
    std::string name;
};

inline bool operator==(const EnumValue& a, const EnumValue& b)
{
    return a.type == b.type && a.name == b.name;
}

using Scalar = std::variant<std::monostate, bool, int32_t, int64_t, double, std::string, Bytes, EnumValue>;

using ScalarList = std::vector<Scalar>;

using PropertyValue = std::variant<Scalar, ScalarList>;

/// @brief Connection properties: string keys mapped to a scalar or an ordered list of scalars.
class ConnectionProperties final
{
public:
    using Storage = std::map<std::string, PropertyValue, std::less<>>;

    ConnectionProperties() = default;

    ConnectionProperties(std::initializer_list<Storage::value_type> init);

    ConnectionProperties& set(std::string key, Scalar value);

    ConnectionProperties& set(std::string key, ScalarList values);

    ConnectionProperties& set(std::string key, const char* value);

    /// @brief Reports whether @p key is present, whatever its value type.
    bool contains(std::string_view key) const;

    const PropertyValue* find(std::string_view key) const;

    /// @brief Gets a string value.
    ///
    /// @return Empty optional when @p key is absent or does not hold a string scalar.
    std::optional<std::string> getString(std::string_view key) const;

    /// @brief Gets a byte value; string scalars yield their characters.
    std::optional<Bytes> getBytes(std::string_view key) const;

    const Storage& entries() const noexcept
    {
        return entries_;
    }

    bool empty() const noexcept
    {
        return entries_.empty();
    }

private:
    Storage entries_;
};

/// @brief Returns a printable name of the type held by @p value.
std::string_view TypeName(const Scalar& value) noexcept;

} // namespace peerlink::rpc
