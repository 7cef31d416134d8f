#include <peerlink/rpc/properties.hpp>

namespace peerlink::rpc
{

ConnectionProperties::ConnectionProperties(std::initializer_list<Storage::value_type> init)
    : entries_(init)
{
}

ConnectionProperties& ConnectionProperties::set(std::string key, Scalar value)
{
    entries_.insert_or_assign(std::move(key), PropertyValue{std::move(value)});
    return *this;
}

ConnectionProperties& ConnectionProperties::set(std::string key, ScalarList values)
{
    entries_.insert_or_assign(std::move(key), PropertyValue{std::move(values)});
    return *this;
}

ConnectionProperties& ConnectionProperties::set(std::string key, const char* value)
{
    return set(std::move(key), Scalar{std::string(value)});
}

bool ConnectionProperties::contains(std::string_view key) const
{
    return entries_.find(key) != entries_.end();
}

const PropertyValue* ConnectionProperties::find(std::string_view key) const
{
    auto it = entries_.find(key);
    return it != entries_.end() ? &it->second : nullptr;
}

std::optional<std::string> ConnectionProperties::getString(std::string_view key) const
{
    auto value = find(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }

    auto scalar = std::get_if<Scalar>(value);
    if (scalar == nullptr)
    {
        return std::nullopt;
    }

    auto str = std::get_if<std::string>(scalar);
    if (str == nullptr)
    {
        return std::nullopt;
    }
    return *str;
}

std::optional<Bytes> ConnectionProperties::getBytes(std::string_view key) const
{
    auto value = find(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }

    auto scalar = std::get_if<Scalar>(value);
    if (scalar == nullptr)
    {
        return std::nullopt;
    }

    if (auto bytes = std::get_if<Bytes>(scalar))
    {
        return *bytes;
    }
    else if (auto str = std::get_if<std::string>(scalar))
    {
        return Bytes(str->begin(), str->end());
    }
    return std::nullopt;
}

std::string_view TypeName(const Scalar& value) noexcept
{
    switch (value.index())
    {
    case 0:
        return "null";
    case 1:
        return "bool";
    case 2:
        return "int32";
    case 3:
        return "int64";
    case 4:
        return "double";
    case 5:
        return "string";
    case 6:
        return "bytes";
    case 7:
        return "enum";
    default:
        return "unknown";
    }
}

} // namespace peerlink::rpc
