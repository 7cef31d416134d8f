/// @file
/// @brief Registry of the channel options that can be set by name.

#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <peerlink/rpc/channel_builder.hpp>
#include <peerlink/rpc/properties.hpp>

namespace peerlink::rpc
{

using Arguments = std::vector<Scalar>;

/// @brief Declared parameter of a registered option.
struct Parameter
{
    /// Parameter type name as shown in diagnostics: bool, int32, int64, double, string or an enumeration name.
    std::string_view typeName;

    /// Checks that an argument can be passed to the parameter.
    bool (*accepts)(const Scalar&);
};

/// @brief Returns the enumeration type named by @p type, dropping any nested qualifier after '.' or '$'.
std::string_view EnumTypeName(std::string_view type) noexcept;

template <typename T>
struct ArgTraits;

template <>
struct ArgTraits<bool>
{
    static constexpr std::string_view kName{"bool"};

    static bool accepts(const Scalar& arg)
    {
        return std::holds_alternative<bool>(arg);
    }

    static bool convert(const Scalar& arg)
    {
        return std::get<bool>(arg);
    }
};

template <>
struct ArgTraits<int32_t>
{
    static constexpr std::string_view kName{"int32"};

    static bool accepts(const Scalar& arg)
    {
        if (std::holds_alternative<int32_t>(arg))
        {
            return true;
        }
        else if (auto value = std::get_if<int64_t>(&arg))
        {
            return *value >= std::numeric_limits<int32_t>::min() && *value <= std::numeric_limits<int32_t>::max();
        }
        return false;
    }

    static int32_t convert(const Scalar& arg)
    {
        if (auto value = std::get_if<int64_t>(&arg))
        {
            return static_cast<int32_t>(*value);
        }
        return std::get<int32_t>(arg);
    }
};

template <>
struct ArgTraits<int64_t>
{
    static constexpr std::string_view kName{"int64"};

    static bool accepts(const Scalar& arg)
    {
        return std::holds_alternative<int32_t>(arg) || std::holds_alternative<int64_t>(arg);
    }

    static int64_t convert(const Scalar& arg)
    {
        if (auto value = std::get_if<int32_t>(&arg))
        {
            return *value;
        }
        return std::get<int64_t>(arg);
    }
};

template <>
struct ArgTraits<double>
{
    static constexpr std::string_view kName{"double"};

    static bool accepts(const Scalar& arg)
    {
        return std::holds_alternative<double>(arg) || std::holds_alternative<int32_t>(arg) ||
               std::holds_alternative<int64_t>(arg);
    }

    static double convert(const Scalar& arg)
    {
        if (auto value = std::get_if<int32_t>(&arg))
        {
            return *value;
        }
        else if (auto value = std::get_if<int64_t>(&arg))
        {
            return static_cast<double>(*value);
        }
        return std::get<double>(arg);
    }
};

template <>
struct ArgTraits<std::string>
{
    static constexpr std::string_view kName{"string"};

    static bool accepts(const Scalar& arg)
    {
        return std::holds_alternative<std::string>(arg);
    }

    static std::string convert(const Scalar& arg)
    {
        return std::get<std::string>(arg);
    }
};

/// @brief Enumeration argument: an EnumValue of the declared type whose enumerator is known.
template <typename E, std::string_view const& Name, std::optional<E> (*Parse)(std::string_view)>
struct EnumArgTraits
{
    static constexpr std::string_view kName{Name};

    static bool accepts(const Scalar& arg)
    {
        auto value = std::get_if<EnumValue>(&arg);
        return value != nullptr && EnumTypeName(value->type) == kName && Parse(value->name).has_value();
    }

    static E convert(const Scalar& arg)
    {
        return Parse(std::get<EnumValue>(arg).name).value();
    }
};

inline constexpr std::string_view kTimeUnitTypeName{"TimeUnit"};
inline constexpr std::string_view kNegotiationTypeTypeName{"NegotiationType"};

/// @brief Parses a NegotiationType enumerator name, ignoring case.
std::optional<NegotiationType> ParseNegotiationTypeName(std::string_view name) noexcept;

template <>
struct ArgTraits<TimeUnit> : EnumArgTraits<TimeUnit, kTimeUnitTypeName, &ParseTimeUnit>
{
};

template <>
struct ArgTraits<NegotiationType>
    : EnumArgTraits<NegotiationType, kNegotiationTypeTypeName, &ParseNegotiationTypeName>
{
};

/// @brief Maps option names to typed setters of ChannelBuilder.
class OptionRegistry final
{
public:
    using Setter = std::function<void(ChannelBuilder&, const Arguments&)>;

    struct Overload
    {
        std::vector<Parameter> signature;
        Setter setter;

        /// @brief Checks arity and the type of every argument.
        bool matches(const Arguments& args) const;

        std::string toString(std::string_view name) const;
    };

    OptionRegistry() = default;

    /// @brief Registers a ChannelBuilder setter as option @p name.
    ///
    /// Several setters may share one name as long as their signatures differ.
    template <typename... Args>
    OptionRegistry& add(std::string name, ChannelBuilder& (ChannelBuilder::*method)(Args...))
    {
        Overload overload;
        overload.signature = {Parameter{ArgTraits<std::decay_t<Args>>::kName,
                                        &ArgTraits<std::decay_t<Args>>::accepts}...};
        overload.setter = [method](ChannelBuilder& builder, const Arguments& args) {
            invoke(builder, method, args, std::index_sequence_for<Args...>{});
        };
        options_[std::move(name)].push_back(std::move(overload));
        return *this;
    }

    bool contains(std::string_view name) const;

    /// @brief Finds the overload of @p name accepting @p args.
    ///
    /// @return nullptr when the name is unknown or no overload accepts the arguments.
    const Overload* match(std::string_view name, const Arguments& args) const;

    /// @brief Lists the registered signatures of @p name, one per line.
    std::string describe(std::string_view name) const;

    std::vector<std::string> names() const;

    /// @brief Registry of every tunable ChannelBuilder setter.
    static const OptionRegistry& channelOptions();

private:
    template <typename... Args, std::size_t... I>
    static void invoke(ChannelBuilder& builder, ChannelBuilder& (ChannelBuilder::*method)(Args...),
                       const Arguments& args, std::index_sequence<I...>)
    {
        (void)args;
        (builder.*method)(ArgTraits<std::decay_t<Args>>::convert(args[I])...);
    }

private:
    std::map<std::string, std::vector<Overload>, std::less<>> options_;
};

} // namespace peerlink::rpc
