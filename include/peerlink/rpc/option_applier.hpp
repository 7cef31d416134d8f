#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <peerlink/rpc/channel_builder.hpp>
#include <peerlink/rpc/option_registry.hpp>
#include <peerlink/rpc/properties.hpp>

namespace peerlink::rpc
{

/// @brief Applies `grpc.ChannelBuilderOption.<name>` and `grpc.NettyChannelBuilderOption.<name>` properties to a
/// channel builder.
class OptionApplier final
{
public:
    /// @brief Creates an applier owning a copy of @p registry.
    explicit OptionApplier(OptionRegistry registry);

    /// @brief Invokes the registered setter of every option property.
    ///
    /// A list value supplies the arguments, a scalar value supplies a single argument. The
    /// `forAddress` and `build` options are skipped.
    ///
    /// @param[in,out] builder Builder to configure.
    /// @param[in] properties Connection properties.
    /// @param[out] ec Error::UnsupportedOption when no registered setter accepts the arguments,
    ///                Error::OptionInvocation when the setter rejects them. Options are applied in
    ///                key order up to the failing one.
    void apply(ChannelBuilder& builder, const ConnectionProperties& properties, std::error_code& ec) const;

    /// @brief Same as above, also reporting the name of the option that failed in @p failedOption.
    void apply(ChannelBuilder& builder, const ConnectionProperties& properties, std::error_code& ec,
               std::string& failedOption) const;

    /// @brief Extracts the option name from a property key.
    ///
    /// @return Trimmed name, or an empty optional when @p key does not name an option.
    static std::optional<std::string> optionName(std::string_view key);

    static bool isReserved(std::string_view name) noexcept;

private:
    OptionRegistry registry_;
};

} // namespace peerlink::rpc
