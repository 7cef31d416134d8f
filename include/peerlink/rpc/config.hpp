#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <casket/log/log_manager.hpp>

namespace peerlink::rpc
{

/// @brief Process-wide defaults for endpoint construction.
class Config
{
public:
    static constexpr std::string_view kSslProviderKey{"peerlink.connection.default_ssl_provider"};
    static constexpr std::string_view kNegotiationTypeKey{"peerlink.connection.default_ssl_negotiation_type"};
    static constexpr std::string_view kLogLevelKey{"peerlink.log_level"};

    Config()
        : sslProvider_("openSSL")
        , negotiationType_("TLS")
        , logLevel_("warn")
    {
    }

    ~Config() noexcept
    {
    }

    /// @brief Reads `key = value` lines from @p path. Text after `#` is a comment.
    ///
    /// Unknown keys are skipped with a warning.
    ///
    /// @throw casket::RuntimeError if the file cannot be opened or a line has no `=`.
    void loadFile(const std::filesystem::path& path);

    /// @brief Overrides values from PEERLINK_* environment variables when they are set.
    void loadEnvironment();

    /// @brief Defaults overridden by the environment.
    static Config fromEnvironment();

    void setDefaultSslProvider(std::string provider)
    {
        sslProvider_ = std::move(provider);
    }

    const std::string& getDefaultSslProvider() const
    {
        return sslProvider_;
    }

    void setDefaultNegotiationType(std::string type)
    {
        negotiationType_ = std::move(type);
    }

    const std::string& getDefaultNegotiationType() const
    {
        return negotiationType_;
    }

    void setLogLevel(std::string level)
    {
        logLevel_ = std::move(level);
    }

    const std::string& getLogLevel() const
    {
        return logLevel_;
    }

private:
    bool setValue(std::string_view key, std::string value);

private:
    std::string sslProvider_;
    std::string negotiationType_;
    std::string logLevel_;
};

/// @brief Maps a log level name (emerg, alert, crit, error, warn, notice, info, debug) to casket::Level.
///
/// Unknown names map to casket::Level::Emergency.
casket::Level ParseLogLevel(std::string_view str);

} // namespace peerlink::rpc
