#include <cstdlib>
#include <fstream>
#include <casket/utils/exception.hpp>
#include <casket/utils/string.hpp>
#include <peerlink/rpc/config.hpp>

namespace
{

constexpr const char* kSslProviderEnv{"PEERLINK_DEFAULT_SSL_PROVIDER"};
constexpr const char* kNegotiationTypeEnv{"PEERLINK_DEFAULT_SSL_NEGOTIATION_TYPE"};
constexpr const char* kLogLevelEnv{"PEERLINK_LOG_LEVEL"};

} // namespace

namespace peerlink::rpc
{

void Config::loadFile(const std::filesystem::path& path)
{
    casket::ThrowIfFalse(std::filesystem::is_regular_file(path),
                         casket::format("invalid config path '{}'", path.c_str()));

    std::ifstream stream(path.c_str());
    casket::ThrowIfFalse(stream.is_open(), casket::format("failed to open '{}'", path.c_str()));

    std::string line{};
    std::size_t lineno{};

    while (std::getline(stream, line))
    {
        lineno++;

        auto pos = line.find_first_of('#');
        if (pos != std::string::npos)
        {
            line = line.substr(0, pos);
        }

        casket::ltrim(line);
        casket::rtrim(line);

        if (line.empty())
        {
            continue;
        }

        auto eq = line.find('=');
        casket::ThrowIfTrue(eq == std::string::npos, casket::format("invalid line #{}: {}", lineno, line));

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        casket::rtrim(key);
        casket::ltrim(value);

        if (!setValue(key, std::move(value)))
        {
            casket::warning("{}:{}: unknown key '{}' ignored", path.c_str(), lineno, key);
        }
    }
}

void Config::loadEnvironment()
{
    if (auto value = std::getenv(kSslProviderEnv))
    {
        sslProvider_ = value;
    }
    if (auto value = std::getenv(kNegotiationTypeEnv))
    {
        negotiationType_ = value;
    }
    if (auto value = std::getenv(kLogLevelEnv))
    {
        logLevel_ = value;
    }
}

Config Config::fromEnvironment()
{
    Config config;
    config.loadEnvironment();
    return config;
}

bool Config::setValue(std::string_view key, std::string value)
{
    if (key == kSslProviderKey)
    {
        sslProvider_ = std::move(value);
    }
    else if (key == kNegotiationTypeKey)
    {
        negotiationType_ = std::move(value);
    }
    else if (key == kLogLevelKey)
    {
        logLevel_ = std::move(value);
    }
    else
    {
        return false;
    }
    return true;
}

casket::Level ParseLogLevel(std::string_view str)
{
    if (casket::iequals(str, "alert"))
    {
        return casket::Level::Alert;
    }
    else if (casket::iequals(str, "crit"))
    {
        return casket::Level::Critical;
    }
    else if (casket::iequals(str, "error"))
    {
        return casket::Level::Error;
    }
    else if (casket::iequals(str, "warn"))
    {
        return casket::Level::Warning;
    }
    else if (casket::iequals(str, "notice"))
    {
        return casket::Level::Notice;
    }
    else if (casket::iequals(str, "info"))
    {
        return casket::Level::Info;
    }
    else if (casket::iequals(str, "debug"))
    {
        return casket::Level::Debug;
    }

    return casket::Level::Emergency;
}

} // namespace peerlink::rpc
