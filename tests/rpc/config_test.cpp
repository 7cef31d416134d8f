#include <cstdlib>
#include <gtest/gtest.h>
#include <casket/utils/exception.hpp>
#include <peerlink/rpc/config.hpp>

#include "../helpers/test_pki.hpp"

using namespace peerlink::rpc;
using namespace peerlink::test;

TEST(ConfigTest, Defaults)
{
    Config config;
    EXPECT_EQ(config.getDefaultSslProvider(), "openSSL");
    EXPECT_EQ(config.getDefaultNegotiationType(), "TLS");
    EXPECT_EQ(config.getLogLevel(), "warn");
}

TEST(ConfigTest, LoadFile)
{
    TempFile file("# endpoint defaults\n"
                  "peerlink.connection.default_ssl_provider = JDK\n"
                  "\n"
                  "  peerlink.connection.default_ssl_negotiation_type=plainText   # trailing comment\n"
                  "peerlink.unknown = ignored\n"
                  "peerlink.log_level = debug\n");

    Config config;
    ASSERT_NO_THROW(config.loadFile(file.path()));
    EXPECT_EQ(config.getDefaultSslProvider(), "JDK");
    EXPECT_EQ(config.getDefaultNegotiationType(), "plainText");
    EXPECT_EQ(config.getLogLevel(), "debug");
}

TEST(ConfigTest, LoadMissingFile)
{
    Config config;
    ASSERT_THROW(config.loadFile("/nonexistent/peerlink.conf"), casket::RuntimeError);
}

TEST(ConfigTest, RejectLineWithoutValue)
{
    TempFile file("peerlink.log_level\n");
    Config config;
    ASSERT_THROW(config.loadFile(file.path()), casket::RuntimeError);
}

TEST(ConfigTest, Environment)
{
    ::setenv("PEERLINK_DEFAULT_SSL_PROVIDER", "JDK", 1);
    ::unsetenv("PEERLINK_DEFAULT_SSL_NEGOTIATION_TYPE");
    ::setenv("PEERLINK_LOG_LEVEL", "info", 1);

    auto config = Config::fromEnvironment();

    ::unsetenv("PEERLINK_DEFAULT_SSL_PROVIDER");
    ::unsetenv("PEERLINK_LOG_LEVEL");

    EXPECT_EQ(config.getDefaultSslProvider(), "JDK");
    EXPECT_EQ(config.getDefaultNegotiationType(), "TLS");
    EXPECT_EQ(config.getLogLevel(), "info");
}

TEST(ConfigTest, ParseLogLevel)
{
    EXPECT_EQ(ParseLogLevel("debug"), casket::Level::Debug);
    EXPECT_EQ(ParseLogLevel("WARN"), casket::Level::Warning);
    EXPECT_EQ(ParseLogLevel("bogus"), casket::Level::Emergency);
}
