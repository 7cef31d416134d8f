#include <gtest/gtest.h>
#include <openssl/ssl.h>

#include <peerlink/crypto/cert.hpp>
#include <peerlink/rpc/credential_resolver.hpp>
#include <peerlink/rpc/error_code.hpp>
#include <peerlink/rpc/trust_context.hpp>

#include "../helpers/test_pki.hpp"

using namespace peerlink::crypto;
using namespace peerlink::rpc;
using namespace peerlink::test;

class TrustContextTest : public testing::Test
{
public:
    void SetUp() override
    {
        ASSERT_NO_THROW(ca_ = MakeIdentity("peer0.org1"));
        ASSERT_NO_THROW(client_ = MakeIdentity("client.org1"));
    }

protected:
    CredentialBundle resolve(const ConnectionProperties& properties)
    {
        std::error_code ec;
        auto bundle = CredentialResolver::resolve(properties, ec);
        EXPECT_FALSE(ec);
        return bundle;
    }

    Identity ca_;
    Identity client_;
};

TEST_F(TrustContextTest, SingleTrustAnchorWithoutClientIdentity)
{
    std::error_code ec;
    auto context = TrustContext::build(ToBytes(ca_.certPem), CredentialBundle(), ec);
    ASSERT_FALSE(ec);
    ASSERT_NE(context, nullptr);

    EXPECT_EQ(context->countTrustAnchors(), 1U);
    EXPECT_TRUE(Cert::isEqual(context->getTrustAnchor(), ca_.cert));
    EXPECT_FALSE(context->hasClientIdentity());
    EXPECT_EQ(context->getVerifyMode() & SSL_VERIFY_PEER, SSL_VERIFY_PEER);
}

TEST_F(TrustContextTest, OnlyFirstCertificateOfBundleIsTrusted)
{
    auto other = MakeIdentity("other.org2");

    std::error_code ec;
    auto context = TrustContext::build(ToBytes(ca_.certPem + other.certPem), CredentialBundle(), ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(context->countTrustAnchors(), 1U);
    EXPECT_TRUE(Cert::isEqual(context->getTrustAnchor(), ca_.cert));
}

TEST_F(TrustContextTest, MutualTls)
{
    ConnectionProperties properties;
    properties.set("clientKeyBytes", Scalar{ToBytes(client_.keyPem)});
    properties.set("clientCertBytes", Scalar{ToBytes(client_.certPem)});
    auto bundle = resolve(properties);

    std::error_code ec;
    auto context = TrustContext::build(ToBytes(ca_.certPem), bundle, ec);
    ASSERT_FALSE(ec);
    ASSERT_TRUE(context->hasClientIdentity());
    EXPECT_TRUE(Cert::isEqual(context->getClientCertificate(), client_.cert));
    EXPECT_EQ(context->countTrustAnchors(), 1U);
}

TEST_F(TrustContextTest, ContextCreatesSessions)
{
    std::error_code ec;
    auto context = TrustContext::build(ToBytes(ca_.certPem), CredentialBundle(), ec);
    ASSERT_FALSE(ec);

    SSL* ssl = SSL_new(context->nativeHandle());
    ASSERT_NE(ssl, nullptr);
    EXPECT_TRUE(SSL_is_server(ssl) == 0);
    SSL_free(ssl);
}

TEST_F(TrustContextTest, MismatchedClientKey)
{
    ConnectionProperties properties;
    properties.set("clientKeyBytes", Scalar{ToBytes(ca_.keyPem)});
    properties.set("clientCertBytes", Scalar{ToBytes(client_.certPem)});
    auto bundle = resolve(properties);

    std::error_code ec;
    auto context = TrustContext::build(ToBytes(ca_.certPem), bundle, ec);
    EXPECT_EQ(ec, Error::TrustStoreFailure);
    EXPECT_EQ(ec, ErrorKind::TrustConstruction);
    EXPECT_EQ(context, nullptr);
}

TEST_F(TrustContextTest, MalformedTrustAnchor)
{
    std::error_code ec;
    auto context = TrustContext::build(ToBytes("-----BEGIN CERTIFICATE-----\nAAAA\n-----END CERTIFICATE-----\n"),
                                       CredentialBundle(), ec);
    EXPECT_EQ(ec, Error::TrustAnchorDecoding);
    EXPECT_EQ(ec, ErrorKind::TrustConstruction);
    EXPECT_EQ(context, nullptr);
}
