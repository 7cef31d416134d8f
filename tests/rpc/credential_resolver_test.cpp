#include <gtest/gtest.h>

#include <peerlink/crypto/cert.hpp>
#include <peerlink/rpc/credential_resolver.hpp>
#include <peerlink/rpc/error_code.hpp>

#include "../helpers/test_pki.hpp"

using namespace peerlink::crypto;
using namespace peerlink::rpc;
using namespace peerlink::test;

class CredentialResolverTest : public testing::Test
{
public:
    void SetUp() override
    {
        ASSERT_NO_THROW(ca_ = MakeIdentity("ca.example.com"));
        ASSERT_NO_THROW(client_ = MakeIdentity("client.example.com"));
    }

protected:
    Identity ca_;
    Identity client_;
};

TEST_F(CredentialResolverTest, NothingConfigured)
{
    std::error_code ec;
    auto bundle = CredentialResolver::resolve(ConnectionProperties(), ec);
    ASSERT_FALSE(ec);
    EXPECT_FALSE(bundle.hasTrustBytes());
    EXPECT_FALSE(bundle.hasClientIdentity());
    EXPECT_FALSE(bundle.clientCertificatePEM.has_value());
}

TEST_F(CredentialResolverTest, TrustBytesThenFilesInListedOrder)
{
    auto second = MakeIdentity("second.example.com");
    auto third = MakeIdentity("third.example.com");
    TempFile secondFile(second.certPem);
    TempFile thirdFile(third.certPem);

    ConnectionProperties properties;
    properties.set("pemBytes", Scalar{ToBytes(ca_.certPem)});
    properties.set("pemFile", " \t" + secondFile.string() + "\t , ," + thirdFile.string() + " ");

    std::error_code ec;
    auto bundle = CredentialResolver::resolve(properties, ec);
    ASSERT_FALSE(ec);
    ASSERT_TRUE(bundle.hasTrustBytes());
    EXPECT_EQ(bundle.caTrustBytes.value(), ToBytes(ca_.certPem + second.certPem + third.certPem));
}

TEST_F(CredentialResolverTest, EmptyTrustBytesMeanNoCA)
{
    TempFile empty("");

    ConnectionProperties properties;
    properties.set("pemBytes", Scalar{Bytes{}});
    properties.set("pemFile", empty.string().c_str());

    std::error_code ec;
    auto bundle = CredentialResolver::resolve(properties, ec);
    ASSERT_FALSE(ec);
    EXPECT_FALSE(bundle.caTrustBytes.has_value());
}

TEST_F(CredentialResolverTest, UnreadableTrustFile)
{
    ConnectionProperties properties;
    properties.set("pemFile", "/nonexistent/ca.pem");

    std::error_code ec;
    auto bundle = CredentialResolver::resolve(properties, ec);
    EXPECT_EQ(ec, Error::UnreadableFile);
    EXPECT_EQ(ec, ErrorKind::Configuration);
    EXPECT_FALSE(bundle.caTrustBytes.has_value());
}

TEST_F(CredentialResolverTest, TrustBytesOfWrongType)
{
    for (const auto& value : {PropertyValue{ScalarList{Scalar{ToBytes(ca_.certPem)}}},
                              PropertyValue{Scalar{int32_t{1}}}, PropertyValue{Scalar{std::monostate{}}}})
    {
        ConnectionProperties properties;
        std::visit([&](const auto& v) { properties.set("pemBytes", v); }, value);

        std::error_code ec;
        auto bundle = CredentialResolver::resolve(properties, ec);
        EXPECT_EQ(ec, Error::InvalidTrustSource);
        EXPECT_EQ(ec, ErrorKind::Configuration);
        EXPECT_FALSE(bundle.caTrustBytes.has_value());
    }
}

TEST_F(CredentialResolverTest, TrustFileOfWrongType)
{
    TempFile pem(ca_.certPem);

    ConnectionProperties properties;
    properties.set("pemBytes", Scalar{ToBytes(ca_.certPem)});
    properties.set("pemFile", ScalarList{Scalar{pem.string()}});

    std::error_code ec;
    auto bundle = CredentialResolver::resolve(properties, ec);
    EXPECT_EQ(ec, Error::InvalidTrustSource);
    EXPECT_FALSE(bundle.caTrustBytes.has_value());
}

TEST_F(CredentialResolverTest, ClientIdentityFromFiles)
{
    TempFile keyFile(client_.keyPem);
    TempFile certFile(client_.certPem);

    ConnectionProperties properties;
    properties.set("clientKeyFile", keyFile.string().c_str());
    properties.set("clientCertFile", certFile.string().c_str());

    std::error_code ec;
    auto bundle = CredentialResolver::resolve(properties, ec);
    ASSERT_FALSE(ec);
    ASSERT_TRUE(bundle.hasClientIdentity());
    ASSERT_EQ(bundle.clientCertificates.size(), 1U);
    EXPECT_TRUE(Cert::isEqual(bundle.clientCertificates.front(), client_.cert));
    EXPECT_EQ(bundle.clientCertificatePEM.value(), ToBytes(client_.certPem));
}

TEST_F(CredentialResolverTest, ClientIdentityFromBytesKeepsExactCertificateBytes)
{
    auto certBytes = ToBytes("leading text\n" + client_.certPem);

    ConnectionProperties properties;
    properties.set("clientKeyBytes", Scalar{ToBytes(client_.keyPem)});
    properties.set("clientCertBytes", Scalar{certBytes});

    std::error_code ec;
    auto bundle = CredentialResolver::resolve(properties, ec);
    ASSERT_FALSE(ec);
    ASSERT_TRUE(bundle.hasClientIdentity());
    EXPECT_EQ(bundle.clientCertificatePEM.value(), certBytes);
}

TEST_F(CredentialResolverTest, KeyFileAndKeyBytesConflict)
{
    ConnectionProperties properties;
    properties.set("clientKeyFile", "/tmp/key.pem");
    properties.set("clientKeyBytes", Scalar{ToBytes(client_.keyPem)});
    properties.set("clientCertFile", "/tmp/cert.pem");

    std::error_code ec;
    CredentialResolver::resolve(properties, ec);
    EXPECT_EQ(ec, Error::ConflictingKeySources);
    EXPECT_EQ(ec, ErrorKind::Configuration);
}

TEST_F(CredentialResolverTest, CertFileAndCertBytesConflict)
{
    ConnectionProperties properties;
    properties.set("clientCertFile", "/tmp/cert.pem");
    properties.set("clientCertBytes", Scalar{ToBytes(client_.certPem)});

    std::error_code ec;
    CredentialResolver::resolve(properties, ec);
    EXPECT_EQ(ec, Error::ConflictingCertSources);
}

TEST_F(CredentialResolverTest, KeyConflictIsReportedFirst)
{
    ConnectionProperties properties;
    properties.set("clientKeyFile", "/tmp/key.pem");
    properties.set("clientKeyBytes", "key");
    properties.set("clientCertFile", "/tmp/cert.pem");
    properties.set("clientCertBytes", "cert");

    std::error_code ec;
    CredentialResolver::resolve(properties, ec);
    EXPECT_EQ(ec, Error::ConflictingKeySources);
}

TEST_F(CredentialResolverTest, OnlyKeyFile)
{
    TempFile keyFile(client_.keyPem);

    ConnectionProperties properties;
    properties.set("clientKeyFile", keyFile.string().c_str());

    std::error_code ec;
    CredentialResolver::resolve(properties, ec);
    EXPECT_EQ(ec, Error::PartialFileCredentials);
    EXPECT_EQ(ec, ErrorKind::Configuration);
}

TEST_F(CredentialResolverTest, FilePathMustBeString)
{
    TempFile keyFile(client_.keyPem);

    ConnectionProperties properties;
    properties.set("clientKeyFile", keyFile.string().c_str());
    properties.set("clientCertFile", Scalar{std::monostate{}});

    std::error_code ec;
    CredentialResolver::resolve(properties, ec);
    EXPECT_EQ(ec, Error::PartialFileCredentials);
}

TEST_F(CredentialResolverTest, OnlyCertBytes)
{
    ConnectionProperties properties;
    properties.set("clientCertBytes", Scalar{ToBytes(client_.certPem)});

    std::error_code ec;
    CredentialResolver::resolve(properties, ec);
    EXPECT_EQ(ec, Error::PartialBytesCredentials);
    EXPECT_EQ(ec, ErrorKind::Configuration);
}

TEST_F(CredentialResolverTest, UnreadableClientKeyFile)
{
    TempFile certFile(client_.certPem);

    ConnectionProperties properties;
    properties.set("clientKeyFile", "/nonexistent/key.pem");
    properties.set("clientCertFile", certFile.string().c_str());

    std::error_code ec;
    CredentialResolver::resolve(properties, ec);
    EXPECT_EQ(ec, Error::UnreadableFile);
}

TEST_F(CredentialResolverTest, MalformedKeyIsReportedBeforeCertificate)
{
    ConnectionProperties properties;
    properties.set("clientKeyBytes", "not a key");
    properties.set("clientCertBytes", "not a certificate");

    std::error_code ec;
    auto bundle = CredentialResolver::resolve(properties, ec);
    EXPECT_EQ(ec, Error::PrivateKeyDecoding);
    EXPECT_EQ(ec, ErrorKind::CredentialDecoding);
    EXPECT_FALSE(bundle.hasClientIdentity());
}

TEST_F(CredentialResolverTest, MalformedCertificate)
{
    ConnectionProperties properties;
    properties.set("clientKeyBytes", Scalar{ToBytes(client_.keyPem)});
    properties.set("clientCertBytes", "not a certificate");

    std::error_code ec;
    CredentialResolver::resolve(properties, ec);
    EXPECT_EQ(ec, Error::CertificateDecoding);
    EXPECT_EQ(ec, ErrorKind::CredentialDecoding);
}
