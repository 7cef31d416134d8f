#include <gtest/gtest.h>

#include <peerlink/crypto/cert.hpp>
#include <peerlink/crypto/cert_name.hpp>
#include <peerlink/crypto/exception.hpp>

#include "../helpers/test_pki.hpp"

using namespace peerlink::crypto;
using namespace peerlink::test;

class CertTest : public testing::Test
{
public:
    void SetUp() override
    {
        ASSERT_NO_THROW(identity_ = MakeIdentity("peer0.org1.example.com"));
    }

protected:
    Identity identity_;
};

TEST_F(CertTest, ReadFirstCertificateOfBundle)
{
    auto other = MakeIdentity("other.example.com");
    auto bundle = ToBytes("garbage before armor\n" + identity_.certPem + other.certPem);

    X509CertPtr cert;
    ASSERT_NO_THROW(cert = Cert::fromPemBytes(bundle));
    ASSERT_TRUE(Cert::isEqual(cert, identity_.cert));
}

TEST_F(CertTest, CommonName)
{
    auto name = Cert::subjectName(identity_.cert);
    auto cn = CertName::commonName(name);
    ASSERT_TRUE(cn.has_value());
    ASSERT_EQ(cn.value(), "peer0.org1.example.com");
}

TEST_F(CertTest, NoCommonName)
{
    auto noCn = MakeIdentity(std::nullopt);
    auto name = Cert::subjectName(noCn.cert);
    ASSERT_FALSE(CertName::commonName(name).has_value());
}

TEST_F(CertTest, Utf8CommonName)
{
    auto unicode = MakeIdentity("p\xC3\xA9" "er.example");
    auto name = Cert::subjectName(unicode.cert);
    ASSERT_EQ(CertName::commonName(name).value(), "p\xC3\xA9" "er.example");
}

TEST_F(CertTest, ShallowCopySharesCertificate)
{
    auto copy = Cert::shallowCopy(identity_.cert);
    ASSERT_EQ(copy.get(), identity_.cert.get());
}

TEST_F(CertTest, ToDerMatchesEncodedLength)
{
    auto der = Cert::toDer(identity_.cert);
    ASSERT_EQ(static_cast<int>(der.size()), i2d_X509(identity_.cert, nullptr));
}

TEST(CertNegativeTest, RejectGarbage)
{
    auto bytes = ToBytes("not a certificate");
    ASSERT_THROW(Cert::fromPemBytes(bytes), CryptoException);
}

TEST(CertNegativeTest, RejectEmptyInput)
{
    peerlink::rpc::Bytes bytes;
    ASSERT_THROW(Cert::fromPemBytes(bytes), CryptoException);
}
