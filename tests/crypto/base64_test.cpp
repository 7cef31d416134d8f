#include <string>
#include <gtest/gtest.h>

#include <peerlink/crypto/base64.hpp>
#include <peerlink/crypto/exception.hpp>

using namespace peerlink::crypto;
using namespace testing;

struct Base64Vector
{
    std::string encoded;
    std::string decoded;
};

class Base64DecodeTest : public TestWithParam<Base64Vector>
{
};

TEST_P(Base64DecodeTest, Decode)
{
    const auto& param = GetParam();

    std::vector<uint8_t> actual;
    ASSERT_NO_THROW(actual = Base64::decode(param.encoded));
    ASSERT_EQ(std::string(actual.begin(), actual.end()), param.decoded);
}

// RFC 4648 test vectors.
INSTANTIATE_TEST_CASE_P(Rfc4648, Base64DecodeTest,
                        Values(Base64Vector{"", ""}, Base64Vector{"Zg==", "f"}, Base64Vector{"Zm8=", "fo"},
                               Base64Vector{"Zm9v", "foo"}, Base64Vector{"Zm9vYg==", "foob"},
                               Base64Vector{"Zm9vYmE=", "fooba"}, Base64Vector{"Zm9vYmFy", "foobar"}));

TEST(Base64Test, AcceptsLineBreaks)
{
    auto actual = Base64::decode("Zm9v\nYmFy\n");
    ASSERT_EQ(std::string(actual.begin(), actual.end()), "foobar");
}

TEST(Base64Test, RejectsForeignCharacters)
{
    ASSERT_THROW(Base64::decode("Zm9v*mFy"), CryptoException);
}
