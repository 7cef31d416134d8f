#include <memory>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include <peerlink/rpc/authority_resolver.hpp>

#include "../helpers/test_pki.hpp"

using namespace peerlink::rpc;
using namespace peerlink::test;

class AuthorityResolverTest : public testing::Test
{
public:
    void SetUp() override
    {
        ASSERT_NO_THROW(ca_ = MakeIdentity("peer0.org1"));
        caBytes_ = ToBytes(ca_.certPem);
        cache_ = std::make_shared<AuthorityCache>();
    }

protected:
    Identity ca_;
    Bytes caBytes_;
    std::shared_ptr<AuthorityCache> cache_;
};

TEST_F(AuthorityResolverTest, HostnameOverrideWins)
{
    ConnectionProperties properties;
    properties.set("hostnameOverride", "orderer.example.com");
    properties.set("trustServerCertificate", "true");

    AuthorityResolver resolver(cache_);
    EXPECT_EQ(resolver.resolve(properties, caBytes_), "orderer.example.com");
    EXPECT_EQ(cache_->size(), 0U);
}

TEST_F(AuthorityResolverTest, HostnameOverrideWithoutTrustBytes)
{
    ConnectionProperties properties;
    properties.set("hostnameOverride", "orderer.example.com");

    AuthorityResolver resolver(cache_);
    EXPECT_EQ(resolver.resolve(properties, std::nullopt), "orderer.example.com");
}

TEST_F(AuthorityResolverTest, CommonNameWhenTrustingServerCertificate)
{
    ConnectionProperties properties;
    properties.set("trustServerCertificate", "true");

    AuthorityResolver resolver(cache_);
    EXPECT_EQ(resolver.resolve(properties, caBytes_), "peer0.org1");
    EXPECT_EQ(cache_->size(), 1U);
    EXPECT_EQ(cache_->find(ca_.certPem), "peer0.org1");
}

TEST_F(AuthorityResolverTest, NoOverrideWithoutTrustFlag)
{
    ConnectionProperties properties;
    properties.set("trustServerCertificate", "TRUE");

    AuthorityResolver resolver(cache_);
    EXPECT_FALSE(resolver.resolve(ConnectionProperties(), caBytes_).has_value());
    EXPECT_FALSE(resolver.resolve(properties, caBytes_).has_value());
    EXPECT_EQ(cache_->size(), 0U);
}

TEST_F(AuthorityResolverTest, NoOverrideWithoutTrustBytes)
{
    ConnectionProperties properties;
    properties.set("trustServerCertificate", "true");

    AuthorityResolver resolver(cache_);
    EXPECT_FALSE(resolver.resolve(properties, std::nullopt).has_value());
}

TEST_F(AuthorityResolverTest, CachedNameIsReused)
{
    cache_->insert(ca_.certPem, "cached.example.com");

    ConnectionProperties properties;
    properties.set("trustServerCertificate", "true");

    AuthorityResolver resolver(cache_);
    EXPECT_EQ(resolver.resolve(properties, caBytes_), "cached.example.com");
}

TEST_F(AuthorityResolverTest, UndecodableCertificateIsTolerated)
{
    ConnectionProperties properties;
    properties.set("trustServerCertificate", "true");

    AuthorityResolver resolver(cache_);
    EXPECT_FALSE(resolver.resolve(properties, ToBytes("not a certificate")).has_value());
    EXPECT_EQ(cache_->size(), 0U);
}

TEST_F(AuthorityResolverTest, CertificateWithoutCommonNameIsTolerated)
{
    auto noCn = MakeIdentity(std::nullopt);

    ConnectionProperties properties;
    properties.set("trustServerCertificate", "true");

    AuthorityResolver resolver(cache_);
    EXPECT_FALSE(resolver.resolve(properties, ToBytes(noCn.certPem)).has_value());
    EXPECT_EQ(cache_->size(), 0U);
}

TEST_F(AuthorityResolverTest, ConcurrentResolutionLeavesOneEntry)
{
    ConnectionProperties properties;
    properties.set("trustServerCertificate", "true");

    const AuthorityResolver resolver(cache_);
    constexpr int kThreads = 8;
    constexpr int kIterations = 50;

    std::vector<std::optional<std::string>> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back([&, i]() {
            for (int j = 0; j < kIterations; ++j)
            {
                results[i] = resolver.resolve(properties, caBytes_);
            }
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    for (const auto& result : results)
    {
        EXPECT_EQ(result, "peer0.org1");
    }
    EXPECT_EQ(cache_->size(), 1U);
}

TEST(AuthorityCacheTest, DistinctKeys)
{
    AuthorityCache cache;
    cache.insert("a", "first");
    cache.insert("b", "second");
    cache.insert("a", "third");

    EXPECT_EQ(cache.size(), 2U);
    EXPECT_EQ(cache.find("a"), "third");
    EXPECT_FALSE(cache.find("c").has_value());
}
