#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include "credhash/core/KeyHasher.hpp"
#include "credhash/crypto/providers/OpenSslProviderFactory.hpp"

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace
{

using credhash::core::CredentialErrc;
using credhash::core::CredentialError;
using credhash::core::HashedKey;
using credhash::core::KeyHasher;
using credhash::crypto::KeyAlgorithm;

class KeyHasherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_provider = credhash::crypto::providers::makeOpenSslHashProvider();
        m_hasher = std::make_unique<KeyHasher>(*m_provider);
    }

    std::unique_ptr<credhash::crypto::IHashProvider> m_provider; // NOLINT
    std::unique_ptr<KeyHasher> m_hasher;                          // NOLINT
};

} // namespace

TEST_F(KeyHasherTest, GeneratedKeysHaveRegistrySize)
{
    for (const auto& info : credhash::crypto::keyAlgorithms())
    {
        const auto a{ m_hasher->generateKey(info.algorithm) };
        const auto b{ m_hasher->generateKey(info.algorithm) };
        EXPECT_EQ(a.size(), info.keyBytes) << info.name;
        EXPECT_NE(a, b) << info.name;
    }
}

TEST_F(KeyHasherTest, MatchesOnlyTheOriginalKey)
{
    for (const auto& info : credhash::crypto::keyAlgorithms())
    {
        const auto key{ m_hasher->generateKey(info.algorithm) };
        const HashedKey hashed{ m_hasher->hashKey(info.algorithm, key) };
        EXPECT_FALSE(hashed.isClosed());
        EXPECT_TRUE(m_hasher->matches(hashed, key)) << info.name;

        auto other{ key };
        other.back() ^= 0x01U;
        EXPECT_FALSE(m_hasher->matches(hashed, other)) << info.name;
    }
}

TEST_F(KeyHasherTest, HashIsSinglePassDigest)
{
    const std::vector<std::uint8_t> zeroKey(32U, 0U);

    const auto digest{ m_hasher->hash(KeyAlgorithm::Sha256, zeroKey) };

    EXPECT_EQ(credhash::test_utils::toHex(digest), "66687aadf862bd776c8fc18b8e9f8e20089714856ee233b3902a591d0d5f2925");
    EXPECT_EQ(digest, m_provider->digest(KeyAlgorithm::Sha256, zeroKey));
}

TEST_F(KeyHasherTest, HashRejectsWrongKeyLength)
{
    const auto key{ credhash::test_utils::patternBytes(31U) };
    try
    {
        [[maybe_unused]] const auto digest{ m_hasher->hash(KeyAlgorithm::Sha256, key) };
        FAIL() << "accepted a short key";
    }
    catch (const CredentialError& e)
    {
        EXPECT_EQ(e.code(), CredentialErrc::InvalidLength);
    }
    EXPECT_THROW((void)m_hasher->hashKey(KeyAlgorithm::Md5, key), CredentialError);
}

TEST_F(KeyHasherTest, WrongLengthKeyDoesNotMatch)
{
    const auto key{ m_hasher->generateKey(KeyAlgorithm::Sha256) };
    const HashedKey hashed{ m_hasher->hashKey(KeyAlgorithm::Sha256, key) };

    const std::vector<std::uint8_t> longer(key.size() + 1U, 0x42U);
    EXPECT_FALSE(m_hasher->matches(hashed, longer));
}

TEST_F(KeyHasherTest, ClosedOrMovedHashNeverMatches)
{
    const auto key{ m_hasher->generateKey(KeyAlgorithm::Sha512) };
    HashedKey hashed{ m_hasher->hashKey(KeyAlgorithm::Sha512, key) };
    HashedKey moved{ m_hasher->hashKey(KeyAlgorithm::Sha512, key) };

    hashed.close();
    EXPECT_FALSE(m_hasher->matches(hashed, key));

    const HashedKey target{ std::move(moved) };
    EXPECT_TRUE(m_hasher->matches(target, key));
    // NOLINTNEXTLINE(bugprone-use-after-move)
    EXPECT_FALSE(m_hasher->matches(moved, key));

    EXPECT_FALSE(m_hasher->matches(HashedKey::noKey(), std::vector<std::uint8_t>(32U, 0U)));
}

TEST_F(KeyHasherTest, ParsedHashStillMatches)
{
    const auto key{ m_hasher->generateKey(KeyAlgorithm::Sha384) };
    const std::string text{ m_hasher->hashKey(KeyAlgorithm::Sha384, key).toString() };

    const auto parsed{ HashedKey::valueOf(text) };
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(m_hasher->matches(*parsed, key));
}
