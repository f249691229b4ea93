#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include "credhash/core/PasswordHasher.hpp"
#include "credhash/crypto/providers/NativeProviderFactory.hpp"

#include <memory>
#include <span>
#include <stdexcept>

namespace
{

using credhash::crypto::KeyAlgorithm;
using credhash::crypto::PasswordAlgorithm;

class NativeHashProviderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_provider = credhash::crypto::providers::makeNativeHashProvider();
    }

    std::unique_ptr<credhash::crypto::IHashProvider> m_provider; // NOLINT
};

} // namespace

TEST_F(NativeHashProviderTest, SupportsOnlySha512Entries)
{
    EXPECT_EQ(m_provider->name(), "native");
    EXPECT_TRUE(m_provider->supports(PasswordAlgorithm::Pbkdf2WithHmacSha512));
    EXPECT_TRUE(m_provider->supports(KeyAlgorithm::Sha512));
    EXPECT_FALSE(m_provider->supports(PasswordAlgorithm::Pbkdf2WithHmacSha256));
    EXPECT_FALSE(m_provider->supports(KeyAlgorithm::Md5));
}

TEST_F(NativeHashProviderTest, Pbkdf2HmacSha512KnownAnswer)
{
    const auto salt{ credhash::test_utils::bytesOf("salt") };
    const auto out{ m_provider->deriveKey(PasswordAlgorithm::Pbkdf2WithHmacSha512, "password", salt, 1U) };

    EXPECT_EQ(credhash::test_utils::toHex(out), "867f70cf1ade02cff3752599a3a53dc4af34c7a669815ae5d513554e1c8cf252"
                                                "c02d470a285a0501bad999bfe943c08f050235d7d68b1da55e63f73b60a57fce");
}

TEST_F(NativeHashProviderTest, Sha512KnownAnswer)
{
    const auto out{ m_provider->digest(KeyAlgorithm::Sha512, credhash::test_utils::bytesOf("abc")) };

    EXPECT_EQ(credhash::test_utils::toHex(out), "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
                                                "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST_F(NativeHashProviderTest, UnsupportedAlgorithmsThrow)
{
    const auto salt{ credhash::test_utils::patternBytes(32U) };
    try
    {
        [[maybe_unused]] const auto out{
            m_provider->deriveKey(PasswordAlgorithm::Pbkdf2WithHmacSha256, "pw", salt, 1U)
        };
        FAIL() << "derived with an unsupported algorithm";
    }
    catch (const credhash::core::CredentialError& e)
    {
        EXPECT_EQ(e.code(), credhash::core::CredentialErrc::UnsupportedAlgorithm);
    }
    EXPECT_THROW((void)m_provider->digest(KeyAlgorithm::Sha256, salt), credhash::core::CredentialError);
    EXPECT_THROW((void)m_provider->deriveKey(PasswordAlgorithm::Pbkdf2WithHmacSha512, "pw", salt, 0U),
                 std::invalid_argument);
}

TEST_F(NativeHashProviderTest, DrivesPasswordHasher)
{
    const credhash::core::PasswordHasher hasher{ *m_provider, credhash::test_utils::fastPolicy() };
    const auto hashed{ hasher.hashPassword("native") };
    EXPECT_TRUE(hasher.matches(hashed, "native"));
    EXPECT_FALSE(hasher.matches(hashed, "Native"));
}
