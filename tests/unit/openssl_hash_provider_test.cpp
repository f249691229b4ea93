#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include "credhash/crypto/providers/OpenSslProviderFactory.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{

using credhash::crypto::KeyAlgorithm;
using credhash::crypto::PasswordAlgorithm;
using credhash::test_utils::bytesOf;
using credhash::test_utils::toHex;

class OpenSslHashProviderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_provider = credhash::crypto::providers::makeOpenSslHashProvider();
    }

    [[nodiscard]] std::string derivePrefixHex(PasswordAlgorithm algorithm, std::string_view password,
                                              std::string_view salt, std::uint32_t iterations,
                                              std::size_t prefixBytes) const
    {
        const auto saltBytes{ bytesOf(salt) };
        const auto out{ m_provider->deriveKey(algorithm, password, saltBytes, iterations) };
        EXPECT_EQ(out.size(), credhash::crypto::describe(algorithm).hashBytes);
        return toHex(std::span<const std::uint8_t>{ out }.first(prefixBytes));
    }

    [[nodiscard]] std::string digestHex(KeyAlgorithm algorithm, std::string_view message) const
    {
        const auto out{ m_provider->digest(algorithm, bytesOf(message)) };
        EXPECT_EQ(out.size(), credhash::crypto::describe(algorithm).hashBytes);
        return toHex(out);
    }

    std::unique_ptr<credhash::crypto::IHashProvider> m_provider; // NOLINT
};

} // namespace

TEST_F(OpenSslHashProviderTest, SupportsEveryRegisteredAlgorithm)
{
    EXPECT_EQ(m_provider->name(), "openssl");
    for (const auto& info : credhash::crypto::passwordAlgorithms())
    {
        EXPECT_TRUE(m_provider->supports(info.algorithm)) << info.name;
    }
    for (const auto& info : credhash::crypto::keyAlgorithms())
    {
        EXPECT_TRUE(m_provider->supports(info.algorithm)) << info.name;
    }
}

// RFC 6070. The registry asks for 32 bytes; PBKDF2 output is a prefix-stable stream.
TEST_F(OpenSslHashProviderTest, Pbkdf2HmacSha1KnownAnswers)
{
    EXPECT_EQ(derivePrefixHex(PasswordAlgorithm::Pbkdf2WithHmacSha1, "password", "salt", 1U, 20U),
              "0c60c80f961f0e71f3a9b524af6012062fe037a6");
    EXPECT_EQ(derivePrefixHex(PasswordAlgorithm::Pbkdf2WithHmacSha1, "password", "salt", 2U, 20U),
              "ea6c014dc72d6f8ccd1ed92ace1d41f0d8de8957");
    EXPECT_EQ(derivePrefixHex(PasswordAlgorithm::Pbkdf2WithHmacSha1, "password", "salt", 4096U, 20U),
              "4b007901b765489abead49d926f721d065a429c1");
    EXPECT_EQ(derivePrefixHex(PasswordAlgorithm::Pbkdf2WithHmacSha1, "passwordPASSWORDpassword",
                              "saltSALTsaltSALTsaltSALTsaltSALTsalt", 4096U, 25U),
              "3d2eec4fe41c849b80c8d83662c0e44a8b291a964cf2f07038");
}

TEST_F(OpenSslHashProviderTest, Pbkdf2HmacSha256KnownAnswers)
{
    EXPECT_EQ(derivePrefixHex(PasswordAlgorithm::Pbkdf2WithHmacSha256, "password", "salt", 1U, 32U),
              "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
    EXPECT_EQ(derivePrefixHex(PasswordAlgorithm::Pbkdf2WithHmacSha256, "password", "salt", 4096U, 32U),
              "c5e478d59288c841aa530db6845c4c8d962893a001ce4e11a4963873aa98134a");
}

TEST_F(OpenSslHashProviderTest, Pbkdf2HmacSha512KnownAnswer)
{
    EXPECT_EQ(derivePrefixHex(PasswordAlgorithm::Pbkdf2WithHmacSha512, "password", "salt", 1U, 64U),
              "867f70cf1ade02cff3752599a3a53dc4af34c7a669815ae5d513554e1c8cf252"
              "c02d470a285a0501bad999bfe943c08f050235d7d68b1da55e63f73b60a57fce");
}

TEST_F(OpenSslHashProviderTest, DerivesFromEmptyPassword)
{
    const auto salt{ credhash::test_utils::patternBytes(64U) };
    const auto a{ m_provider->deriveKey(PasswordAlgorithm::Pbkdf2WithHmacSha512, "", salt, 2U) };
    const auto b{ m_provider->deriveKey(PasswordAlgorithm::Pbkdf2WithHmacSha512, "", salt, 2U) };
    ASSERT_EQ(a.size(), 64U);
    EXPECT_EQ(a, b);
    EXPECT_FALSE(credhash::test_utils::allZero(a));
}

TEST_F(OpenSslHashProviderTest, DigestKnownAnswers)
{
    EXPECT_EQ(digestHex(KeyAlgorithm::Md5, "abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(digestHex(KeyAlgorithm::Sha1, "abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(digestHex(KeyAlgorithm::Sha256, "abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(digestHex(KeyAlgorithm::Sha512, "abc"),
              "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
              "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
    EXPECT_EQ(digestHex(KeyAlgorithm::Sha256, ""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(OpenSslHashProviderTest, DigestSizesFollowRegistry)
{
    const auto message{ credhash::test_utils::patternBytes(100U) };
    for (const auto& info : credhash::crypto::keyAlgorithms())
    {
        EXPECT_EQ(m_provider->digest(info.algorithm, message).size(), info.hashBytes) << info.name;
    }
}

TEST_F(OpenSslHashProviderTest, ZeroIterationsRejected)
{
    const auto salt{ credhash::test_utils::patternBytes(64U) };
    EXPECT_THROW((void)m_provider->deriveKey(PasswordAlgorithm::Pbkdf2WithHmacSha512, "pw", salt, 0U),
                 std::invalid_argument);
}
