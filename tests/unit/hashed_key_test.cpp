#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "credhash/core/Base64Url.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include "credhash/core/HashedKey.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace
{

using credhash::core::CredentialErrc;
using credhash::core::CredentialError;
using credhash::core::HashedKey;
using credhash::crypto::KeyAlgorithm;
using credhash::test_utils::patternBytes;

[[nodiscard]] HashedKey makeKey(KeyAlgorithm algorithm, std::uint8_t seed = 1U)
{
    auto hash{ patternBytes(credhash::crypto::describe(algorithm).hashBytes, seed) };
    return HashedKey{ algorithm, std::span{ hash } };
}

void expectParseError(std::string_view encoded, CredentialErrc expected)
{
    try
    {
        [[maybe_unused]] const auto parsed{ HashedKey::valueOf(encoded) };
        FAIL() << "parsed \"" << encoded << "\"";
    }
    catch (const CredentialError& e)
    {
        EXPECT_EQ(e.code(), expected) << encoded << ": " << e.what();
    }
}

} // namespace

TEST(HashedKey, RoundTripsEveryAlgorithm)
{
    for (const auto& info : credhash::crypto::keyAlgorithms())
    {
        const HashedKey original{ makeKey(info.algorithm) };
        const std::string text{ original.toString() };
        EXPECT_EQ(text.rfind(std::string{ info.name } + ".", 0), 0U);

        const auto parsed{ HashedKey::valueOf(text) };
        ASSERT_TRUE(parsed.has_value()) << info.name;
        EXPECT_TRUE(*parsed == original) << info.name;
        EXPECT_EQ(parsed->toString(), text);
    }
}

TEST(HashedKey, EncodesTwoFields)
{
    const auto hash{ patternBytes(32U) };
    auto copy{ hash };
    const HashedKey key{ KeyAlgorithm::Sha256, std::span{ copy } };

    EXPECT_EQ(key.toString(), "SHA-256." + credhash::core::base64UrlEncode(hash));
}

TEST(HashedKey, ConstructorWipesCallerBufferOnFailure)
{
    auto hash{ patternBytes(31U) };

    try
    {
        const HashedKey key{ KeyAlgorithm::Sha256, std::span{ hash } };
        FAIL() << "accepted a short hash";
    }
    catch (const CredentialError& e)
    {
        EXPECT_EQ(e.code(), CredentialErrc::InvalidLength);
    }
    EXPECT_TRUE(credhash::test_utils::allZero(hash));
}

TEST(HashedKey, ConstructorRejectsAllZeroHash)
{
    std::vector<std::uint8_t> hash(20U, 0U);
    EXPECT_THROW((HashedKey{ KeyAlgorithm::Sha1, std::span{ hash } }), CredentialError);
}

TEST(HashedKey, SentinelAndAbsentInput)
{
    EXPECT_FALSE(HashedKey::valueOf(std::nullopt).has_value());

    const auto parsed{ HashedKey::valueOf(std::string_view{ "." }) };
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->isClosed());

    const HashedKey none{ HashedKey::noKey() };
    EXPECT_TRUE(none.isClosed());
    EXPECT_EQ(none.toString(), ".");
    EXPECT_EQ(none.algorithm(), credhash::core::recommendedKeyAlgorithm());
}

TEST(HashedKey, ParseErrorsReportTheirKind)
{
    const std::string zeros{ credhash::core::base64UrlEncode(std::vector<std::uint8_t>(32U, 0U)) };
    const std::string valid{ credhash::core::base64UrlEncode(patternBytes(32U)) };

    expectParseError("SHA-256", CredentialErrc::InvalidFormat);
    expectParseError("SHA256." + valid, CredentialErrc::UnsupportedAlgorithm);
    expectParseError("SHA-256." + zeros, CredentialErrc::ReservedValue);
    expectParseError("SHA-512." + valid, CredentialErrc::InvalidLength);
    expectParseError("SHA-256." + valid + "=", CredentialErrc::InvalidFormat);
    expectParseError("SHA-256.", CredentialErrc::InvalidLength);
}

TEST(HashedKey, ClosedValuesNeverCompareEqual)
{
    HashedKey key{ makeKey(KeyAlgorithm::Sha384) };
    const HashedKey same{ makeKey(KeyAlgorithm::Sha384) };
    ASSERT_TRUE(key == same);

    key.close();
    EXPECT_TRUE(key.isClosed());
    EXPECT_FALSE(key == same);
    EXPECT_FALSE(key == key);
    EXPECT_EQ(key.toString(), ".");

    key.close();
    EXPECT_TRUE(key.isClosed());

    const HashedKey none{ HashedKey::noKey() };
    EXPECT_FALSE(none == none);
}

TEST(HashedKey, EqualityRequiresSameAlgorithmAndDigest)
{
    const HashedKey a{ makeKey(KeyAlgorithm::Sha256, 1U) };
    const HashedKey b{ makeKey(KeyAlgorithm::Sha256, 2U) };
    EXPECT_FALSE(a == b);

    // Independent copies of the same digest.
    auto bytes{ patternBytes(64U) };
    auto bytesCopy{ bytes };
    const HashedKey sha512{ KeyAlgorithm::Sha512, std::span{ bytes } };
    const HashedKey sha512Again{ KeyAlgorithm::Sha512, std::span{ bytesCopy } };
    EXPECT_TRUE(sha512 == sha512Again);
}

TEST(HashedKey, MovedFromValueIsClosed)
{
    HashedKey source{ makeKey(KeyAlgorithm::Md5) };
    HashedKey target{ std::move(source) };

    EXPECT_FALSE(target.isClosed());
    // NOLINTNEXTLINE(bugprone-use-after-move)
    EXPECT_TRUE(source.isClosed());
    EXPECT_EQ(source.toString(), ".");
}

TEST(HashedKey, HashUsesFirstFourBytesBigEndian)
{
    const HashedKey key{ makeKey(KeyAlgorithm::Sha256, 1U) };
    EXPECT_EQ(std::hash<HashedKey>{}(key), static_cast<std::size_t>(0x01020304U));
}
