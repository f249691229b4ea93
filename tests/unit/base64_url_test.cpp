#include <gtest/gtest.h>

#include "TestUtils.hpp"
#include "credhash/core/Base64Url.hpp"
#include "credhash/core/CredentialErrors.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace
{

using credhash::core::base64UrlDecode;
using credhash::core::base64UrlEncode;

void expectDecodeError(std::string_view text)
{
    try
    {
        [[maybe_unused]] const auto bytes{ base64UrlDecode(text) };
        FAIL() << "decoded \"" << text << "\"";
    }
    catch (const credhash::core::CredentialError& e)
    {
        EXPECT_EQ(e.code(), credhash::core::CredentialErrc::InvalidFormat) << text;
    }
}

std::string decodeToString(std::string_view text)
{
    const auto bytes{ base64UrlDecode(text) };
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST(Base64Url, EncodesRfc4648VectorsWithoutPadding)
{
    EXPECT_EQ(base64UrlEncode(credhash::test_utils::bytesOf("")), "");
    EXPECT_EQ(base64UrlEncode(credhash::test_utils::bytesOf("f")), "Zg");
    EXPECT_EQ(base64UrlEncode(credhash::test_utils::bytesOf("fo")), "Zm8");
    EXPECT_EQ(base64UrlEncode(credhash::test_utils::bytesOf("foo")), "Zm9v");
    EXPECT_EQ(base64UrlEncode(credhash::test_utils::bytesOf("foob")), "Zm9vYg");
    EXPECT_EQ(base64UrlEncode(credhash::test_utils::bytesOf("foobar")), "Zm9vYmFy");
}

TEST(Base64Url, DecodesRfc4648Vectors)
{
    EXPECT_EQ(decodeToString(""), "");
    EXPECT_EQ(decodeToString("Zg"), "f");
    EXPECT_EQ(decodeToString("Zm8"), "fo");
    EXPECT_EQ(decodeToString("Zm9vYg"), "foob");
    EXPECT_EQ(decodeToString("Zm9vYmE"), "fooba");
    EXPECT_EQ(decodeToString("Zm9vYmFy"), "foobar");
}

TEST(Base64Url, UsesUrlSafeAlphabet)
{
    const std::vector<std::uint8_t> bytes{ 0xFBU, 0xFFU };
    EXPECT_EQ(base64UrlEncode(bytes), "-_8");

    const auto decoded{ base64UrlDecode("-_8") };
    ASSERT_EQ(decoded.size(), 2U);
    EXPECT_EQ(decoded[0], 0xFBU);
    EXPECT_EQ(decoded[1], 0xFFU);
}

TEST(Base64Url, PreservesEveryLength)
{
    for (std::size_t size{}; size <= 66U; ++size)
    {
        const auto bytes{ credhash::test_utils::patternBytes(size, 0xF0U) };
        const std::string text{ base64UrlEncode(bytes) };
        EXPECT_EQ(text.find('='), std::string::npos);

        const auto decoded{ base64UrlDecode(text) };
        ASSERT_EQ(decoded.size(), size);
        EXPECT_TRUE(std::equal(decoded.begin(), decoded.end(), bytes.begin()));
    }
}

TEST(Base64Url, RejectsStandardAlphabetAndPadding)
{
    expectDecodeError("+_8");
    expectDecodeError("-/8");
    expectDecodeError("Zg==");
    expectDecodeError("Zm9v.");
    expectDecodeError("Zm 9v");
}

TEST(Base64Url, RejectsTruncatedQuantum)
{
    expectDecodeError("Z");
    expectDecodeError("Zm9vY");
}
