#include "credhash/core/Base64Url.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include <cstddef>
#include <limits>
#include <openssl/evp.h>
#include <string>

namespace credhash::core
{
namespace
{

constexpr std::size_t g_kQuantumChars{ 4U };
constexpr std::size_t g_kQuantumBytes{ 3U };

[[nodiscard]] bool isUrlSafeBase64Char(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

void requireEncodable(std::size_t size)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max() / 2))
    {
        throw CredentialError(CredentialErrc::InvalidLength, "base64: input too large");
    }
}

} // namespace

std::string base64UrlEncode(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty())
    {
        return {};
    }
    requireEncodable(bytes.size());

    const std::size_t quanta{ (bytes.size() + g_kQuantumBytes - 1U) / g_kQuantumBytes };
    // EVP_EncodeBlock writes a trailing NUL.
    std::string out(quanta * g_kQuantumChars + 1U, '\0');
    const int written{ EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                       static_cast<int>(bytes.size())) };
    out.resize(static_cast<std::size_t>(written));

    while (!out.empty() && out.back() == '=')
    {
        out.pop_back();
    }
    for (char& c : out)
    {
        if (c == '+')
        {
            c = '-';
        }
        else if (c == '/')
        {
            c = '_';
        }
    }
    return out;
}

credhash::security::SecureBuffer base64UrlDecode(std::string_view text)
{
    if (text.empty())
    {
        return {};
    }
    requireEncodable(text.size());

    const std::size_t remainder{ text.size() % g_kQuantumChars };
    if (remainder == 1U)
    {
        throw CredentialError(CredentialErrc::InvalidFormat, "base64: truncated input");
    }
    for (const char c : text)
    {
        if (!isUrlSafeBase64Char(c))
        {
            throw CredentialError(CredentialErrc::InvalidFormat,
                                  std::string{ "base64: illegal character '" } + c + "'");
        }
    }

    const std::size_t padding{ remainder == 0U ? 0U : g_kQuantumChars - remainder };
    std::string standard{ text };
    standard.append(padding, '=');
    for (char& c : standard)
    {
        if (c == '-')
        {
            c = '+';
        }
        else if (c == '_')
        {
            c = '/';
        }
    }

    credhash::security::SecureBuffer out{ credhash::security::zeroedBuffer(
        (standard.size() / g_kQuantumChars) * g_kQuantumBytes) };
    const int decoded{ EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                                       static_cast<int>(standard.size())) };
    credhash::security::secureWipe(std::span<char>{ standard.data(), standard.size() });
    if (decoded < 0 || static_cast<std::size_t>(decoded) < padding)
    {
        throw CredentialError(CredentialErrc::InvalidFormat, "base64: malformed input");
    }

    // EVP_DecodeBlock counts the zero bytes produced by padding.
    out.resize(static_cast<std::size_t>(decoded) - padding);
    return out;
}

} // namespace credhash::core
