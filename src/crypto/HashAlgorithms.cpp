#include "credhash/crypto/HashAlgorithms.hpp"
#include <array>
#include <cstddef>
#include <ranges>

namespace credhash::crypto
{
namespace
{

constexpr std::array<PasswordAlgorithmInfo, 6> g_kPasswordAlgorithms{ {
    { .algorithm = PasswordAlgorithm::Pbkdf2WithHmacMd5,
      .name = "PBKDF2WithHmacMD5",
      .digestName = "MD5",
      .saltBytes = 128U / 8U,
      .hashBytes = 128U / 8U },
    { .algorithm = PasswordAlgorithm::Pbkdf2WithHmacSha1,
      .name = "PBKDF2WithHmacSHA1",
      .digestName = "SHA1",
      .saltBytes = 256U / 8U,
      .hashBytes = 256U / 8U },
    { .algorithm = PasswordAlgorithm::Pbkdf2WithHmacSha224,
      .name = "PBKDF2WithHmacSHA224",
      .digestName = "SHA2-224",
      .saltBytes = 224U / 8U,
      .hashBytes = 224U / 8U },
    { .algorithm = PasswordAlgorithm::Pbkdf2WithHmacSha256,
      .name = "PBKDF2WithHmacSHA256",
      .digestName = "SHA2-256",
      .saltBytes = 256U / 8U,
      .hashBytes = 256U / 8U },
    { .algorithm = PasswordAlgorithm::Pbkdf2WithHmacSha384,
      .name = "PBKDF2WithHmacSHA384",
      .digestName = "SHA2-384",
      .saltBytes = 384U / 8U,
      .hashBytes = 384U / 8U },
    { .algorithm = PasswordAlgorithm::Pbkdf2WithHmacSha512,
      .name = "PBKDF2WithHmacSHA512",
      .digestName = "SHA2-512",
      .saltBytes = 512U / 8U,
      .hashBytes = 512U / 8U },
} };

constexpr std::array<KeyAlgorithmInfo, 6> g_kKeyAlgorithms{ {
    { .algorithm = KeyAlgorithm::Md5, .name = "MD5", .digestName = "MD5", .keyBytes = 16U, .hashBytes = 16U },
    { .algorithm = KeyAlgorithm::Sha1, .name = "SHA-1", .digestName = "SHA1", .keyBytes = 20U, .hashBytes = 20U },
    { .algorithm = KeyAlgorithm::Sha224,
      .name = "SHA-224",
      .digestName = "SHA2-224",
      .keyBytes = 28U,
      .hashBytes = 28U },
    { .algorithm = KeyAlgorithm::Sha256,
      .name = "SHA-256",
      .digestName = "SHA2-256",
      .keyBytes = 32U,
      .hashBytes = 32U },
    { .algorithm = KeyAlgorithm::Sha384,
      .name = "SHA-384",
      .digestName = "SHA2-384",
      .keyBytes = 48U,
      .hashBytes = 48U },
    { .algorithm = KeyAlgorithm::Sha512,
      .name = "SHA-512",
      .digestName = "SHA2-512",
      .keyBytes = 64U,
      .hashBytes = 64U },
} };

[[nodiscard]] constexpr bool isUrlSafe(std::string_view value) noexcept
{
    for (const char ch : value)
    {
        const bool unreserved{ (ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') ||
                               ch == '-' || ch == '.' || ch == '_' || ch == '~' };
        if (!unreserved)
        {
            return false;
        }
    }
    return true;
}

template <typename Table> [[nodiscard]] constexpr bool namesArePersistable(const Table& table) noexcept
{
    for (const auto& info : table)
    {
        if (info.name.empty() || !isUrlSafe(info.name) || info.name.find('.') != std::string_view::npos)
        {
            return false;
        }
    }
    return true;
}

template <typename Table> [[nodiscard]] constexpr bool orderMatchesEnum(const Table& table) noexcept
{
    for (std::size_t i{}; i < table.size(); ++i)
    {
        if (static_cast<std::size_t>(table[i].algorithm) != i)
        {
            return false;
        }
    }
    return true;
}

static_assert(namesArePersistable(g_kPasswordAlgorithms));
static_assert(namesArePersistable(g_kKeyAlgorithms));
static_assert(orderMatchesEnum(g_kPasswordAlgorithms));
static_assert(orderMatchesEnum(g_kKeyAlgorithms));

[[nodiscard]] constexpr char toLowerAscii(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (std::size_t i{}; i < a.size(); ++i)
    {
        if (toLowerAscii(a[i]) != toLowerAscii(b[i]))
        {
            return false;
        }
    }
    return true;
}

} // namespace

std::span<const PasswordAlgorithmInfo> passwordAlgorithms() noexcept
{
    return std::span{ g_kPasswordAlgorithms };
}

std::span<const KeyAlgorithmInfo> keyAlgorithms() noexcept
{
    return std::span{ g_kKeyAlgorithms };
}

const PasswordAlgorithmInfo& describe(PasswordAlgorithm algorithm) noexcept
{
    return g_kPasswordAlgorithms[static_cast<std::size_t>(algorithm)];
}

const KeyAlgorithmInfo& describe(KeyAlgorithm algorithm) noexcept
{
    return g_kKeyAlgorithms[static_cast<std::size_t>(algorithm)];
}

std::optional<PasswordAlgorithm> findPasswordAlgorithm(std::string_view name) noexcept
{
    for (const auto& info : std::views::reverse(g_kPasswordAlgorithms))
    {
        if (equalsIgnoreCase(info.name, name))
        {
            return info.algorithm;
        }
    }
    return std::nullopt;
}

std::optional<KeyAlgorithm> findKeyAlgorithm(std::string_view name) noexcept
{
    for (const auto& info : std::views::reverse(g_kKeyAlgorithms))
    {
        if (equalsIgnoreCase(info.name, name))
        {
            return info.algorithm;
        }
    }
    return std::nullopt;
}

} // namespace credhash::crypto
