#include "credhash/core/HashedPassword.hpp"
#include "CredentialEncoding.hpp"
#include "credhash/core/Base64Url.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include "credhash/security/ScopeWipe.hpp"
#include "credhash/security/SecureEquals.hpp"
#include <charconv>
#include <cstddef>
#include <string>
#include <system_error>
#include <utility>

namespace credhash::core
{
namespace
{

[[nodiscard]] std::uint32_t parseIterations(std::string_view field)
{
    std::uint32_t iterations{};
    const char* const first{ field.data() };
    const char* const last{ field.data() + field.size() };
    const auto [end, ec]{ std::from_chars(first, last, iterations) };
    if (field.empty() || ec != std::errc{} || end != last)
    {
        throw CredentialError(CredentialErrc::InvalidIterationCount,
                              "Invalid iterations: \"" + std::string{ field } + "\"");
    }
    requireIterations(iterations);
    return iterations;
}

} // namespace

HashedPassword::HashedPassword(crypto::PasswordAlgorithm algorithm, std::span<std::uint8_t> salt,
                               std::uint32_t iterations, std::span<std::uint8_t> hash)
    : m_algorithm{ algorithm }, m_iterations{ iterations }
{
    // The caller's copies are wiped on every exit path; this object keeps its own.
    auto wipeSalt = credhash::security::scopeWipe(salt);
    auto wipeHash = credhash::security::scopeWipe(hash);

    const auto& info{ crypto::describe(algorithm) };
    // Non-short-circuit so both lengths are always checked.
    if ((salt.size() != info.saltBytes) | (hash.size() != info.hashBytes))
    {
        throw CredentialError(CredentialErrc::InvalidLength,
                              "Invalid lengths for " + std::string{ info.name } + ": expecting salt " +
                                  std::to_string(info.saltBytes) + " and hash " + std::to_string(info.hashBytes) +
                                  ", got salt " + std::to_string(salt.size()) + " and hash " +
                                  std::to_string(hash.size()));
    }
    requireIterations(iterations);
    if (credhash::security::isAllZero(salt) | credhash::security::isAllZero(hash))
    {
        throw CredentialError(CredentialErrc::ReservedValue,
                              "All-zero salt or hash is reserved for no password (\"" +
                                  std::string{ g_kNoCredentialValue } + "\")");
    }

    m_salt = credhash::security::secureCopy(salt);
    m_hash = credhash::security::secureCopy(hash);
}

HashedPassword::HashedPassword([[maybe_unused]] ClosedTag tag, crypto::PasswordAlgorithm algorithm,
                               std::uint32_t iterations)
    : m_algorithm{ algorithm }, m_iterations{ iterations },
      m_salt{ credhash::security::zeroedBuffer(crypto::describe(algorithm).saltBytes) },
      m_hash{ credhash::security::zeroedBuffer(crypto::describe(algorithm).hashBytes) }
{
}

HashedPassword::HashedPassword(HashedPassword&& other) noexcept
    : m_algorithm{ other.m_algorithm }, m_iterations{ other.m_iterations }, m_salt{}, m_hash{}
{
    m_salt.swap(other.m_salt);
    m_hash.swap(other.m_hash);
}

HashedPassword& HashedPassword::operator=(HashedPassword&& other) noexcept
{
    if (this == &other)
    {
        return *this;
    }

    credhash::security::secureRelease(m_salt);
    credhash::security::secureRelease(m_hash);
    m_algorithm = other.m_algorithm;
    m_iterations = other.m_iterations;
    m_salt.swap(other.m_salt);
    m_hash.swap(other.m_hash);
    return *this;
}

HashedPassword HashedPassword::noPassword()
{
    const PasswordPolicy policy{ defaultPasswordPolicy() };
    return HashedPassword{ ClosedTag{}, policy.algorithm, policy.iterations };
}

std::optional<HashedPassword> HashedPassword::valueOf(std::optional<std::string_view> encoded)
{
    if (!encoded.has_value())
    {
        return std::nullopt;
    }
    const std::string_view text{ *encoded };
    if (text == g_kNoCredentialValue)
    {
        return noPassword();
    }

    std::size_t pos{};
    const crypto::PasswordAlgorithm algorithm{ requirePasswordAlgorithm(detail::nextField(text, pos, "First")) };
    credhash::security::SecureBuffer salt{ detail::decodeSecretField(detail::nextField(text, pos, "Second"),
                                                                     "Salt") };
    const std::uint32_t iterations{ parseIterations(detail::nextField(text, pos, "Third")) };
    credhash::security::SecureBuffer hash{ detail::decodeSecretField(text.substr(pos), "Hash") };

    return HashedPassword{ algorithm, credhash::security::asSpan(salt), iterations,
                           credhash::security::asSpan(hash) };
}

std::string HashedPassword::toString() const
{
    if (isClosed())
    {
        return std::string{ g_kNoCredentialValue };
    }

    std::string out{ crypto::describe(m_algorithm).name };
    out += g_kFieldSeparator;
    out += base64UrlEncode(salt());
    out += g_kFieldSeparator;
    out += std::to_string(m_iterations);
    out += g_kFieldSeparator;
    out += base64UrlEncode(hash());
    return out;
}

bool HashedPassword::isClosed() const noexcept
{
    return credhash::security::isAllZero(salt()) | credhash::security::isAllZero(hash());
}

void HashedPassword::close() noexcept
{
    credhash::security::secureWipeContents(m_salt);
    credhash::security::secureWipeContents(m_hash);
}

bool HashedPassword::isRehashRecommended() const noexcept
{
    return isRehashRecommended(defaultPasswordPolicy());
}

bool HashedPassword::isRehashRecommended(const PasswordPolicy& policy) const noexcept
{
    return isWeakerThan(PasswordPolicy{ .algorithm = m_algorithm, .iterations = m_iterations }, policy);
}

bool operator==(const HashedPassword& a, const HashedPassword& b) noexcept
{
    const bool sameSalt{ credhash::security::secureEquals(a.m_salt, b.m_salt) };
    const bool sameHash{ credhash::security::secureEquals(a.m_hash, b.m_hash) };
    return static_cast<bool>((a.m_algorithm == b.m_algorithm) & (a.m_iterations == b.m_iterations) & sameSalt &
                             sameHash);
}

} // namespace credhash::core
