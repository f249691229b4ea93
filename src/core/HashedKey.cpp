#include "credhash/core/HashedKey.hpp"
#include "CredentialEncoding.hpp"
#include "credhash/core/Base64Url.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include "credhash/core/HashPolicy.hpp"
#include "credhash/core/HashedPassword.hpp"
#include "credhash/security/ScopeWipe.hpp"
#include "credhash/security/SecureEquals.hpp"
#include <algorithm>
#include <string>

namespace credhash::core
{

HashedKey::HashedKey(crypto::KeyAlgorithm algorithm, std::span<std::uint8_t> hash)
    : m_algorithm{ algorithm }
{
    auto wipeHash = credhash::security::scopeWipe(hash);

    const auto& info{ crypto::describe(algorithm) };
    if (hash.size() != info.hashBytes)
    {
        throw CredentialError(CredentialErrc::InvalidLength, "Invalid hash length for " + std::string{ info.name } +
                                                                 ": expecting " + std::to_string(info.hashBytes) +
                                                                 ", got " + std::to_string(hash.size()));
    }
    if (credhash::security::isAllZero(hash))
    {
        throw CredentialError(CredentialErrc::ReservedValue, "All-zero hash is reserved for no key (\"" +
                                                                 std::string{ g_kNoCredentialValue } + "\")");
    }

    m_hash = credhash::security::secureCopy(hash);
}

HashedKey::HashedKey([[maybe_unused]] ClosedTag tag, crypto::KeyAlgorithm algorithm)
    : m_algorithm{ algorithm }, m_hash{ credhash::security::zeroedBuffer(crypto::describe(algorithm).hashBytes) }
{
}

HashedKey::HashedKey(HashedKey&& other) noexcept : m_algorithm{ other.m_algorithm }, m_hash{}
{
    m_hash.swap(other.m_hash);
}

HashedKey& HashedKey::operator=(HashedKey&& other) noexcept
{
    if (this != &other)
    {
        credhash::security::secureRelease(m_hash);
        m_algorithm = other.m_algorithm;
        m_hash.swap(other.m_hash);
    }
    return *this;
}

HashedKey HashedKey::noKey()
{
    return HashedKey{ ClosedTag{}, recommendedKeyAlgorithm() };
}

std::optional<HashedKey> HashedKey::valueOf(std::optional<std::string_view> encoded)
{
    if (!encoded)
    {
        return std::nullopt;
    }
    const std::string_view text{ *encoded };
    if (text == g_kNoCredentialValue)
    {
        return noKey();
    }

    std::size_t pos{};
    const crypto::KeyAlgorithm algorithm{ requireKeyAlgorithm(detail::nextField(text, pos, "First")) };
    credhash::security::SecureBuffer hash{ detail::decodeSecretField(text.substr(pos), "Hash") };
    return HashedKey{ algorithm, credhash::security::asSpan(hash) };
}

std::string HashedKey::toString() const
{
    if (isClosed())
    {
        return std::string{ g_kNoCredentialValue };
    }
    std::string out{ crypto::describe(m_algorithm).name };
    out += g_kFieldSeparator;
    out += base64UrlEncode(hash());
    return out;
}

bool HashedKey::isClosed() const noexcept
{
    return credhash::security::isAllZero(hash());
}

void HashedKey::close() noexcept
{
    credhash::security::secureWipeContents(m_hash);
}

bool operator==(const HashedKey& a, const HashedKey& b) noexcept
{
    const bool open{ static_cast<bool>(!a.isClosed() & !b.isClosed()) };
    const bool sameHash{ credhash::security::secureEquals(a.m_hash, b.m_hash) };
    return static_cast<bool>(open & (a.m_algorithm == b.m_algorithm) & sameHash);
}

} // namespace credhash::core

std::size_t std::hash<credhash::core::HashedKey>::operator()(const credhash::core::HashedKey& key) const noexcept
{
    const auto bytes{ key.hash() };
    std::uint32_t value{};
    const std::size_t count{ std::min<std::size_t>(bytes.size(), 4U) };
    for (std::size_t i{}; i < count; ++i)
    {
        value = (value << 8U) | bytes[i];
    }
    return static_cast<std::size_t>(value);
}
