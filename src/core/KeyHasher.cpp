#include "credhash/core/KeyHasher.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include "credhash/security/SecureEquals.hpp"
#include "credhash/security/SecureRandom.hpp"
#include <stdexcept>
#include <string>

namespace credhash::core
{

KeyHasher::KeyHasher(const crypto::IHashProvider& provider) noexcept : m_provider{ &provider }
{
}

credhash::security::SecureBuffer KeyHasher::generateKey(crypto::KeyAlgorithm algorithm) const
{
    return credhash::security::secureRandomBuffer(crypto::describe(algorithm).keyBytes);
}

credhash::security::SecureBuffer KeyHasher::hash(crypto::KeyAlgorithm algorithm,
                                                std::span<const std::uint8_t> key) const
{
    const auto& info{ crypto::describe(algorithm) };
    if (key.size() != info.keyBytes)
    {
        throw CredentialError(CredentialErrc::InvalidLength, "Invalid key length: expecting " +
                                                                 std::to_string(info.keyBytes) + ", got " +
                                                                 std::to_string(key.size()));
    }

    credhash::security::SecureBuffer out{ m_provider->digest(algorithm, key) };
    if (out.size() != info.hashBytes)
    {
        throw std::runtime_error("hash: provider returned " + std::to_string(out.size()) + " bytes, expecting " +
                                 std::to_string(info.hashBytes));
    }
    return out;
}

HashedKey KeyHasher::hashKey(crypto::KeyAlgorithm algorithm, std::span<const std::uint8_t> key) const
{
    credhash::security::SecureBuffer digest{ hash(algorithm, key) };
    return HashedKey{ algorithm, credhash::security::asSpan(digest) };
}

bool KeyHasher::matches(const HashedKey& hashed, std::span<const std::uint8_t> key) const
{
    const auto& info{ crypto::describe(hashed.algorithm()) };
    if (key.size() != info.keyBytes)
    {
        return false;
    }
    const credhash::security::SecureBuffer candidate{ m_provider->digest(hashed.algorithm(), key) };
    return static_cast<bool>(!hashed.isClosed() &
                             credhash::security::secureEquals(credhash::security::asSpan(candidate), hashed.hash()));
}

} // namespace credhash::core
