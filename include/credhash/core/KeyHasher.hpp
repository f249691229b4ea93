#ifndef INCLUDE_CREDHASH_CORE_KEYHASHER_HPP
#define INCLUDE_CREDHASH_CORE_KEYHASHER_HPP

#include "credhash/core/HashedKey.hpp"
#include "credhash/crypto/HashAlgorithms.hpp"
#include "credhash/crypto/IHashProvider.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>

namespace credhash::core
{

// Generates random keys and stores them as single-pass digests. The provider must outlive the
// hasher.
class KeyHasher final
{
public:
    explicit KeyHasher(const crypto::IHashProvider& provider) noexcept;

    // describe(algorithm).keyBytes bytes from the secure random source. This is the plaintext
    // secret handed to the key's owner.
    [[nodiscard]] credhash::security::SecureBuffer generateKey(crypto::KeyAlgorithm algorithm) const;

    // Throws CredentialError (InvalidLength) when key is not describe(algorithm).keyBytes long.
    [[nodiscard]] credhash::security::SecureBuffer hash(crypto::KeyAlgorithm algorithm,
                                                       std::span<const std::uint8_t> key) const;

    [[nodiscard]] HashedKey hashKey(crypto::KeyAlgorithm algorithm, std::span<const std::uint8_t> key) const;

    // False for closed values and for keys of the wrong length.
    [[nodiscard]] bool matches(const HashedKey& hashed, std::span<const std::uint8_t> key) const;

private:
    const crypto::IHashProvider* m_provider{ nullptr };
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_KEYHASHER_HPP
