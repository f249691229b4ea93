#ifndef INCLUDE_CREDHASH_CORE_PASSWORDHASHER_HPP
#define INCLUDE_CREDHASH_CORE_PASSWORDHASHER_HPP

#include "credhash/core/HashPolicy.hpp"
#include "credhash/core/HashedPassword.hpp"
#include "credhash/crypto/HashAlgorithms.hpp"
#include "credhash/crypto/IHashProvider.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>
#include <string_view>

namespace credhash::core
{

// Derives and verifies password hashes. Derivation is CPU-bound and synchronous; callers that hash
// concurrently size their own worker pool. The provider must outlive the hasher.
class PasswordHasher final
{
public:
    explicit PasswordHasher(const crypto::IHashProvider& provider,
                            PasswordPolicy policy = defaultPasswordPolicy()) noexcept;

    [[nodiscard]] const PasswordPolicy& policy() const noexcept
    {
        return m_policy;
    }

    // describe(algorithm).saltBytes bytes from the secure random source.
    [[nodiscard]] credhash::security::SecureBuffer generateSalt(crypto::PasswordAlgorithm algorithm) const;

    // Throws CredentialError: InvalidLength on a salt of the wrong size, InvalidIterationCount outside [1, g_kMaxIterations].
    [[nodiscard]] credhash::security::SecureBuffer hash(std::string_view password, crypto::PasswordAlgorithm algorithm,
                                                       std::span<const std::uint8_t> salt,
                                                       std::uint32_t iterations) const;

    // Fresh salt, policy algorithm and iterations.
    [[nodiscard]] HashedPassword hashPassword(std::string_view password) const;

    // Re-derives with the stored settings and compares in constant time. Always false when closed;
    // the derivation still runs so a closed value costs the same as a mismatch.
    [[nodiscard]] bool matches(const HashedPassword& hashed, std::string_view password) const;

    [[nodiscard]] bool isRehashRecommended(const HashedPassword& hashed) const noexcept
    {
        return hashed.isRehashRecommended(m_policy);
    }

private:
    const crypto::IHashProvider* m_provider{ nullptr };
    PasswordPolicy m_policy;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_PASSWORDHASHER_HPP
