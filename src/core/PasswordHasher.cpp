#include "credhash/core/PasswordHasher.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include "credhash/core/HashPolicy.hpp"
#include "credhash/security/SecureEquals.hpp"
#include "credhash/security/SecureRandom.hpp"
#include <stdexcept>
#include <string>

namespace credhash::core
{

PasswordHasher::PasswordHasher(const crypto::IHashProvider& provider, PasswordPolicy policy) noexcept
    : m_provider{ &provider }, m_policy{ policy }
{
}

credhash::security::SecureBuffer PasswordHasher::generateSalt(crypto::PasswordAlgorithm algorithm) const
{
    return credhash::security::secureRandomBuffer(crypto::describe(algorithm).saltBytes);
}

credhash::security::SecureBuffer PasswordHasher::hash(std::string_view password, crypto::PasswordAlgorithm algorithm,
                                                     std::span<const std::uint8_t> salt,
                                                     std::uint32_t iterations) const
{
    const auto& info{ crypto::describe(algorithm) };
    if (salt.size() != info.saltBytes)
    {
        throw CredentialError(CredentialErrc::InvalidLength, "Invalid salt length: expecting " +
                                                                 std::to_string(info.saltBytes) + ", got " +
                                                                 std::to_string(salt.size()));
    }
    requireIterations(iterations);

    credhash::security::SecureBuffer out{ m_provider->deriveKey(algorithm, password, salt, iterations) };
    if (out.size() != info.hashBytes)
    {
        throw std::runtime_error("hash: provider returned " + std::to_string(out.size()) + " bytes, expecting " +
                                 std::to_string(info.hashBytes));
    }
    return out;
}

HashedPassword PasswordHasher::hashPassword(std::string_view password) const
{
    credhash::security::SecureBuffer salt{ generateSalt(m_policy.algorithm) };
    credhash::security::SecureBuffer derived{
        hash(password, m_policy.algorithm, credhash::security::asSpan(salt), m_policy.iterations)
    };
    return HashedPassword{ m_policy.algorithm, credhash::security::asSpan(salt), m_policy.iterations,
                           credhash::security::asSpan(derived) };
}

bool PasswordHasher::matches(const HashedPassword& hashed, std::string_view password) const
{
    const credhash::security::SecureBuffer candidate{
        m_provider->deriveKey(hashed.algorithm(), password, hashed.salt(), hashed.iterations())
    };
    // Bitwise AND: no early exit on the closed check.
    return static_cast<bool>(!hashed.isClosed() &
                             credhash::security::secureEquals(credhash::security::asSpan(candidate), hashed.hash()));
}

} // namespace credhash::core
