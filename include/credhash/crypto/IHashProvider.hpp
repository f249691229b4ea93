#ifndef INCLUDE_CREDHASH_CRYPTO_IHASHPROVIDER_HPP
#define INCLUDE_CREDHASH_CRYPTO_IHASHPROVIDER_HPP

#include "credhash/crypto/HashAlgorithms.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace credhash::crypto
{

// Backend for the registry's KDF and digest primitives.
class IHashProvider
{
public:
    IHashProvider() = default;
    IHashProvider(const IHashProvider&) = delete;
    IHashProvider& operator=(const IHashProvider&) = delete;
    IHashProvider(IHashProvider&&) = delete;
    IHashProvider& operator=(IHashProvider&&) = delete;
    virtual ~IHashProvider() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual bool supports(PasswordAlgorithm algorithm) const noexcept = 0;
    [[nodiscard]] virtual bool supports(KeyAlgorithm algorithm) const noexcept = 0;

    // PBKDF2 with the algorithm's HMAC digest. Returns exactly describe(algorithm).hashBytes bytes.
    // Callers validate salt length and iterations; the provider only rejects what it cannot run.
    // Throws core::CredentialError (UnsupportedAlgorithm) for algorithms it does not implement and
    // std::runtime_error on backend failure.
    [[nodiscard]] virtual credhash::security::SecureBuffer deriveKey(PasswordAlgorithm algorithm,
                                                                    std::string_view password,
                                                                    std::span<const std::uint8_t> salt,
                                                                    std::uint32_t iterations) const = 0;

    // Single digest pass. Returns exactly describe(algorithm).hashBytes bytes.
    [[nodiscard]] virtual credhash::security::SecureBuffer digest(KeyAlgorithm algorithm,
                                                                 std::span<const std::uint8_t> message) const = 0;
};

} // namespace credhash::crypto

#endif // INCLUDE_CREDHASH_CRYPTO_IHASHPROVIDER_HPP
