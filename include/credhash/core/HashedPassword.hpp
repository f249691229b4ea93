#ifndef INCLUDE_CREDHASH_CORE_HASHEDPASSWORD_HPP
#define INCLUDE_CREDHASH_CORE_HASHEDPASSWORD_HPP

#include "credhash/core/HashPolicy.hpp"
#include "credhash/crypto/HashAlgorithms.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace credhash::core
{

// Separates the fields of encoded hashes. Not part of the unpadded URL-safe base64 alphabet and
// never used in algorithm names.
constexpr char g_kFieldSeparator{ '.' };

// Encoding of a credential that is not set (the closed sentinel).
constexpr std::string_view g_kNoCredentialValue{ "." };

// Salted, iterated password hash:
//   <algorithm>.<base64url(salt)>.<iterations>.<base64url(hash)>
//
// Immutable apart from close(), which zeroes the salt and hash in place. A closed value (and the
// noPassword() sentinel) never matches any password and encodes as ".". Moved-from values are
// closed as well.
class HashedPassword final
{
public:
    // Copies salt and hash, then wipes the caller's buffers, on failure as well as on success.
    // Throws CredentialError: InvalidLength when the sizes do not match the algorithm,
    // InvalidIterationCount outside [1, g_kMaxIterations], ReservedValue when salt or hash is all zero.
    HashedPassword(crypto::PasswordAlgorithm algorithm, std::span<std::uint8_t> salt, std::uint32_t iterations,
                   std::span<std::uint8_t> hash);

    HashedPassword(const HashedPassword&) = delete;
    HashedPassword& operator=(const HashedPassword&) = delete;
    HashedPassword(HashedPassword&& other) noexcept;
    HashedPassword& operator=(HashedPassword&& other) noexcept;
    ~HashedPassword() = default;

    // Stands in where no password is set. Behaves as already closed.
    [[nodiscard]] static HashedPassword noPassword();

    // Parses the result of toString(). Absent input gives an absent result; malformed input throws
    // CredentialError.
    [[nodiscard]] static std::optional<HashedPassword> valueOf(std::optional<std::string_view> encoded);

    [[nodiscard]] crypto::PasswordAlgorithm algorithm() const noexcept
    {
        return m_algorithm;
    }
    [[nodiscard]] std::span<const std::uint8_t> salt() const noexcept
    {
        return credhash::security::asSpan(m_salt);
    }
    [[nodiscard]] std::uint32_t iterations() const noexcept
    {
        return m_iterations;
    }
    [[nodiscard]] std::span<const std::uint8_t> hash() const noexcept
    {
        return credhash::security::asSpan(m_hash);
    }

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool isClosed() const noexcept;

    // Idempotent. Closed is terminal.
    void close() noexcept;

    // True when the algorithm or iteration count is weaker than the policy. Callers re-hash with
    // the current policy after a successful match.
    [[nodiscard]] bool isRehashRecommended() const noexcept;
    [[nodiscard]] bool isRehashRecommended(const PasswordPolicy& policy) const noexcept;

    // Field-wise; salt and hash are compared in constant time.
    friend bool operator==(const HashedPassword& a, const HashedPassword& b) noexcept;

private:
    struct ClosedTag final
    {
    };
    HashedPassword(ClosedTag tag, crypto::PasswordAlgorithm algorithm, std::uint32_t iterations);

    crypto::PasswordAlgorithm m_algorithm;
    std::uint32_t m_iterations;
    credhash::security::SecureBuffer m_salt;
    credhash::security::SecureBuffer m_hash;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_HASHEDPASSWORD_HPP
