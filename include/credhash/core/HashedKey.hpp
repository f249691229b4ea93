#ifndef INCLUDE_CREDHASH_CORE_HASHEDKEY_HPP
#define INCLUDE_CREDHASH_CORE_HASHEDKEY_HPP

#include "credhash/crypto/HashAlgorithms.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace credhash::core
{

// Unsalted digest of a randomly generated key:
//   <algorithm>.<base64url(hash)>
//
// Keys carry enough entropy that salting and stretching add nothing. A closed value (and the
// noKey() sentinel) never equals anything, including itself, and encodes as ".". HashedKey has
// no ordering.
class HashedKey final
{
public:
    // Copies hash and wipes the caller's buffer on every exit path.
    // Throws CredentialError: InvalidLength when the size does not match the algorithm,
    // ReservedValue when hash is all zero.
    HashedKey(crypto::KeyAlgorithm algorithm, std::span<std::uint8_t> hash);

    HashedKey(const HashedKey&) = delete;
    HashedKey& operator=(const HashedKey&) = delete;
    HashedKey(HashedKey&& other) noexcept;
    HashedKey& operator=(HashedKey&& other) noexcept;
    ~HashedKey() = default;

    [[nodiscard]] static HashedKey noKey();

    [[nodiscard]] static std::optional<HashedKey> valueOf(std::optional<std::string_view> encoded);

    [[nodiscard]] crypto::KeyAlgorithm algorithm() const noexcept
    {
        return m_algorithm;
    }
    [[nodiscard]] std::span<const std::uint8_t> hash() const noexcept
    {
        return credhash::security::asSpan(m_hash);
    }

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool isClosed() const noexcept;

    void close() noexcept;

    // Hash bytes are compared in constant time. Closed values are unequal to everything.
    friend bool operator==(const HashedKey& a, const HashedKey& b) noexcept;

private:
    struct ClosedTag final
    {
    };
    HashedKey(ClosedTag tag, crypto::KeyAlgorithm algorithm);

    crypto::KeyAlgorithm m_algorithm;
    credhash::security::SecureBuffer m_hash;
};

} // namespace credhash::core

// First 32 bits of the hash, big-endian. Hash bytes are already uniformly distributed.
template <>
struct std::hash<credhash::core::HashedKey>
{
    [[nodiscard]] std::size_t operator()(const credhash::core::HashedKey& key) const noexcept;
};

#endif // INCLUDE_CREDHASH_CORE_HASHEDKEY_HPP
