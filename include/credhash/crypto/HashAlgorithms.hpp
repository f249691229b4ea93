#ifndef INCLUDE_CREDHASH_CRYPTO_HASHALGORITHMS_HPP
#define INCLUDE_CREDHASH_CRYPTO_HASHALGORITHMS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace credhash::crypto
{

// Key-derivation algorithms for passwords, weakest first. The declaration order is the strength
// order used for re-hash recommendations and is persisted indirectly through the names, so
// entries may only ever be appended.
enum class PasswordAlgorithm : std::uint8_t
{
    Pbkdf2WithHmacMd5,
    Pbkdf2WithHmacSha1,
    Pbkdf2WithHmacSha224,
    Pbkdf2WithHmacSha256,
    Pbkdf2WithHmacSha384,
    Pbkdf2WithHmacSha512,
};

// Plain message digests for hashing random keys, weakest first. Append-only.
enum class KeyAlgorithm : std::uint8_t
{
    Md5,
    Sha1,
    Sha224,
    Sha256,
    Sha384,
    Sha512,
};

struct PasswordAlgorithmInfo final
{
    PasswordAlgorithm algorithm;
    // Persisted in encoded hashes. URL-safe, never contains the field separator.
    std::string_view name;
    // OpenSSL digest name used as the PBKDF2 PRF.
    std::string_view digestName;
    std::size_t saltBytes;
    std::size_t hashBytes;
};

struct KeyAlgorithmInfo final
{
    KeyAlgorithm algorithm;
    std::string_view name;
    std::string_view digestName;
    std::size_t keyBytes;
    std::size_t hashBytes;
};

[[nodiscard]] std::span<const PasswordAlgorithmInfo> passwordAlgorithms() noexcept;
[[nodiscard]] std::span<const KeyAlgorithmInfo> keyAlgorithms() noexcept;

[[nodiscard]] const PasswordAlgorithmInfo& describe(PasswordAlgorithm algorithm) noexcept;
[[nodiscard]] const KeyAlgorithmInfo& describe(KeyAlgorithm algorithm) noexcept;

// Case-insensitive lookup, strongest entry first.
[[nodiscard]] std::optional<PasswordAlgorithm> findPasswordAlgorithm(std::string_view name) noexcept;
[[nodiscard]] std::optional<KeyAlgorithm> findKeyAlgorithm(std::string_view name) noexcept;

} // namespace credhash::crypto

#endif // INCLUDE_CREDHASH_CRYPTO_HASHALGORITHMS_HPP
