#ifndef INCLUDE_CREDHASH_CORE_HASHPOLICY_HPP
#define INCLUDE_CREDHASH_CORE_HASHPOLICY_HPP

#include "credhash/crypto/HashAlgorithms.hpp"
#include <cstdint>
#include <limits>
#include <string_view>

namespace credhash::core
{

// Settings used for new password hashes. Existing hashes always keep the settings they were
// created with; a hash made with weaker settings than the policy should be re-hashed at the
// next successful login.
struct PasswordPolicy final
{
    crypto::PasswordAlgorithm algorithm;
    std::uint32_t iterations;
};

// Iteration counts are persisted as signed 32-bit values.
constexpr std::uint32_t g_kMaxIterations{ static_cast<std::uint32_t>(std::numeric_limits<std::int32_t>::max()) };

// May change between releases. Chosen to take around 100 ms per hash on commodity hardware.
[[nodiscard]] PasswordPolicy defaultPasswordPolicy() noexcept;

[[nodiscard]] crypto::KeyAlgorithm recommendedKeyAlgorithm() noexcept;

[[nodiscard]] bool isWeakerThan(const PasswordPolicy& used, const PasswordPolicy& recommended) noexcept;

// Registry lookups that throw CredentialError (UnsupportedAlgorithm) on unknown names.
[[nodiscard]] crypto::PasswordAlgorithm requirePasswordAlgorithm(std::string_view name);
[[nodiscard]] crypto::KeyAlgorithm requireKeyAlgorithm(std::string_view name);

// Throws CredentialError (InvalidIterationCount) outside [1, g_kMaxIterations].
void requireIterations(std::uint32_t iterations);

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_HASHPOLICY_HPP
