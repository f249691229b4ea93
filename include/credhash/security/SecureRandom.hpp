#ifndef INCLUDE_CREDHASH_SECURITY_SECURERANDOM_HPP
#define INCLUDE_CREDHASH_SECURITY_SECURERANDOM_HPP

#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace credhash::security
{

// Process-wide CSPRNG backed by the operating system. Thread-safe: every call goes straight to
// the kernel (getrandom / BCryptGenRandom) and keeps no user-space state.
// On failure the output is zeroed and false is returned.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;
// Draws one word for identifiers; `out` is untouched on failure.
[[nodiscard]] bool secureRandomUint64(std::uint64_t& out) noexcept;

// Throws std::runtime_error when the operating system source fails.
[[nodiscard]] SecureBuffer secureRandomBuffer(std::size_t size);

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SECURERANDOM_HPP
