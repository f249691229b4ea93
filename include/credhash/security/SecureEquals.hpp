#ifndef INCLUDE_CREDHASH_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_CREDHASH_SECURITY_SECUREEQUALS_HPP

#include "credhash/security/SecureBuffer.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>

namespace credhash::security
{

[[nodiscard]] inline unsigned int byteValue(std::byte b) noexcept
{
    return std::to_integer<unsigned int>(b);
}

[[nodiscard]] inline unsigned int byteValue(std::uint8_t b) noexcept
{
    return b;
}

[[nodiscard]] inline unsigned int byteValue(char c) noexcept
{
    return static_cast<unsigned char>(c);
}

// Length-constant comparison. The lengths are folded into the accumulator instead of
// returning early, then every position up to the shorter length is read exactly once, so the
// running time depends only on the lengths and never on where the inputs differ.
// Element values are read through byteValue(), found by ADL.
template <typename T>
[[nodiscard]] bool constantTimeEquals(std::span<const T> a, std::span<const T> b) noexcept
{
    volatile std::size_t diff{ a.size() ^ b.size() };
    const std::size_t common{ std::min(a.size(), b.size()) };

    for (std::size_t i{}; i < common; ++i)
    {
        diff = diff | static_cast<std::size_t>(byteValue(a[i]) ^ byteValue(b[i]));
    }

    return (diff == 0U);
}

[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    return constantTimeEquals(a, b);
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return constantTimeEquals(a, b);
}

[[nodiscard]] inline bool secureEquals(const SecureBuffer& a, const SecureBuffer& b) noexcept
{
    return secureEquals(asSpan(a), asSpan(b));
}

// True when every byte is zero. Reads every byte regardless of content.
[[nodiscard]] inline bool isAllZero(std::span<const std::uint8_t> bytes) noexcept
{
    volatile unsigned int bits{};
    for (const std::uint8_t b : bytes)
    {
        bits = bits | b;
    }
    return (bits == 0U);
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SECUREEQUALS_HPP
