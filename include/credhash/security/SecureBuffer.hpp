#ifndef INCLUDE_CREDHASH_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_CREDHASH_SECURITY_SECUREBUFFER_HPP

#include "credhash/security/MemoryWiper.hpp"
#include "credhash/security/WipingAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace credhash::security
{

// Owning byte storage for salts, digests and keys. Every block it frees is wiped first.
using SecureBuffer = std::vector<std::uint8_t, WipingAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<std::uint8_t> asSpan(SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

// All-zero buffer of the given size.
[[nodiscard]] inline SecureBuffer zeroedBuffer(std::size_t size)
{
    return SecureBuffer(size, std::uint8_t{});
}

[[nodiscard]] inline SecureBuffer secureCopy(std::span<const std::uint8_t> source)
{
    SecureBuffer copy;
    copy.assign(source.begin(), source.end());
    return copy;
}

// Zeroes the contents and keeps the size.
inline void secureWipeContents(SecureBuffer& b) noexcept
{
    secureWipe(asSpan(b));
}

// Zeroes the contents, then drops the storage. The buffer is empty afterwards.
inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipeContents(b);
    SecureBuffer{}.swap(b);
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SECUREBUFFER_HPP
