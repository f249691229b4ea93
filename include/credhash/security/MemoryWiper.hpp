#ifndef INCLUDE_CREDHASH_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_CREDHASH_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>

namespace credhash::security
{

template <typename T>
concept Wipeable = !std::is_const_v<T> && std::is_trivially_copyable_v<T>;

// Zeroes the bytes through a primitive the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <Wipeable T> void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

template <Wipeable T, std::size_t N>
    requires(N != std::dynamic_extent)
void secureWipe(std::span<T, N> buffer) noexcept
{
    secureWipe(std::span<T>{ buffer });
}

// Wipes the characters of an ordinary string, then empties it.
inline void secureWipe(std::string& s) noexcept
{
    secureWipe(std::span<char>{ s.data(), s.size() });
    s.clear();
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_MEMORYWIPER_HPP
