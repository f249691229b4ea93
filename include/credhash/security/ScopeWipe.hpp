#ifndef INCLUDE_CREDHASH_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_CREDHASH_SECURITY_SCOPEWIPE_HPP

#include "credhash/security/MemoryWiper.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include "credhash/security/SecureString.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <utility>

namespace credhash::security
{

// Wipes a caller-owned range when the guard leaves scope, exception paths included.
// Used for salts and hashes handed to value constructors and for KDF scratch state.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ std::exchange(other.m_bytes, {}) }
    {
    }

    ScopeWipe& operator=(ScopeWipe&& other) noexcept
    {
        if (this != &other)
        {
            wipeNow();
            m_bytes = std::exchange(other.m_bytes, {});
        }
        return *this;
    }

    ~ScopeWipe() noexcept
    {
        wipeNow();
    }

    // Stops guarding; the range is left as it is.
    void release() noexcept
    {
        m_bytes = {};
    }

private:
    void wipeNow() noexcept
    {
        secureWipe(m_bytes);
        m_bytes = {};
    }

    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> bytes) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(bytes) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

template <Wipeable T> [[nodiscard]] ScopeWipe scopeWipeObject(T& object) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<T, 1>{ std::addressof(object), 1U }) };
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SCOPEWIPE_HPP
