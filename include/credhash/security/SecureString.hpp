#ifndef INCLUDE_CREDHASH_SECURITY_SECURESTRING_HPP
#define INCLUDE_CREDHASH_SECURITY_SECURESTRING_HPP

#include "credhash/security/SecureBuffer.hpp"
#include "credhash/security/WipingAllocator.hpp"
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace credhash::security
{
// Holds plaintext passwords read from the terminal.
using SecureString = std::vector<char, WipingAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // Use parentheses to strictly enforce the Range Constructor.
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

// Moves the contents of an ordinary std::string into a SecureString and wipes the original.
[[nodiscard]] inline SecureString secureStringTake(std::string& s)
{
    SecureString out{ secureStringFrom(s) };
    secureWipe(s);
    return out;
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(std::span{ s });
    SecureString{}.swap(s);
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SECURESTRING_HPP
