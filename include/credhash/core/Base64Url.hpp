#ifndef INCLUDE_CREDHASH_CORE_BASE64URL_HPP
#define INCLUDE_CREDHASH_CORE_BASE64URL_HPP

#include "credhash/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace credhash::core
{

// RFC 4648 section 5 alphabet, without padding. Output is safe in URLs, cookies and file names.
[[nodiscard]] std::string base64UrlEncode(std::span<const std::uint8_t> bytes);

// Throws CredentialError (InvalidFormat) on characters outside the URL-safe alphabet, on padding,
// and on lengths that cannot come from the encoder.
[[nodiscard]] credhash::security::SecureBuffer base64UrlDecode(std::string_view text);

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_BASE64URL_HPP
