#ifndef CREDHASH_SRC_CORE_CREDENTIALENCODING_HPP
#define CREDHASH_SRC_CORE_CREDENTIALENCODING_HPP

#include "credhash/core/Base64Url.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include "credhash/core/HashedPassword.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include "credhash/security/SecureEquals.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace credhash::core::detail
{

// Returns the field starting at pos and moves pos past the separator that ends it.
[[nodiscard]] inline std::string_view nextField(std::string_view encoded, std::size_t& pos, std::string_view ordinal)
{
    const std::size_t separator{ encoded.find(g_kFieldSeparator, pos) };
    if (separator == std::string_view::npos)
    {
        throw CredentialError(CredentialErrc::InvalidFormat,
                              std::string{ ordinal } + " separator (" + g_kFieldSeparator + ") not found");
    }
    const std::string_view field{ encoded.substr(pos, separator - pos) };
    pos = separator + 1U;
    return field;
}

// Empty fields are rejected as InvalidLength. All-zero material is reserved for the closed sentinel.
[[nodiscard]] inline credhash::security::SecureBuffer decodeSecretField(std::string_view field, std::string_view what)
{
    credhash::security::SecureBuffer bytes{ base64UrlDecode(field) };
    if (bytes.empty())
    {
        throw CredentialError(CredentialErrc::InvalidLength, std::string{ what } + " is empty");
    }
    if (credhash::security::isAllZero(credhash::security::asSpan(bytes)))
    {
        throw CredentialError(CredentialErrc::ReservedValue, std::string{ what } +
                                                                 " may not represent all zeroes, which is reserved "
                                                                 "for no credential (\"" +
                                                                 std::string{ g_kNoCredentialValue } + "\")");
    }
    return bytes;
}

} // namespace credhash::core::detail

#endif // CREDHASH_SRC_CORE_CREDENTIALENCODING_HPP
