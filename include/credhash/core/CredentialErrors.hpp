#ifndef INCLUDE_CREDHASH_CORE_CREDENTIALERRORS_HPP
#define INCLUDE_CREDHASH_CORE_CREDENTIALERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace credhash::core
{

enum class CredentialErrc : std::uint8_t
{
    UnsupportedAlgorithm,
    InvalidFormat,
    InvalidLength,
    InvalidIterationCount,
    ReservedValue,
};

// Stable kind name, suitable for logs.
[[nodiscard]] std::string_view toString(CredentialErrc code) noexcept;

// Raised synchronously while constructing or parsing a credential; nothing is retried and no
// partially built value escapes.
class CredentialError final : public std::invalid_argument
{
public:
    CredentialError(CredentialErrc code, const std::string& what) : std::invalid_argument(what), m_code{ code }
    {
    }

    [[nodiscard]] CredentialErrc code() const noexcept
    {
        return m_code;
    }

private:
    CredentialErrc m_code;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_CREDENTIALERRORS_HPP
