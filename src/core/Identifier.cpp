#include "credhash/core/Identifier.hpp"
#include "Base57.hpp"
#include "credhash/core/CredentialErrors.hpp"
#include "credhash/security/SecureRandom.hpp"
#include <stdexcept>

namespace credhash::core
{
namespace
{

[[nodiscard]] std::uint64_t randomWord()
{
    std::uint64_t value{};
    if (!credhash::security::secureRandomUint64(value))
    {
        throw std::runtime_error("Identifier: CSPRNG failure");
    }
    return value;
}

void requireLength(std::string_view encoded, std::size_t expected)
{
    if (encoded.size() != expected)
    {
        throw CredentialError(CredentialErrc::InvalidFormat, "Invalid identifier length: expecting " +
                                                                 std::to_string(expected) + ", got " +
                                                                 std::to_string(encoded.size()));
    }
}

} // namespace

Identifier Identifier::random()
{
    const std::uint64_t hi{ randomWord() };
    const std::uint64_t lo{ randomWord() };
    return Identifier{ hi, lo };
}

std::optional<Identifier> Identifier::valueOf(std::optional<std::string_view> encoded)
{
    if (!encoded)
    {
        return std::nullopt;
    }
    requireLength(*encoded, g_kIdentifierChars);
    const std::uint64_t hi{ detail::decodeBase57(encoded->substr(0U, detail::g_kDigitsPerWord)) };
    const std::uint64_t lo{ detail::decodeBase57(encoded->substr(detail::g_kDigitsPerWord)) };
    return Identifier{ hi, lo };
}

std::string Identifier::toString() const
{
    std::string out{};
    out.reserve(g_kIdentifierChars);
    detail::appendBase57(out, m_hi);
    detail::appendBase57(out, m_lo);
    return out;
}

SmallIdentifier SmallIdentifier::random()
{
    return SmallIdentifier{ randomWord() };
}

std::optional<SmallIdentifier> SmallIdentifier::valueOf(std::optional<std::string_view> encoded)
{
    if (!encoded)
    {
        return std::nullopt;
    }
    requireLength(*encoded, g_kSmallIdentifierChars);
    return SmallIdentifier{ detail::decodeBase57(*encoded) };
}

std::string SmallIdentifier::toString() const
{
    std::string out{};
    out.reserve(g_kSmallIdentifierChars);
    detail::appendBase57(out, m_value);
    return out;
}

} // namespace credhash::core
