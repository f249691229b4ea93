#ifndef INCLUDE_CREDHASH_CORE_IDENTIFIER_HPP
#define INCLUDE_CREDHASH_CORE_IDENTIFIER_HPP

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace credhash::core
{

constexpr std::size_t g_kIdentifierChars{ 22U };
constexpr std::size_t g_kSmallIdentifierChars{ 11U };

// 128-bit random identifier, written as 22 base-57 characters (hi then lo). String order equals
// value order.
class Identifier final
{
public:
    constexpr Identifier(std::uint64_t hi, std::uint64_t lo) noexcept : m_hi{ hi }, m_lo{ lo }
    {
    }

    // 16 bytes from the secure random source. Throws std::runtime_error on CSPRNG failure.
    [[nodiscard]] static Identifier random();

    // Absent in, absent out. Throws CredentialError (InvalidFormat) on wrong length, characters
    // outside the alphabet, or a group above 2^64-1.
    [[nodiscard]] static std::optional<Identifier> valueOf(std::optional<std::string_view> encoded);

    [[nodiscard]] constexpr std::uint64_t hi() const noexcept
    {
        return m_hi;
    }
    [[nodiscard]] constexpr std::uint64_t lo() const noexcept
    {
        return m_lo;
    }

    [[nodiscard]] std::string toString() const;

    friend constexpr auto operator<=>(const Identifier&, const Identifier&) noexcept = default;
    friend constexpr bool operator==(const Identifier&, const Identifier&) noexcept = default;

private:
    std::uint64_t m_hi;
    std::uint64_t m_lo;
};

// 64-bit form, 11 base-57 characters.
class SmallIdentifier final
{
public:
    explicit constexpr SmallIdentifier(std::uint64_t value) noexcept : m_value{ value }
    {
    }

    [[nodiscard]] static SmallIdentifier random();

    [[nodiscard]] static std::optional<SmallIdentifier> valueOf(std::optional<std::string_view> encoded);

    [[nodiscard]] constexpr std::uint64_t value() const noexcept
    {
        return m_value;
    }

    [[nodiscard]] std::string toString() const;

    friend constexpr auto operator<=>(const SmallIdentifier&, const SmallIdentifier&) noexcept = default;
    friend constexpr bool operator==(const SmallIdentifier&, const SmallIdentifier&) noexcept = default;

private:
    std::uint64_t m_value;
};

} // namespace credhash::core

template <>
struct std::hash<credhash::core::Identifier>
{
    [[nodiscard]] std::size_t operator()(const credhash::core::Identifier& id) const noexcept
    {
        return static_cast<std::size_t>(id.hi() ^ id.lo());
    }
};

template <>
struct std::hash<credhash::core::SmallIdentifier>
{
    [[nodiscard]] std::size_t operator()(const credhash::core::SmallIdentifier& id) const noexcept
    {
        return static_cast<std::size_t>(id.value());
    }
};

#endif // INCLUDE_CREDHASH_CORE_IDENTIFIER_HPP
