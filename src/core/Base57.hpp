#ifndef CREDHASH_SRC_CORE_BASE57_HPP
#define CREDHASH_SRC_CORE_BASE57_HPP

#include "credhash/core/CredentialErrors.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace credhash::core::detail
{

// ASCII-sorted, without 0 1 I O l. Sorted so that string order equals value order.
constexpr std::string_view g_kBase57Alphabet{ "23456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz" };
constexpr std::uint64_t g_kBase{ 57U };
// 57^11 > 2^64, so every 64-bit word fits in 11 digits.
constexpr std::size_t g_kDigitsPerWord{ 11U };
constexpr std::uint8_t g_kInvalidDigit{ 0xFFU };

static_assert(g_kBase57Alphabet.size() == g_kBase);

constexpr std::array<std::uint8_t, 128> g_kBase57Digits{ [] {
    std::array<std::uint8_t, 128> table{};
    table.fill(g_kInvalidDigit);
    for (std::size_t i{}; i < g_kBase57Alphabet.size(); ++i)
    {
        table[static_cast<unsigned char>(g_kBase57Alphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}() };

// Appends exactly g_kDigitsPerWord characters, most significant digit first.
inline void appendBase57(std::string& out, std::uint64_t value)
{
    std::array<char, g_kDigitsPerWord> digits{};
    for (std::size_t i{ g_kDigitsPerWord }; i > 0U; --i)
    {
        digits[i - 1U] = g_kBase57Alphabet[static_cast<std::size_t>(value % g_kBase)];
        value /= g_kBase;
    }
    out.append(digits.data(), digits.size());
}

// Decodes one group of g_kDigitsPerWord characters. Throws CredentialError (InvalidFormat) on
// characters outside the alphabet and on values above 2^64-1.
[[nodiscard]] inline std::uint64_t decodeBase57(std::string_view group)
{
    if (group.size() != g_kDigitsPerWord)
    {
        throw CredentialError(CredentialErrc::InvalidFormat, "Invalid identifier group length: " +
                                                                 std::to_string(group.size()));
    }

    constexpr std::uint64_t kMax{ std::numeric_limits<std::uint64_t>::max() };
    std::uint64_t value{};
    for (const char ch : group)
    {
        const auto code{ static_cast<unsigned char>(ch) };
        const std::uint8_t digit{ (code < g_kBase57Digits.size()) ? g_kBase57Digits[code] : g_kInvalidDigit };
        if (digit == g_kInvalidDigit)
        {
            throw CredentialError(CredentialErrc::InvalidFormat,
                                  "Invalid identifier character: '" + std::string(1, ch) + "'");
        }
        if (value > (kMax - digit) / g_kBase)
        {
            throw CredentialError(CredentialErrc::InvalidFormat,
                                  "Identifier out of range: \"" + std::string{ group } + "\"");
        }
        value = (value * g_kBase) + digit;
    }
    return value;
}

} // namespace credhash::core::detail

#endif // CREDHASH_SRC_CORE_BASE57_HPP
