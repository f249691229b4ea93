#include "credhash/core/CredentialErrors.hpp"
#include "credhash/crypto/providers/NativeProviderFactory.hpp"
#include "credhash/security/ScopeWipe.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include "monocypher-ed25519.h"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace credhash::crypto::providers
{
namespace
{

constexpr std::size_t g_kSha512Bytes{ 64U };
constexpr std::size_t g_kBlockIndexBytes{ 4U };
constexpr std::uint32_t g_kBitsPerByte{ 8U };

[[noreturn]] void throwUnsupported(const char* operation, std::string_view algorithmName)
{
    std::string message{ operation };
    message += ": algorithm not available in the native provider: ";
    message += algorithmName;
    throw credhash::core::CredentialError(credhash::core::CredentialErrc::UnsupportedAlgorithm, message);
}

std::array<std::uint8_t, g_kBlockIndexBytes> blockIndexBE(std::uint32_t index) noexcept
{
    std::array<std::uint8_t, g_kBlockIndexBytes> out{};
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const std::uint32_t shiftBits{ static_cast<std::uint32_t>(out.size() - 1U - i) * g_kBitsPerByte };
        out[i] = static_cast<std::uint8_t>((index >> shiftBits) & 0xFFU);
    }
    return out;
}

// RFC 8018 PBKDF2 with HMAC-SHA-512 as the PRF. The keyed HMAC state is computed once and copied
// for every PRF call.
void pbkdf2HmacSha512(std::span<const std::uint8_t> password, std::span<const std::uint8_t> salt,
                      std::uint32_t iterations, std::span<std::uint8_t> out) noexcept
{
    crypto_sha512_hmac_ctx keyed{};
    auto wipeKeyed = credhash::security::scopeWipeObject(keyed);
    crypto_sha512_hmac_init(&keyed, password.data(), password.size());

    std::array<std::uint8_t, g_kSha512Bytes> u{};
    std::array<std::uint8_t, g_kSha512Bytes> t{};
    auto wipeU = credhash::security::scopeWipe(std::span{ u });
    auto wipeT = credhash::security::scopeWipe(std::span{ t });

    std::size_t written{};
    for (std::uint32_t block{ 1U }; written < out.size(); ++block)
    {
        crypto_sha512_hmac_ctx ctx{ keyed };
        auto wipeCtx = credhash::security::scopeWipeObject(ctx);

        const auto index{ blockIndexBE(block) };
        crypto_sha512_hmac_update(&ctx, salt.data(), salt.size());
        crypto_sha512_hmac_update(&ctx, index.data(), index.size());
        crypto_sha512_hmac_final(&ctx, u.data());
        t = u;

        for (std::uint32_t i{ 1U }; i < iterations; ++i)
        {
            ctx = keyed;
            crypto_sha512_hmac_update(&ctx, u.data(), u.size());
            crypto_sha512_hmac_final(&ctx, u.data());
            for (std::size_t k{}; k < t.size(); ++k)
            {
                t[k] = static_cast<std::uint8_t>(t[k] ^ u[k]);
            }
        }

        const std::size_t chunk{ std::min(t.size(), out.size() - written) };
        std::copy_n(t.begin(), chunk, out.begin() + static_cast<std::ptrdiff_t>(written));
        written += chunk;
    }
}

class NativeHashProvider final : public credhash::crypto::IHashProvider
{
public:
    [[nodiscard]] std::string_view name() const noexcept override
    {
        return "native";
    }

    [[nodiscard]] bool supports(credhash::crypto::PasswordAlgorithm algorithm) const noexcept override
    {
        return algorithm == credhash::crypto::PasswordAlgorithm::Pbkdf2WithHmacSha512;
    }

    [[nodiscard]] bool supports(credhash::crypto::KeyAlgorithm algorithm) const noexcept override
    {
        return algorithm == credhash::crypto::KeyAlgorithm::Sha512;
    }

    [[nodiscard]] credhash::security::SecureBuffer deriveKey(credhash::crypto::PasswordAlgorithm algorithm,
                                                            std::string_view password,
                                                            std::span<const std::uint8_t> salt,
                                                            std::uint32_t iterations) const override
    {
        const auto& info{ credhash::crypto::describe(algorithm) };
        if (!supports(algorithm))
        {
            throwUnsupported("deriveKey", info.name);
        }
        if (iterations == 0U)
        {
            throw std::invalid_argument("deriveKey: invalid iteration count");
        }

        const auto* passwordBytes{ reinterpret_cast<const std::uint8_t*>(password.data()) };
        credhash::security::SecureBuffer out{ credhash::security::zeroedBuffer(info.hashBytes) };
        pbkdf2HmacSha512(std::span<const std::uint8_t>{ passwordBytes, password.size() }, salt, iterations,
                         credhash::security::asSpan(out));
        return out;
    }

    [[nodiscard]] credhash::security::SecureBuffer digest(credhash::crypto::KeyAlgorithm algorithm,
                                                         std::span<const std::uint8_t> message) const override
    {
        const auto& info{ credhash::crypto::describe(algorithm) };
        if (!supports(algorithm))
        {
            throwUnsupported("digest", info.name);
        }

        credhash::security::SecureBuffer out{ credhash::security::zeroedBuffer(g_kSha512Bytes) };
        crypto_sha512(out.data(), message.data(), message.size());
        return out;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<credhash::crypto::IHashProvider> makeNativeHashProvider()
{
    return std::make_unique<NativeHashProvider>();
}

} // namespace credhash::crypto::providers
