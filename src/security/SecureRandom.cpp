#include "credhash/security/SecureRandom.hpp"
#include "credhash/security/MemoryWiper.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <stdexcept>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace credhash::security
{

namespace
{

// getrandom(2) never returns a short read for requests up to 256 bytes once the pool is
// initialised; larger requests are split so a signal can only cost a retry of one chunk.
constexpr std::size_t g_kChunkBytes{ 256U };

// Fills one chunk of at most g_kChunkBytes.
[[nodiscard]] bool fillChunk(std::uint8_t* out, std::size_t size) noexcept
{
#if defined(_WIN32)
    return BCRYPT_SUCCESS(BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(out), static_cast<ULONG>(size),
                                          BCRYPT_USE_SYSTEM_PREFERRED_RNG));
#elif defined(__linux__)
    std::size_t filled{};
    while (filled < size)
    {
        const ssize_t got{ ::getrandom(out + filled, size - filled, 0) };
        if (got < 0 && errno == EINTR)
        {
            continue;
        }
        if (got <= 0 || static_cast<std::size_t>(got) > size - filled)
        {
            return false;
        }
        filled += static_cast<std::size_t>(got);
    }
    return true;
#endif
}

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    for (std::size_t offset{}; offset < out.size(); offset += g_kChunkBytes)
    {
        const std::size_t size{ std::min(g_kChunkBytes, out.size() - offset) };
        if (!fillChunk(out.data() + offset, size))
        {
            secureWipe(out);
            return false;
        }
    }
    return true;
}

bool secureRandomUint64(std::uint64_t& out) noexcept
{
    std::array<std::uint8_t, sizeof(std::uint64_t)> word{};
    const bool ok{ secureRandomFill(std::span{ word }) };
    if (ok)
    {
        std::memcpy(&out, word.data(), word.size());
    }
    secureWipe(std::span{ word });
    return ok;
}

SecureBuffer secureRandomBuffer(std::size_t size)
{
    SecureBuffer out(size);
    if (!secureRandomFill(asSpan(out)))
    {
        throw std::runtime_error("secureRandomBuffer: CSPRNG failure");
    }
    return out;
}

} // namespace credhash::security
