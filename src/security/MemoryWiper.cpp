#include "credhash/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace credhash::security
{

namespace
{

void zeroRange(void* data, std::size_t size) noexcept
{
#if defined(_WIN32)
    ::SecureZeroMemory(data, size);
#elif defined(__linux__)
    ::explicit_bzero(data, size);
#endif
}

} // namespace

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (!bytes.empty())
    {
        zeroRange(bytes.data(), bytes.size_bytes());
    }
}

} // namespace credhash::security
