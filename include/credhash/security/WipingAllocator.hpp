#ifndef INCLUDE_CREDHASH_SECURITY_WIPINGALLOCATOR_HPP
#define INCLUDE_CREDHASH_SECURITY_WIPINGALLOCATOR_HPP

#include "credhash/security/MemoryWiper.hpp"
#include <cstddef>
#include <memory>
#include <span>
#include <type_traits>

namespace credhash::security
{

// std::allocator that zeroes each block before returning it to the heap. Backs the buffers
// holding salts, digests, keys and password copies, so a reallocation never leaves a stale
// copy behind.
template <Wipeable T> class WipingAllocator
{
public:
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;

    WipingAllocator() noexcept = default;

    template <Wipeable U> constexpr WipingAllocator([[maybe_unused]] const WipingAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        return n == 0U ? nullptr : std::allocator<T>{}.allocate(n);
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        secureWipe(std::span<T>{ p, n });
        std::allocator<T>{}.deallocate(p, n);
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const WipingAllocator<T>& a,
                          [[maybe_unused]] const WipingAllocator<U>& b) noexcept
{
    return true;
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_WIPINGALLOCATOR_HPP
