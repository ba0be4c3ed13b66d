#ifndef INCLUDE_KMSLOCAL_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_KMSLOCAL_SECURITY_SECUREBUFFER_HPP

#include "kmslocal/security/MemoryWiper.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <span>
#include <type_traits>
#include <vector>

namespace kmslocal::security
{

// Allocator that wipes every block before handing it back to the heap.
template <class T> struct ZeroAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t count)
    {
        if (count > g_kMaxCount)
        {
            throw std::bad_array_new_length{};
        }
        return count == 0U ? nullptr
                           : static_cast<T*>(::operator new(count * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* block, std::size_t count) noexcept
    {
        if (block != nullptr)
        {
            secureWipe(std::span<T>{ block, count });
            ::operator delete(block, std::align_val_t{ alignof(T) });
        }
    }

private:
    static constexpr std::size_t g_kMaxCount{ std::numeric_limits<std::size_t>::max() / sizeof(T) };
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& a,
                          [[maybe_unused]] const ZeroAllocator<U>& b) noexcept
{
    return true;
}

using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    return SecureBuffer(bytes.begin(), bytes.end());
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

// Wipes the contents and returns the allocation, leaving `b` empty with no capacity.
inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(std::span{ b.data(), b.size() });
    SecureBuffer empty{};
    b.swap(empty);
}

} // namespace kmslocal::security

#endif // INCLUDE_KMSLOCAL_SECURITY_SECUREBUFFER_HPP
