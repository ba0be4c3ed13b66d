#ifndef INCLUDE_KMSLOCAL_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_KMSLOCAL_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>

namespace kmslocal::security
{

// Zeroes memory through a call the optimizer may not drop as a dead store.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// For cipher contexts and derived-key structs living on the stack.
template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipeObject(T& object) noexcept
{
    secureWipe(std::as_writable_bytes(std::span<T>{ &object, 1U }));
}

// Run time depends on the lengths only, never on where the contents differ.
[[nodiscard]] bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept;

} // namespace kmslocal::security

#endif // INCLUDE_KMSLOCAL_SECURITY_MEMORYWIPER_HPP
