#ifndef INCLUDE_KMSLOCAL_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_KMSLOCAL_SECURITY_SCOPEWIPE_HPP

#include "kmslocal/security/MemoryWiper.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include "kmslocal/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <utility>

namespace kmslocal::security
{

// Wipes a borrowed byte range when the guard leaves scope.
// The owner must not reallocate the range while the guard is alive.
class [[nodiscard]] ScopeWipe final
{
public:
    ScopeWipe() noexcept = default;

    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ std::exchange(other.m_bytes, {}) }
    {
    }

    ScopeWipe& operator=(ScopeWipe&& other) noexcept
    {
        if (this != &other)
        {
            secureWipe(m_bytes);
            m_bytes = std::exchange(other.m_bytes, {});
        }
        return *this;
    }

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

    // Leaves the bytes as they are.
    void dismiss() noexcept
    {
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
};

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
[[nodiscard]] ScopeWipe scopeWipeObject(T& object) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<T>{ &object, 1U }) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<std::uint8_t>{ b.data(), b.size() }) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<char>{ s.data(), s.size() }) };
}

// For secrets that arrive as std::string from a third-party API (a JSON field, a getline buffer).
[[nodiscard]] inline ScopeWipe scopeWipe(std::string& s) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<char>{ s.data(), s.size() }) };
}

} // namespace kmslocal::security

#endif // INCLUDE_KMSLOCAL_SECURITY_SCOPEWIPE_HPP
