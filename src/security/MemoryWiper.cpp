#include "kmslocal/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace kmslocal::security
{

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(bytes.data(), bytes.size());
#else
    ::explicit_bzero(bytes.data(), bytes.size());
#endif
}

bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    // volatile keeps the loop from exiting at the first difference.
    volatile std::uint32_t acc{ 0U };
    for (std::size_t i{}; i < a.size(); ++i)
    {
        acc = acc | static_cast<std::uint32_t>(a[i] ^ b[i]);
    }
    return acc == 0U;
}

} // namespace kmslocal::security
