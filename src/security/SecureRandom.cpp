#include "kmslocal/security/SecureRandom.hpp"
#include "kmslocal/security/MemoryWiper.hpp"
#include <cerrno>
#include <cstddef>
#include <limits>
#include <string_view>
#include <vector>

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

namespace kmslocal::security
{
namespace
{

// Returns how many bytes were written at `cursor`, or 0 on a hard failure.
#if defined(_WIN32)
std::size_t osRandomChunk(std::uint8_t* cursor, std::size_t remaining) noexcept
{
    constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
    const std::size_t chunk{ (remaining > kMaxChunk) ? kMaxChunk : remaining };
    const NTSTATUS status{ BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(cursor), static_cast<ULONG>(chunk),
                                           BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
    return BCRYPT_SUCCESS(status) ? chunk : 0U;
}
#else
std::size_t osRandomChunk(std::uint8_t* cursor, std::size_t remaining) noexcept
{
    for (;;)
    {
        const ssize_t received{ ::getrandom(cursor, remaining, 0) };
        if (received < 0 && errno == EINTR)
        {
            continue;
        }
        if (received <= 0 || static_cast<std::size_t>(received) > remaining)
        {
            return 0U;
        }
        return static_cast<std::size_t>(received);
    }
}
#endif

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::size_t done{ 0U };
    while (done < out.size())
    {
        const std::size_t got{ osRandomChunk(out.data() + done, out.size() - done) };
        if (got == 0U)
        {
            return false;
        }
        done += got;
    }
    return true;
}

std::optional<SecureBuffer> secureRandomBuffer(std::size_t size)
{
    SecureBuffer out(size);
    if (!secureRandomFill(out))
    {
        secureRelease(out);
        return std::nullopt;
    }
    return out;
}

std::optional<std::string> randomHexToken(std::size_t tokenBytes)
{
    constexpr std::string_view kDigits{ "0123456789abcdef" };
    constexpr unsigned kNibbleBits{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::vector<std::uint8_t> raw(tokenBytes);
    if (!secureRandomFill(raw))
    {
        return std::nullopt;
    }

    std::string hex;
    hex.reserve(raw.size() * 2U);
    for (const std::uint8_t b : raw)
    {
        hex.push_back(kDigits[b >> kNibbleBits]);
        hex.push_back(kDigits[b & kNibbleMask]);
    }
    return hex;
}

} // namespace kmslocal::security
