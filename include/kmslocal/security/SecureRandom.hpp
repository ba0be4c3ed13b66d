#ifndef INCLUDE_KMSLOCAL_SECURITY_SECURERANDOM_HPP
#define INCLUDE_KMSLOCAL_SECURITY_SECURERANDOM_HPP

#include "kmslocal/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace kmslocal::security
{

// Fills `out` from the operating system CSPRNG. Returns false if the source is unavailable;
// `out` is then left in an unspecified state and must not be used.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// `size` fresh random bytes, or std::nullopt if the CSPRNG failed.
[[nodiscard]] std::optional<SecureBuffer> secureRandomBuffer(std::size_t size);

// Lowercase hex of `tokenBytes` random bytes, for unpredictable file and directory names.
[[nodiscard]] std::optional<std::string> randomHexToken(std::size_t tokenBytes);

} // namespace kmslocal::security

#endif // INCLUDE_KMSLOCAL_SECURITY_SECURERANDOM_HPP
