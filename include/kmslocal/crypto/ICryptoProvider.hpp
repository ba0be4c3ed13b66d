#ifndef INCLUDE_KMSLOCAL_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_KMSLOCAL_CRYPTO_ICRYPTOPROVIDER_HPP

#include "kmslocal/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace kmslocal::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 24 };
constexpr std::size_t g_aeadTagBytes{ 16 };

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AEAD: XChaCha20-Poly1305 (24-byte nonce, RFC 8439 construction over an HChaCha20 subkey).
    // Draws a fresh nonce per call; throws RandomSourceError if the CSPRNG fails.
    // A key of the wrong length throws std::invalid_argument; a backend failure throws CryptoBackendError.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // Returns std::nullopt on authentication failure. Throws like aeadEncrypt for anything else.
    [[nodiscard]] virtual std::optional<kmslocal::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;
};

} // namespace kmslocal::crypto

#endif // INCLUDE_KMSLOCAL_CRYPTO_ICRYPTOPROVIDER_HPP
