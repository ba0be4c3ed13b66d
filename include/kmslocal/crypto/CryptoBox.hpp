#ifndef INCLUDE_KMSLOCAL_CRYPTO_CRYPTOBOX_HPP
#define INCLUDE_KMSLOCAL_CRYPTO_CRYPTOBOX_HPP

#include "kmslocal/core/KeyStoreError.hpp"
#include "kmslocal/crypto/ICryptoProvider.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kmslocal::crypto
{

constexpr std::size_t g_cryptoBoxOverheadBytes{ g_aeadNonceBytes + g_aeadTagBytes };

// Seals byte payloads into a single blob: nonce(24) || ciphertext || tag(16).
// Keys are supplied by the caller on every call; nothing is derived, cached or stored here.
class CryptoBox final
{
public:
    explicit CryptoBox(ICryptoProvider& crypto) noexcept;

    // RandomSourceFailure if no nonce could be drawn, CryptoFailure if the provider throws anything else
    // derived from std::runtime_error.
    [[nodiscard]] kmslocal::core::KeyStoreResult<std::vector<std::uint8_t>>
    encrypt(std::span<const std::uint8_t> key, std::span<const std::uint8_t> plainText);

    // InvalidEncoding if `blob` cannot hold a nonce, AuthenticationFailure on any tag mismatch,
    // CryptoFailure if the provider throws.
    [[nodiscard]] kmslocal::core::KeyStoreResult<kmslocal::security::SecureBuffer>
    decrypt(std::span<const std::uint8_t> key, std::span<const std::uint8_t> blob);

private:
    ICryptoProvider* m_crypto{ nullptr };
};

} // namespace kmslocal::crypto

#endif // INCLUDE_KMSLOCAL_CRYPTO_CRYPTOBOX_HPP
