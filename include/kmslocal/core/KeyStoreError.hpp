#ifndef INCLUDE_KMSLOCAL_CORE_KEYSTOREERROR_HPP
#define INCLUDE_KMSLOCAL_CORE_KEYSTOREERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace kmslocal::core
{

enum class KeyStoreError : std::uint8_t
{
    // A lock's previous exclusive holder left it by an exception. Fatal for the store instance.
    Poisoned,
    Io,
    // Malformed or version-incompatible persisted bytes.
    Codec,
    // Ciphertext blob shorter than the nonce.
    InvalidEncoding,
    AuthenticationFailure,
    RandomSourceFailure,
    // The AEAD backend itself failed (cipher setup, a size it cannot handle).
    CryptoFailure,
};

template <class T> using KeyStoreResult = std::variant<T, KeyStoreError>;

[[nodiscard]] constexpr std::string_view toString(KeyStoreError e) noexcept
{
    switch (e)
    {
    case KeyStoreError::Poisoned:
        return "Poisoned";
    case KeyStoreError::Io:
        return "Io";
    case KeyStoreError::Codec:
        return "Codec";
    case KeyStoreError::InvalidEncoding:
        return "InvalidEncoding";
    case KeyStoreError::AuthenticationFailure:
        return "AuthenticationFailure";
    case KeyStoreError::RandomSourceFailure:
        return "RandomSourceFailure";
    case KeyStoreError::CryptoFailure:
        return "CryptoFailure";
    }
    return "Unknown";
}

} // namespace kmslocal::core

#endif // INCLUDE_KMSLOCAL_CORE_KEYSTOREERROR_HPP
