#include "kmslocal/crypto/CryptoBox.hpp"

#include "kmslocal/crypto/CryptoErrors.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <utility>

namespace kmslocal::crypto
{
namespace
{

void requireKeySize(std::span<const std::uint8_t> key, const char* what)
{
    if (key.size() != g_aeadKeyBytes)
    {
        throw std::invalid_argument(what);
    }
}

} // namespace

CryptoBox::CryptoBox(ICryptoProvider& crypto) noexcept : m_crypto{ &crypto }
{
}

kmslocal::core::KeyStoreResult<std::vector<std::uint8_t>> CryptoBox::encrypt(std::span<const std::uint8_t> key,
                                                                              std::span<const std::uint8_t> plainText)
{
    requireKeySize(key, "CryptoBox::encrypt: key");

    AeadBox box{};
    try
    {
        box = m_crypto->aeadEncrypt(key, std::as_bytes(plainText), {});
    }
    catch (const RandomSourceError&)
    {
        return kmslocal::core::KeyStoreError::RandomSourceFailure;
    }
    catch (const std::runtime_error&)
    {
        return kmslocal::core::KeyStoreError::CryptoFailure;
    }

    std::vector<std::uint8_t> blob{};
    blob.reserve(g_cryptoBoxOverheadBytes + box.cipherText.size());
    blob.insert(blob.end(), box.nonce.begin(), box.nonce.end());
    blob.insert(blob.end(), box.cipherText.begin(), box.cipherText.end());
    blob.insert(blob.end(), box.tag.begin(), box.tag.end());
    return blob;
}

kmslocal::core::KeyStoreResult<kmslocal::security::SecureBuffer>
CryptoBox::decrypt(std::span<const std::uint8_t> key, std::span<const std::uint8_t> blob)
{
    requireKeySize(key, "CryptoBox::decrypt: key");

    if (blob.size() < g_aeadNonceBytes)
    {
        return kmslocal::core::KeyStoreError::InvalidEncoding;
    }
    // Room for a nonce but not for a tag: nothing here can authenticate.
    if (blob.size() < g_cryptoBoxOverheadBytes)
    {
        return kmslocal::core::KeyStoreError::AuthenticationFailure;
    }

    AeadBox box{};
    const auto nonce{ blob.first(g_aeadNonceBytes) };
    const auto tag{ blob.last(g_aeadTagBytes) };
    const auto cipherText{ blob.subspan(g_aeadNonceBytes, blob.size() - g_cryptoBoxOverheadBytes) };
    std::copy(nonce.begin(), nonce.end(), box.nonce.begin());
    std::copy(tag.begin(), tag.end(), box.tag.begin());
    box.cipherText.assign(cipherText.begin(), cipherText.end());

    std::optional<kmslocal::security::SecureBuffer> plainOpt{};
    try
    {
        plainOpt = m_crypto->aeadDecrypt(key, box, {});
    }
    catch (const std::runtime_error&)
    {
        return kmslocal::core::KeyStoreError::CryptoFailure;
    }
    if (!plainOpt)
    {
        return kmslocal::core::KeyStoreError::AuthenticationFailure;
    }
    return std::move(*plainOpt);
}

} // namespace kmslocal::crypto
