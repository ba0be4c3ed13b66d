#include "kmslocal/crypto/CryptoErrors.hpp"
#include "kmslocal/crypto/providers/OpenSslProviderFactory.hpp"
#include "kmslocal/security/ScopeWipe.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include "kmslocal/security/SecureRandom.hpp"
#include "monocypher.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <openssl/evp.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace kmslocal::crypto::providers
{
namespace
{

constexpr std::size_t g_kIetfNonceBytes{ 12U };
constexpr std::size_t g_kHChaChaInputBytes{ 16U };
constexpr std::size_t g_kIetfNoncePrefixBytes{ 4U };

using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

// EVP lengths are int.
void requireIntSized(std::size_t n, const char* what)
{
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw kmslocal::crypto::CryptoBackendError(what);
    }
}

// XChaCha20-Poly1305 reduces to IETF ChaCha20-Poly1305: the subkey is HChaCha20(key, nonce[0..16))
// and the 12-byte nonce is four zero bytes followed by nonce[16..24).
struct XChaChaParams final
{
    std::array<std::uint8_t, kmslocal::crypto::g_aeadKeyBytes> subKey{};
    std::array<std::uint8_t, g_kIetfNonceBytes> ietfNonce{};
};

void deriveXChaChaParams(std::span<const std::uint8_t> key,
                         const std::array<std::uint8_t, kmslocal::crypto::g_aeadNonceBytes>& nonce,
                         XChaChaParams& out) noexcept
{
    crypto_chacha20_h(out.subKey.data(), key.data(), nonce.data());
    out.ietfNonce.fill(0U);
    for (std::size_t i{}; i < kmslocal::crypto::g_aeadNonceBytes - g_kHChaChaInputBytes; ++i)
    {
        out.ietfNonce[g_kIetfNoncePrefixBytes + i] = nonce[g_kHChaChaInputBytes + i];
    }
}

EvpCipherCtxPtr initCipher(bool encrypt, const XChaChaParams& params, const char* what)
{
    EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
    if (!ctx)
    {
        throw kmslocal::crypto::CryptoBackendError(what);
    }

    const int enc{ encrypt ? 1 : 0 };
    if (EVP_CipherInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr, enc) != 1)
    {
        throw kmslocal::crypto::CryptoBackendError(what);
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(params.ietfNonce.size()), nullptr) !=
        1)
    {
        throw kmslocal::crypto::CryptoBackendError(what);
    }
    if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, params.subKey.data(), params.ietfNonce.data(), enc) != 1)
    {
        throw kmslocal::crypto::CryptoBackendError(what);
    }
    return ctx;
}

class OpenSslCryptoProvider final : public kmslocal::crypto::ICryptoProvider
{
public:
    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return kmslocal::security::secureRandomFill(out);
    }

    [[nodiscard]] kmslocal::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                        std::span<const std::byte> plainText,
                                                        std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, kmslocal::crypto::g_aeadKeyBytes, "aeadEncrypt: key");
        requireIntSized(plainText.size(), "aeadEncrypt: plainText too large");
        requireIntSized(associatedData.size(), "aeadEncrypt: associatedData too large");

        kmslocal::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw kmslocal::crypto::RandomSourceError("aeadEncrypt: CSPRNG failure");
        }

        XChaChaParams params{};
        auto wipeParams = kmslocal::security::scopeWipeObject(params);
        deriveXChaChaParams(key, box.nonce, params);

        auto ctx{ initCipher(true, params, "aeadEncrypt: cipher init failed") };

        int len{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (!associatedData.empty() &&
            EVP_EncryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw kmslocal::crypto::CryptoBackendError("aeadEncrypt: add aad failed");
        }

        box.cipherText.resize(plainText.size());
        int outLen{ 0 };
        if (!plainText.empty())
        {
            const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
            if (EVP_EncryptUpdate(ctx.get(), box.cipherText.data(), &outLen, ptPtr,
                                  static_cast<int>(plainText.size())) != 1)
            {
                throw kmslocal::crypto::CryptoBackendError("aeadEncrypt: encrypt update failed");
            }
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) != box.cipherText.size())
        {
            throw kmslocal::crypto::CryptoBackendError("aeadEncrypt: invalid output length");
        }

        std::array<unsigned char, 1> finalScratch{};
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), finalScratch.data(), &finalLen) != 1 || finalLen != 0)
        {
            throw kmslocal::crypto::CryptoBackendError("aeadEncrypt: encrypt final failed");
        }

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) !=
            1)
        {
            throw kmslocal::crypto::CryptoBackendError("aeadEncrypt: get tag failed");
        }

        return box;
    }

    [[nodiscard]] std::optional<kmslocal::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const kmslocal::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, kmslocal::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        requireIntSized(box.cipherText.size(), "aeadDecrypt: cipherText too large");
        requireIntSized(associatedData.size(), "aeadDecrypt: associatedData too large");

        XChaChaParams params{};
        auto wipeParams = kmslocal::security::scopeWipeObject(params);
        deriveXChaChaParams(key, box.nonce, params);

        auto ctx{ initCipher(false, params, "aeadDecrypt: cipher init failed") };

        int len{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (!associatedData.empty() &&
            EVP_DecryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw kmslocal::crypto::CryptoBackendError("aeadDecrypt: add aad failed");
        }

        kmslocal::security::SecureBuffer plainText(box.cipherText.size());
        int outLen{ 0 };
        if (!box.cipherText.empty() && EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, box.cipherText.data(),
                                                         static_cast<int>(box.cipherText.size())) != 1)
        {
            kmslocal::security::secureRelease(plainText);
            return std::nullopt;
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) != plainText.size())
        {
            kmslocal::security::secureRelease(plainText);
            return std::nullopt;
        }

        std::array<std::uint8_t, kmslocal::crypto::g_aeadTagBytes> tagCopy{ box.tag };
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) !=
            1)
        {
            throw kmslocal::crypto::CryptoBackendError("aeadDecrypt: set tag failed");
        }

        std::array<unsigned char, 1> finalScratch{};
        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), finalScratch.data(), &finalLen) != 1 || finalLen != 0)
        {
            kmslocal::security::secureRelease(plainText);
            return std::nullopt;
        }

        return plainText;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<kmslocal::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace kmslocal::crypto::providers
