#include "kmslocal/crypto/CryptoErrors.hpp"
#include "kmslocal/crypto/providers/NativeProviderFactory.hpp"
#include "kmslocal/security/ScopeWipe.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include "kmslocal/security/SecureRandom.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace kmslocal::crypto::providers
{
namespace
{

std::span<const std::uint8_t> asU8(std::span<const std::byte> s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

class NativeCryptoProvider final : public kmslocal::crypto::ICryptoProvider
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

        kmslocal::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw kmslocal::crypto::RandomSourceError("aeadEncrypt: CSPRNG failure");
        }

        box.cipherText.resize(plainText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx = kmslocal::security::scopeWipeObject(ctx);
        crypto_aead_init_x(&ctx, key.data(), box.nonce.data());
        crypto_aead_write(&ctx, box.cipherText.data(), box.tag.data(), asU8(associatedData).data(),
                          associatedData.size(), asU8(plainText).data(), plainText.size());

        return box;
    }

    [[nodiscard]] std::optional<kmslocal::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const kmslocal::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, kmslocal::crypto::g_aeadKeyBytes, "aeadDecrypt: key");

        kmslocal::security::SecureBuffer plainText(box.cipherText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx = kmslocal::security::scopeWipeObject(ctx);
        crypto_aead_init_x(&ctx, key.data(), box.nonce.data());
        const int rc = crypto_aead_read(&ctx, plainText.data(), box.tag.data(), asU8(associatedData).data(),
                                        associatedData.size(), box.cipherText.data(), box.cipherText.size());
        if (rc != 0)
        {
            kmslocal::security::secureRelease(plainText);
            return std::nullopt;
        }

        return plainText;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<kmslocal::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace kmslocal::crypto::providers
