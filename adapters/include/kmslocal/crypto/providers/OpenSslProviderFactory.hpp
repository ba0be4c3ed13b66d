#ifndef INCLUDE_KMSLOCAL_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_KMSLOCAL_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "kmslocal/crypto/ICryptoProvider.hpp"
#include <memory>

namespace kmslocal::crypto::providers
{

// OpenSSL EVP ChaCha20-Poly1305 provider. Output is byte-compatible with the native provider.
[[nodiscard]] std::unique_ptr<kmslocal::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace kmslocal::crypto::providers

#endif // INCLUDE_KMSLOCAL_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
