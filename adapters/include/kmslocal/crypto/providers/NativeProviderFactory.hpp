#ifndef INCLUDE_KMSLOCAL_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_KMSLOCAL_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "kmslocal/crypto/ICryptoProvider.hpp"
#include <memory>

namespace kmslocal::crypto::providers
{

// Monocypher-backed provider.
[[nodiscard]] std::unique_ptr<kmslocal::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace kmslocal::crypto::providers

#endif // INCLUDE_KMSLOCAL_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
