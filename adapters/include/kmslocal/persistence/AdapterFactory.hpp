#ifndef INCLUDE_KMSLOCAL_PERSISTENCE_ADAPTERFACTORY_HPP
#define INCLUDE_KMSLOCAL_PERSISTENCE_ADAPTERFACTORY_HPP

#include "kmslocal/core/KeyStore.hpp"
#include "kmslocal/core/KeyStoreError.hpp"
#include "kmslocal/crypto/ICryptoProvider.hpp"
#include "kmslocal/persistence/FileAdapters.hpp"
#include "kmslocal/persistence/IPersistenceAdapter.hpp"

namespace kmslocal::persistence
{

// Dispatches on options.kind. `crypto` is only used by AdapterKind::Encrypted and must outlive the adapter.
[[nodiscard]] kmslocal::core::KeyStoreResult<AdapterPtr> loadAdapter(const AdapterOptions& options,
                                                                     kmslocal::crypto::ICryptoProvider& crypto);

// Binds `snapshot` (an empty store by default) to options.path without touching the file.
[[nodiscard]] AdapterPtr makeAdapter(const AdapterOptions& options, kmslocal::crypto::ICryptoProvider& crypto,
                                     kmslocal::core::KeySnapshot snapshot = {});

} // namespace kmslocal::persistence

#endif // INCLUDE_KMSLOCAL_PERSISTENCE_ADAPTERFACTORY_HPP
