#ifndef INCLUDE_KMSLOCAL_CORE_KEYSTORE_HPP
#define INCLUDE_KMSLOCAL_CORE_KEYSTORE_HPP

#include "kmslocal/core/KeyRecord.hpp"
#include "kmslocal/core/VersionedStore.hpp"

namespace kmslocal::core
{

// The store every persistence adapter works with.
using KeyStore = VersionedStore<KeyRecord>;
using KeySnapshot = StoreSnapshot<KeyRecord>;
using VersionedKeyRecord = VersionedKey<KeyRecord>;

} // namespace kmslocal::core

#endif // INCLUDE_KMSLOCAL_CORE_KEYSTORE_HPP
