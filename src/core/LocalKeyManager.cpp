#include "kmslocal/core/IKeyManager.hpp"

#include <utility>

namespace kmslocal::core
{

LocalKeyManager::LocalKeyManager(KeyStore& store) noexcept : m_store{ &store }
{
}

KeyStoreResult<std::optional<VersionedKeyRecord>> LocalKeyManager::get(Version version) const
{
    return m_store->getWithVersion(version);
}

KeyStoreResult<std::optional<VersionedKeyRecord>> LocalKeyManager::latest() const
{
    return m_store->latestWithVersion();
}

KeyStoreResult<Version> LocalKeyManager::create(KeyRecord record)
{
    return m_store->update(std::move(record));
}

KeyStoreResult<std::optional<KeyRecord>> LocalKeyManager::remove(Version version)
{
    return m_store->drop(version);
}

} // namespace kmslocal::core
