#ifndef INCLUDE_KMSLOCAL_CORE_IKEYMANAGER_HPP
#define INCLUDE_KMSLOCAL_CORE_IKEYMANAGER_HPP

#include "kmslocal/core/KeyStore.hpp"
#include <optional>

namespace kmslocal::core
{

// Contract shared by every key backend, local or remote, so callers can swap one for another.
// "Not found" is an empty optional, never an error.
class IKeyManager
{
public:
    IKeyManager() = default;
    IKeyManager(const IKeyManager&) = delete;
    IKeyManager& operator=(const IKeyManager&) = delete;
    IKeyManager(IKeyManager&&) = delete;
    IKeyManager& operator=(IKeyManager&&) = delete;
    virtual ~IKeyManager() = default;

    [[nodiscard]] virtual KeyStoreResult<std::optional<VersionedKeyRecord>> get(Version version) const = 0;
    [[nodiscard]] virtual KeyStoreResult<std::optional<VersionedKeyRecord>> latest() const = 0;

    // Returns the version assigned to the new record.
    [[nodiscard]] virtual KeyStoreResult<Version> create(KeyRecord record) = 0;

    [[nodiscard]] virtual KeyStoreResult<std::optional<KeyRecord>> remove(Version version) = 0;
};

// IKeyManager over an in-process KeyStore. The store must outlive the manager.
class LocalKeyManager final : public IKeyManager
{
public:
    explicit LocalKeyManager(KeyStore& store) noexcept;

    [[nodiscard]] KeyStoreResult<std::optional<VersionedKeyRecord>> get(Version version) const override;
    [[nodiscard]] KeyStoreResult<std::optional<VersionedKeyRecord>> latest() const override;
    [[nodiscard]] KeyStoreResult<Version> create(KeyRecord record) override;
    [[nodiscard]] KeyStoreResult<std::optional<KeyRecord>> remove(Version version) override;

private:
    KeyStore* m_store{ nullptr };
};

} // namespace kmslocal::core

#endif // INCLUDE_KMSLOCAL_CORE_IKEYMANAGER_HPP
