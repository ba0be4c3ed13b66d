#ifndef INCLUDE_KMSLOCAL_PERSISTENCE_IPERSISTENCEADAPTER_HPP
#define INCLUDE_KMSLOCAL_PERSISTENCE_IPERSISTENCEADAPTER_HPP

#include "kmslocal/core/KeyStore.hpp"
#include "kmslocal/core/KeyStoreError.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>

namespace kmslocal::persistence
{

enum class AdapterKind : std::uint8_t
{
    PlainBinary,
    PlainJson,
    Encrypted,
    Sqlite,
};

[[nodiscard]] constexpr std::string_view toString(AdapterKind k) noexcept
{
    switch (k)
    {
    case AdapterKind::PlainBinary:
        return "binary";
    case AdapterKind::PlainJson:
        return "json";
    case AdapterKind::Encrypted:
        return "encrypted";
    case AdapterKind::Sqlite:
        return "sqlite";
    }
    return "unknown";
}

struct AdapterOptions final
{
    AdapterKind kind{ AdapterKind::PlainBinary };
    std::filesystem::path path;
    // Only read by AdapterKind::Encrypted; must hold exactly 32 bytes there.
    kmslocal::security::SecureBuffer key;
};

// A key store bound to a persistence location. The adapter owns its store; the read-through helpers
// forward to it unchanged, so every lock and poisoning rule of VersionedStore applies.
class IPersistenceAdapter
{
public:
    IPersistenceAdapter() = default;
    IPersistenceAdapter(const IPersistenceAdapter&) = delete;
    IPersistenceAdapter& operator=(const IPersistenceAdapter&) = delete;
    IPersistenceAdapter(IPersistenceAdapter&&) = delete;
    IPersistenceAdapter& operator=(IPersistenceAdapter&&) = delete;
    virtual ~IPersistenceAdapter() = default;

    [[nodiscard]] virtual AdapterKind kind() const noexcept = 0;
    [[nodiscard]] virtual const std::filesystem::path& path() const noexcept = 0;

    [[nodiscard]] virtual kmslocal::core::KeyStore& store() noexcept = 0;
    [[nodiscard]] virtual const kmslocal::core::KeyStore& store() const noexcept = 0;

    // Writes the current snapshot. On failure the previously persisted state is left as it was, with one
    // exception for file adapters: Io from flushing the directory after the rename. The new contents are
    // then already in place but not known to be durable; calling save() again is safe.
    [[nodiscard]] virtual kmslocal::core::KeyStoreResult<std::monostate> save() = 0;

    [[nodiscard]] kmslocal::core::KeyStoreResult<kmslocal::core::Version> update(kmslocal::core::KeyRecord record)
    {
        return store().update(std::move(record));
    }

    [[nodiscard]] kmslocal::core::KeyStoreResult<std::optional<kmslocal::core::KeyRecord>>
    drop(kmslocal::core::Version version)
    {
        return store().drop(version);
    }

    [[nodiscard]] kmslocal::core::KeyStoreResult<std::optional<kmslocal::core::KeyRecord>>
    get(kmslocal::core::Version version) const
    {
        return store().get(version);
    }

    [[nodiscard]] kmslocal::core::KeyStoreResult<std::optional<kmslocal::core::VersionedKeyRecord>>
    getWithVersion(kmslocal::core::Version version) const
    {
        return store().getWithVersion(version);
    }

    [[nodiscard]] kmslocal::core::KeyStoreResult<std::optional<kmslocal::core::KeyRecord>> latest() const
    {
        return store().latest();
    }

    [[nodiscard]] kmslocal::core::KeyStoreResult<std::optional<kmslocal::core::VersionedKeyRecord>>
    latestWithVersion() const
    {
        return store().latestWithVersion();
    }

    [[nodiscard]] kmslocal::core::KeyStoreResult<kmslocal::core::Version> count() const
    {
        return store().count();
    }
};

} // namespace kmslocal::persistence

#endif // INCLUDE_KMSLOCAL_PERSISTENCE_IPERSISTENCEADAPTER_HPP
