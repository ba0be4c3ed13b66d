#ifndef KMSLOCAL_SRC_PERSISTENCE_STOREADAPTERBASE_HPP
#define KMSLOCAL_SRC_PERSISTENCE_STOREADAPTERBASE_HPP

#include "kmslocal/core/KeyStore.hpp"
#include "kmslocal/persistence/IPersistenceAdapter.hpp"
#include <filesystem>
#include <memory>
#include <utility>

namespace kmslocal::persistence::detail
{

// Owns the store and the location; concrete adapters only implement save().
class StoreAdapterBase : public IPersistenceAdapter
{
public:
    StoreAdapterBase(AdapterKind kind, std::filesystem::path path, kmslocal::core::KeySnapshot snapshot)
        : m_kind{ kind }, m_path{ std::move(path) },
          m_store{ std::make_unique<kmslocal::core::KeyStore>(std::move(snapshot)) }
    {
    }

    [[nodiscard]] AdapterKind kind() const noexcept override
    {
        return m_kind;
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept override
    {
        return m_path;
    }

    [[nodiscard]] kmslocal::core::KeyStore& store() noexcept override
    {
        return *m_store;
    }

    [[nodiscard]] const kmslocal::core::KeyStore& store() const noexcept override
    {
        return *m_store;
    }

private:
    AdapterKind m_kind;
    std::filesystem::path m_path;
    std::unique_ptr<kmslocal::core::KeyStore> m_store;
};

} // namespace kmslocal::persistence::detail

#endif // KMSLOCAL_SRC_PERSISTENCE_STOREADAPTERBASE_HPP
