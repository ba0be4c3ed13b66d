#ifndef INCLUDE_KMSLOCAL_PERSISTENCE_SQLITE_SQLITEADAPTERFACTORY_HPP
#define INCLUDE_KMSLOCAL_PERSISTENCE_SQLITE_SQLITEADAPTERFACTORY_HPP

#include "kmslocal/core/KeyStore.hpp"
#include "kmslocal/core/KeyStoreError.hpp"
#include "kmslocal/persistence/IPersistenceAdapter.hpp"
#include <filesystem>
#include <memory>

namespace kmslocal::persistence::sqlite
{

// Opens the database read-only. Io if it cannot be opened, Codec if the schema or meta row is missing.
[[nodiscard]] kmslocal::core::KeyStoreResult<std::unique_ptr<kmslocal::persistence::IPersistenceAdapter>>
loadSqliteAdapter(const std::filesystem::path& dbPath);

// Binds `snapshot` to `dbPath`; the database is not touched until save().
[[nodiscard]] std::unique_ptr<kmslocal::persistence::IPersistenceAdapter>
makeSqliteAdapter(const std::filesystem::path& dbPath, kmslocal::core::KeySnapshot snapshot = {});

} // namespace kmslocal::persistence::sqlite

#endif // INCLUDE_KMSLOCAL_PERSISTENCE_SQLITE_SQLITEADAPTERFACTORY_HPP
