#include "kmslocal/persistence/AdapterFactory.hpp"
#include "kmslocal/persistence/sqlite/SqliteAdapterFactory.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include <stdexcept>
#include <utility>

namespace kmslocal::persistence
{

kmslocal::core::KeyStoreResult<AdapterPtr> loadAdapter(const AdapterOptions& options,
                                                       kmslocal::crypto::ICryptoProvider& crypto)
{
    switch (options.kind)
    {
    case AdapterKind::PlainBinary:
        return loadPlainBinaryAdapter(options.path);
    case AdapterKind::PlainJson:
        return loadPlainJsonAdapter(options.path);
    case AdapterKind::Encrypted:
        return loadEncryptedAdapter(options.path, kmslocal::security::asSpan(options.key), crypto);
    case AdapterKind::Sqlite:
        return sqlite::loadSqliteAdapter(options.path);
    }
    throw std::invalid_argument("loadAdapter: unknown adapter kind");
}

AdapterPtr makeAdapter(const AdapterOptions& options, kmslocal::crypto::ICryptoProvider& crypto,
                       kmslocal::core::KeySnapshot snapshot)
{
    switch (options.kind)
    {
    case AdapterKind::PlainBinary:
        return makePlainBinaryAdapter(options.path, std::move(snapshot));
    case AdapterKind::PlainJson:
        return makePlainJsonAdapter(options.path, std::move(snapshot));
    case AdapterKind::Encrypted:
        return makeEncryptedAdapter(options.path, kmslocal::security::asSpan(options.key), crypto,
                                    std::move(snapshot));
    case AdapterKind::Sqlite:
        return sqlite::makeSqliteAdapter(options.path, std::move(snapshot));
    }
    throw std::invalid_argument("makeAdapter: unknown adapter kind");
}

} // namespace kmslocal::persistence
