#ifndef INCLUDE_KMSLOCAL_PERSISTENCE_FILEADAPTERS_HPP
#define INCLUDE_KMSLOCAL_PERSISTENCE_FILEADAPTERS_HPP

#include "kmslocal/core/KeyStore.hpp"
#include "kmslocal/core/KeyStoreError.hpp"
#include "kmslocal/crypto/ICryptoProvider.hpp"
#include "kmslocal/persistence/IPersistenceAdapter.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace kmslocal::persistence
{

using AdapterPtr = std::unique_ptr<IPersistenceAdapter>;

// load*: reads and decodes an existing file. Io if it cannot be read, Codec if it does not decode.
// make*: binds `snapshot` (an empty store by default) to `path`; nothing is written until save().
// Pass KeyStore::snapshot() to put an existing in-memory store behind a file.

[[nodiscard]] kmslocal::core::KeyStoreResult<AdapterPtr> loadPlainBinaryAdapter(const std::filesystem::path& path);
[[nodiscard]] AdapterPtr makePlainBinaryAdapter(const std::filesystem::path& path,
                                                kmslocal::core::KeySnapshot snapshot = {});

[[nodiscard]] kmslocal::core::KeyStoreResult<AdapterPtr> loadPlainJsonAdapter(const std::filesystem::path& path);
[[nodiscard]] AdapterPtr makePlainJsonAdapter(const std::filesystem::path& path,
                                              kmslocal::core::KeySnapshot snapshot = {});

// The file holds nonce(24) || ciphertext || tag(16) over the binary snapshot encoding.
// Load additionally fails with InvalidEncoding, AuthenticationFailure or CryptoFailure, save with
// RandomSourceFailure or CryptoFailure. `crypto` must outlive the adapter.
[[nodiscard]] kmslocal::core::KeyStoreResult<AdapterPtr> loadEncryptedAdapter(const std::filesystem::path& path,
                                                                              std::span<const std::uint8_t> key,
                                                                              kmslocal::crypto::ICryptoProvider& crypto);
[[nodiscard]] AdapterPtr makeEncryptedAdapter(const std::filesystem::path& path, std::span<const std::uint8_t> key,
                                              kmslocal::crypto::ICryptoProvider& crypto,
                                              kmslocal::core::KeySnapshot snapshot = {});

} // namespace kmslocal::persistence

#endif // INCLUDE_KMSLOCAL_PERSISTENCE_FILEADAPTERS_HPP
