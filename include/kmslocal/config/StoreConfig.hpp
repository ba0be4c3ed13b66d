#ifndef INCLUDE_KMSLOCAL_CONFIG_STORECONFIG_HPP
#define INCLUDE_KMSLOCAL_CONFIG_STORECONFIG_HPP

#include "kmslocal/crypto/ICryptoProvider.hpp"
#include "kmslocal/persistence/IPersistenceAdapter.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace kmslocal::config
{

class ConfigError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class ProviderKind : std::uint8_t
{
    Native,
    OpenSsl,
};

struct StoreConfig final
{
    kmslocal::persistence::AdapterKind adapter{ kmslocal::persistence::AdapterKind::PlainBinary };
    std::filesystem::path path;
    // Present only when the file named a key_hex or key_file.
    std::optional<kmslocal::security::SecureBuffer> key;
    ProviderKind provider{ ProviderKind::Native };
};

// "binary" | "json" | "encrypted" | "sqlite"
[[nodiscard]] std::optional<kmslocal::persistence::AdapterKind> parseAdapterKind(std::string_view name) noexcept;

// "native" | "openssl"
[[nodiscard]] std::optional<ProviderKind> parseProviderKind(std::string_view name) noexcept;

// Even number of hex digits, either case. Anything else yields std::nullopt.
[[nodiscard]] std::optional<kmslocal::security::SecureBuffer> parseHexBytes(std::string_view hex);

// Exactly 64 hex digits, either case. Anything else yields std::nullopt.
[[nodiscard]] std::optional<kmslocal::security::SecureBuffer> parseHexKey(std::string_view hex);

// Parses a JSON document:
//   {"adapter": "...", "path": "...", "key_hex": "...", "key_file": "...", "provider": "..."}
// Only "path" is required. Relative "path" and "key_file" values are resolved against `baseDir`.
// Throws ConfigError.
[[nodiscard]] StoreConfig parseStoreConfig(std::string_view jsonText, const std::filesystem::path& baseDir);

// Reads and parses `file`; relative paths inside resolve against its directory. Throws ConfigError.
[[nodiscard]] StoreConfig loadStoreConfig(const std::filesystem::path& file);

// Throws ConfigError if an encrypted store has no key.
[[nodiscard]] kmslocal::persistence::AdapterOptions toAdapterOptions(const StoreConfig& config);

// Throws ConfigError if `kind` was not compiled in.
[[nodiscard]] std::unique_ptr<kmslocal::crypto::ICryptoProvider> makeCryptoProvider(ProviderKind kind);

} // namespace kmslocal::config

#endif // INCLUDE_KMSLOCAL_CONFIG_STORECONFIG_HPP
