#include "kmslocal/config/StoreConfig.hpp"
#include "kmslocal/crypto/providers/NativeProviderFactory.hpp"
#include "kmslocal/security/ScopeWipe.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <utility>

#if defined(KMSL_ENABLE_OPENSSL)
#include "kmslocal/crypto/providers/OpenSslProviderFactory.hpp"
#endif

namespace kmslocal::config
{
namespace
{

constexpr std::size_t g_kKeyBytes{ kmslocal::crypto::g_aeadKeyBytes };
constexpr unsigned g_kNibbleBits{ 4U };
constexpr std::uint8_t g_kHexLetterOffset{ 10U };

[[nodiscard]] std::optional<std::uint8_t> hexNibble(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + g_kHexLetterOffset);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + g_kHexLetterOffset);
    }
    return std::nullopt;
}

[[nodiscard]] std::string requireString(const nlohmann::json& root, const char* field)
{
    const auto& v{ root.at(field) };
    if (!v.is_string())
    {
        throw ConfigError(std::string{ "config: '" } + field + "' must be a string");
    }
    return v.get<std::string>();
}

[[nodiscard]] std::filesystem::path resolve(const std::filesystem::path& baseDir, const std::string& value)
{
    const std::filesystem::path p{ value };
    if (p.is_relative() && !baseDir.empty())
    {
        return baseDir / p;
    }
    return p;
}

[[nodiscard]] kmslocal::security::SecureBuffer readKeyFile(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw ConfigError("config: cannot open key_file " + path.string());
    }
    kmslocal::security::SecureBuffer key(g_kKeyBytes + 1U);
    in.read(reinterpret_cast<char*>(key.data()), static_cast<std::streamsize>(key.size()));
    if (in.gcount() != static_cast<std::streamsize>(g_kKeyBytes))
    {
        kmslocal::security::secureRelease(key);
        throw ConfigError("config: key_file must hold exactly 32 bytes");
    }
    key.resize(g_kKeyBytes);
    return key;
}

} // namespace

std::optional<kmslocal::persistence::AdapterKind> parseAdapterKind(std::string_view name) noexcept
{
    using kmslocal::persistence::AdapterKind;
    for (const AdapterKind k : { AdapterKind::PlainBinary, AdapterKind::PlainJson, AdapterKind::Encrypted,
                                 AdapterKind::Sqlite })
    {
        if (name == kmslocal::persistence::toString(k))
        {
            return k;
        }
    }
    return std::nullopt;
}

std::optional<ProviderKind> parseProviderKind(std::string_view name) noexcept
{
    if (name == "native")
    {
        return ProviderKind::Native;
    }
    if (name == "openssl")
    {
        return ProviderKind::OpenSsl;
    }
    return std::nullopt;
}

std::optional<kmslocal::security::SecureBuffer> parseHexBytes(std::string_view hex)
{
    if ((hex.size() % 2U) != 0U)
    {
        return std::nullopt;
    }

    kmslocal::security::SecureBuffer out(hex.size() / 2U);
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const auto hi{ hexNibble(hex[2U * i]) };
        const auto lo{ hexNibble(hex[(2U * i) + 1U]) };
        if (!hi || !lo)
        {
            kmslocal::security::secureRelease(out);
            return std::nullopt;
        }
        out[i] = static_cast<std::uint8_t>((*hi << g_kNibbleBits) | *lo);
    }
    return out;
}

std::optional<kmslocal::security::SecureBuffer> parseHexKey(std::string_view hex)
{
    if (hex.size() != g_kKeyBytes * 2U)
    {
        return std::nullopt;
    }
    return parseHexBytes(hex);
}

StoreConfig parseStoreConfig(std::string_view jsonText, const std::filesystem::path& baseDir)
{
    nlohmann::json root{};
    try
    {
        root = nlohmann::json::parse(jsonText.begin(), jsonText.end());
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw ConfigError(std::string{ "config: " } + e.what());
    }
    if (!root.is_object())
    {
        throw ConfigError("config: top level must be an object");
    }
    if (!root.contains("path"))
    {
        throw ConfigError("config: 'path' is required");
    }

    StoreConfig out{};
    out.path = resolve(baseDir, requireString(root, "path"));

    if (root.contains("adapter"))
    {
        const auto kind{ parseAdapterKind(requireString(root, "adapter")) };
        if (!kind)
        {
            throw ConfigError("config: unknown adapter (binary, json, encrypted, sqlite)");
        }
        out.adapter = *kind;
    }

    if (root.contains("provider"))
    {
        const auto provider{ parseProviderKind(requireString(root, "provider")) };
        if (!provider)
        {
            throw ConfigError("config: unknown provider (native, openssl)");
        }
        out.provider = *provider;
    }

    const bool hasHex{ root.contains("key_hex") };
    const bool hasFile{ root.contains("key_file") };
    if (hasHex && hasFile)
    {
        throw ConfigError("config: 'key_hex' and 'key_file' are mutually exclusive");
    }
    if (hasHex)
    {
        auto hex{ requireString(root, "key_hex") };
        auto wipeHex = kmslocal::security::scopeWipe(hex);
        out.key = parseHexKey(hex);
        if (!out.key)
        {
            throw ConfigError("config: 'key_hex' must be 64 hex digits");
        }
    }
    if (hasFile)
    {
        out.key = readKeyFile(resolve(baseDir, requireString(root, "key_file")));
    }

    if (out.adapter == kmslocal::persistence::AdapterKind::Encrypted && !out.key)
    {
        throw ConfigError("config: the encrypted adapter needs 'key_hex' or 'key_file'");
    }
    return out;
}

StoreConfig loadStoreConfig(const std::filesystem::path& file)
{
    std::ifstream in{ file, std::ios::binary };
    if (!in)
    {
        throw ConfigError("config: cannot open " + file.string());
    }
    const std::string text{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    return parseStoreConfig(text, file.parent_path());
}

kmslocal::persistence::AdapterOptions toAdapterOptions(const StoreConfig& config)
{
    kmslocal::persistence::AdapterOptions options{};
    options.kind = config.adapter;
    options.path = config.path;
    if (config.adapter == kmslocal::persistence::AdapterKind::Encrypted)
    {
        if (!config.key)
        {
            throw ConfigError("config: the encrypted adapter needs a key");
        }
        options.key = *config.key;
    }
    return options;
}

std::unique_ptr<kmslocal::crypto::ICryptoProvider> makeCryptoProvider(ProviderKind kind)
{
    switch (kind)
    {
    case ProviderKind::Native:
        return kmslocal::crypto::providers::makeNativeCryptoProvider();
    case ProviderKind::OpenSsl:
#if defined(KMSL_ENABLE_OPENSSL)
        return kmslocal::crypto::providers::makeOpenSslCryptoProvider();
#else
        throw ConfigError("config: built without OpenSSL support");
#endif
    }
    throw ConfigError("config: unknown provider");
}

} // namespace kmslocal::config
