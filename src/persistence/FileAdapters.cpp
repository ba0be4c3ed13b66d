#include "kmslocal/persistence/FileAdapters.hpp"
#include "FileIo.hpp"
#include "StoreAdapterBase.hpp"
#include "kmslocal/codec/BinarySnapshotCodec.hpp"
#include "kmslocal/codec/CodecErrors.hpp"
#include "kmslocal/codec/JsonSnapshotCodec.hpp"
#include "kmslocal/crypto/CryptoBox.hpp"
#include "kmslocal/persistence/PersistenceErrors.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace kmslocal::persistence
{
namespace
{

using kmslocal::core::KeySnapshot;
using kmslocal::core::KeyStoreError;
using kmslocal::core::KeyStoreResult;

// Runs `encodeAndWrite(snapshot)` and maps the exceptions of the lower layers onto KeyStoreError.
template <class Fn>
[[nodiscard]] KeyStoreResult<std::monostate> saveSnapshot(const IPersistenceAdapter& adapter, Fn&& encodeAndWrite)
{
    auto snapshotRes{ adapter.store().snapshot() };
    if (std::holds_alternative<KeyStoreError>(snapshotRes))
    {
        return std::get<KeyStoreError>(snapshotRes);
    }

    try
    {
        return std::forward<Fn>(encodeAndWrite)(std::get<KeySnapshot>(snapshotRes));
    }
    catch (const IoError&)
    {
        return KeyStoreError::Io;
    }
    catch (const kmslocal::codec::CodecError&)
    {
        return KeyStoreError::Codec;
    }
}

class PlainBinaryAdapter final : public detail::StoreAdapterBase
{
public:
    PlainBinaryAdapter(std::filesystem::path path, KeySnapshot snapshot)
        : StoreAdapterBase{ AdapterKind::PlainBinary, std::move(path), std::move(snapshot) }
    {
    }

    [[nodiscard]] KeyStoreResult<std::monostate> save() override
    {
        return saveSnapshot(*this, [this](const KeySnapshot& snapshot) -> KeyStoreResult<std::monostate> {
            const auto bytes{ kmslocal::codec::encodeBinarySnapshot(snapshot) };
            detail::atomicReplaceFile(path(), kmslocal::security::asSpan(bytes));
            return std::monostate{};
        });
    }
};

class PlainJsonAdapter final : public detail::StoreAdapterBase
{
public:
    PlainJsonAdapter(std::filesystem::path path, KeySnapshot snapshot)
        : StoreAdapterBase{ AdapterKind::PlainJson, std::move(path), std::move(snapshot) }
    {
    }

    [[nodiscard]] KeyStoreResult<std::monostate> save() override
    {
        return saveSnapshot(*this, [this](const KeySnapshot& snapshot) -> KeyStoreResult<std::monostate> {
            const std::string text{ kmslocal::codec::encodeJsonSnapshot(snapshot) };
            detail::atomicReplaceFile(path(), std::span<const std::uint8_t>{
                                                  reinterpret_cast<const std::uint8_t*>(text.data()), text.size() });
            return std::monostate{};
        });
    }
};

class EncryptedAdapter final : public detail::StoreAdapterBase
{
public:
    EncryptedAdapter(std::filesystem::path path, KeySnapshot snapshot, std::span<const std::uint8_t> key,
                     kmslocal::crypto::ICryptoProvider& crypto)
        : StoreAdapterBase{ AdapterKind::Encrypted, std::move(path), std::move(snapshot) },
          m_key{ kmslocal::security::secureBufferFrom(key) }, m_box{ crypto }
    {
        if (m_key.size() != kmslocal::crypto::g_aeadKeyBytes)
        {
            throw std::invalid_argument("EncryptedAdapter: key must be 32 bytes");
        }
    }

    [[nodiscard]] KeyStoreResult<std::monostate> save() override
    {
        return saveSnapshot(*this, [this](const KeySnapshot& snapshot) -> KeyStoreResult<std::monostate> {
            const auto plain{ kmslocal::codec::encodeBinarySnapshot(snapshot) };
            auto sealed{ m_box.encrypt(kmslocal::security::asSpan(m_key), kmslocal::security::asSpan(plain)) };
            if (std::holds_alternative<KeyStoreError>(sealed))
            {
                return std::get<KeyStoreError>(sealed);
            }
            detail::atomicReplaceFile(path(), std::get<std::vector<std::uint8_t>>(sealed));
            return std::monostate{};
        });
    }

private:
    kmslocal::security::SecureBuffer m_key;
    kmslocal::crypto::CryptoBox m_box;
};

template <class Decode>
[[nodiscard]] KeyStoreResult<KeySnapshot> readSnapshot(const std::filesystem::path& path, Decode&& decode)
{
    try
    {
        const auto bytes{ detail::readFileBytes(path) };
        return std::forward<Decode>(decode)(kmslocal::security::asSpan(bytes));
    }
    catch (const IoError&)
    {
        return KeyStoreError::Io;
    }
    catch (const kmslocal::codec::CodecError&)
    {
        return KeyStoreError::Codec;
    }
}

} // namespace

KeyStoreResult<AdapterPtr> loadPlainBinaryAdapter(const std::filesystem::path& path)
{
    auto snapshot{ readSnapshot(path, [](std::span<const std::uint8_t> bytes) -> KeyStoreResult<KeySnapshot> {
        return kmslocal::codec::decodeBinarySnapshot(bytes);
    }) };
    if (std::holds_alternative<KeyStoreError>(snapshot))
    {
        return std::get<KeyStoreError>(snapshot);
    }
    return AdapterPtr{ std::make_unique<PlainBinaryAdapter>(path, std::move(std::get<KeySnapshot>(snapshot))) };
}

AdapterPtr makePlainBinaryAdapter(const std::filesystem::path& path, KeySnapshot snapshot)
{
    return std::make_unique<PlainBinaryAdapter>(path, std::move(snapshot));
}

KeyStoreResult<AdapterPtr> loadPlainJsonAdapter(const std::filesystem::path& path)
{
    auto snapshot{ readSnapshot(path, [](std::span<const std::uint8_t> bytes) -> KeyStoreResult<KeySnapshot> {
        return kmslocal::codec::decodeJsonSnapshot(
            std::string_view{ reinterpret_cast<const char*>(bytes.data()), bytes.size() });
    }) };
    if (std::holds_alternative<KeyStoreError>(snapshot))
    {
        return std::get<KeyStoreError>(snapshot);
    }
    return AdapterPtr{ std::make_unique<PlainJsonAdapter>(path, std::move(std::get<KeySnapshot>(snapshot))) };
}

AdapterPtr makePlainJsonAdapter(const std::filesystem::path& path, KeySnapshot snapshot)
{
    return std::make_unique<PlainJsonAdapter>(path, std::move(snapshot));
}

KeyStoreResult<AdapterPtr> loadEncryptedAdapter(const std::filesystem::path& path, std::span<const std::uint8_t> key,
                                                kmslocal::crypto::ICryptoProvider& crypto)
{
    kmslocal::crypto::CryptoBox box{ crypto };
    auto snapshot{ readSnapshot(path, [&](std::span<const std::uint8_t> bytes) -> KeyStoreResult<KeySnapshot> {
        auto opened{ box.decrypt(key, bytes) };
        if (std::holds_alternative<KeyStoreError>(opened))
        {
            return std::get<KeyStoreError>(opened);
        }
        return kmslocal::codec::decodeBinarySnapshot(
            kmslocal::security::asSpan(std::get<kmslocal::security::SecureBuffer>(opened)));
    }) };
    if (std::holds_alternative<KeyStoreError>(snapshot))
    {
        return std::get<KeyStoreError>(snapshot);
    }
    return AdapterPtr{ std::make_unique<EncryptedAdapter>(path, std::move(std::get<KeySnapshot>(snapshot)), key,
                                                          crypto) };
}

AdapterPtr makeEncryptedAdapter(const std::filesystem::path& path, std::span<const std::uint8_t> key,
                                kmslocal::crypto::ICryptoProvider& crypto, KeySnapshot snapshot)
{
    return std::make_unique<EncryptedAdapter>(path, std::move(snapshot), key, crypto);
}

} // namespace kmslocal::persistence
