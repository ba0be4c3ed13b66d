#include "kmslocal/codec/BinarySnapshotCodec.hpp"
#include "LittleEndian.hpp"
#include "kmslocal/codec/CodecErrors.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

namespace kmslocal::codec
{
namespace
{

constexpr std::size_t g_kHeaderBytes{ g_binarySnapshotMagic.size() + detail::g_kU32Bytes + (2U * detail::g_kU64Bytes) };
constexpr std::size_t g_kEntryFixedBytes{ 3U * detail::g_kU64Bytes };

} // namespace

kmslocal::security::SecureBuffer encodeBinarySnapshot(const kmslocal::core::KeySnapshot& snapshot)
{
    std::size_t total{ g_kHeaderBytes };
    for (const auto& [version, record] : snapshot.entries)
    {
        total += g_kEntryFixedBytes + record.data.size();
    }

    kmslocal::security::SecureBuffer out{};
    out.reserve(total);
    detail::LeWriter w{ out };
    w.bytes(g_binarySnapshotMagic);
    w.u32(g_binarySnapshotFormatVersion);
    w.u64(snapshot.count);
    w.u64(static_cast<std::uint64_t>(snapshot.entries.size()));
    for (const auto& [version, record] : snapshot.entries)
    {
        w.u64(version);
        w.u64(record.createdAtUnixSeconds);
        w.u64(static_cast<std::uint64_t>(record.data.size()));
        w.bytes(kmslocal::security::asSpan(record.data));
    }
    return out;
}

kmslocal::core::KeySnapshot decodeBinarySnapshot(std::span<const std::uint8_t> bytes)
{
    detail::LeReader r{ bytes };

    const auto magic{ r.take(g_binarySnapshotMagic.size()) };
    if (!std::equal(magic.begin(), magic.end(), g_binarySnapshotMagic.begin()))
    {
        throw CodecError("snapshot: bad magic");
    }
    if (r.u32() != g_binarySnapshotFormatVersion)
    {
        throw CodecError("snapshot: unsupported format version");
    }

    kmslocal::core::KeySnapshot out{};
    out.count = r.u64();
    const std::uint64_t entryCount{ r.u64() };
    if (entryCount > (r.remaining() / g_kEntryFixedBytes))
    {
        throw CodecError("snapshot: entry count exceeds input");
    }

    kmslocal::core::Version previous{ 0U };
    for (std::uint64_t i{}; i < entryCount; ++i)
    {
        const kmslocal::core::Version version{ r.u64() };
        if (version <= previous)
        {
            throw CodecError("snapshot: versions not strictly increasing");
        }
        previous = version;

        const std::uint64_t createdAt{ r.u64() };
        const std::uint64_t dataLen{ r.u64() };
        if (dataLen > r.remaining())
        {
            throw CodecError("snapshot: truncated input");
        }
        const auto data{ r.take(static_cast<std::size_t>(dataLen)) };

        out.entries.emplace_hint(out.entries.end(), version,
                                 kmslocal::core::KeyRecord{ kmslocal::security::secureBufferFrom(data), createdAt });
    }

    if (r.remaining() != 0U)
    {
        throw CodecError("snapshot: trailing bytes");
    }
    return out;
}

} // namespace kmslocal::codec
