#ifndef INCLUDE_KMSLOCAL_CODEC_BINARYSNAPSHOTCODEC_HPP
#define INCLUDE_KMSLOCAL_CODEC_BINARYSNAPSHOTCODEC_HPP

#include "kmslocal/core/KeyStore.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace kmslocal::codec
{

inline constexpr std::array<std::uint8_t, 8> g_binarySnapshotMagic{ 'K', 'M', 'S', 'L', 'S', 'N', 'A', 'P' };
inline constexpr std::uint32_t g_binarySnapshotFormatVersion{ 1U };

// Layout (little-endian):
//   magic[8] | formatVersion u32 | count u64 | entryCount u64 |
//   entryCount x { version u64 | createdAt u64 | dataLen u64 | data[dataLen] }
// Entries are written in strictly increasing version order.
[[nodiscard]] kmslocal::security::SecureBuffer encodeBinarySnapshot(const kmslocal::core::KeySnapshot& snapshot);

// Throws CodecError on bad magic, unknown format version, truncation, trailing bytes,
// or versions that are zero or not strictly increasing.
[[nodiscard]] kmslocal::core::KeySnapshot decodeBinarySnapshot(std::span<const std::uint8_t> bytes);

} // namespace kmslocal::codec

#endif // INCLUDE_KMSLOCAL_CODEC_BINARYSNAPSHOTCODEC_HPP
