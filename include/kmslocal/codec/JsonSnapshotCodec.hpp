#ifndef INCLUDE_KMSLOCAL_CODEC_JSONSNAPSHOTCODEC_HPP
#define INCLUDE_KMSLOCAL_CODEC_JSONSNAPSHOTCODEC_HPP

#include "kmslocal/core/KeyStore.hpp"
#include <string>
#include <string_view>

namespace kmslocal::codec
{

// {"count": N, "store": {"<version>": {"data": [u8, ...], "created": seconds}, ...}}
[[nodiscard]] std::string encodeJsonSnapshot(const kmslocal::core::KeySnapshot& snapshot);

// Throws CodecError on malformed JSON or a document not shaped as above.
[[nodiscard]] kmslocal::core::KeySnapshot decodeJsonSnapshot(std::string_view text);

} // namespace kmslocal::codec

#endif // INCLUDE_KMSLOCAL_CODEC_JSONSNAPSHOTCODEC_HPP
