#ifndef INCLUDE_KMSLOCAL_CODEC_CODECERRORS_HPP
#define INCLUDE_KMSLOCAL_CODEC_CODECERRORS_HPP

#include <stdexcept>

namespace kmslocal::codec
{

// Persisted bytes are malformed, truncated or written by an unknown format version.
class CodecError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace kmslocal::codec

#endif // INCLUDE_KMSLOCAL_CODEC_CODECERRORS_HPP
