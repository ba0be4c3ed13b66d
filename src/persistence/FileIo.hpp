#ifndef KMSLOCAL_SRC_PERSISTENCE_FILEIO_HPP
#define KMSLOCAL_SRC_PERSISTENCE_FILEIO_HPP

#include "kmslocal/security/SecureBuffer.hpp"
#include <cstdint>
#include <filesystem>
#include <span>

namespace kmslocal::persistence::detail
{

// Throws IoError if the file cannot be opened or read in full.
[[nodiscard]] kmslocal::security::SecureBuffer readFileBytes(const std::filesystem::path& path);

// Replaces `target` with `bytes` so that a reader sees either the old or the new contents, never a mix.
// The bytes go to a private temporary file beside `target`, which is flushed to disk and renamed over it;
// the directory entry is then flushed as well. Throws IoError; the temporary file never outlives the call.
// An IoError from the directory flush comes after the rename: `target` already holds `bytes`.
void atomicReplaceFile(const std::filesystem::path& target, std::span<const std::uint8_t> bytes);

} // namespace kmslocal::persistence::detail

#endif // KMSLOCAL_SRC_PERSISTENCE_FILEIO_HPP
