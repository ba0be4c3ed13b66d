#ifndef INCLUDE_KMSLOCAL_CORE_KEYRECORD_HPP
#define INCLUDE_KMSLOCAL_CORE_KEYRECORD_HPP

#include "kmslocal/core/KeyStoreError.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace kmslocal::core
{

struct KeyRecord final
{
    kmslocal::security::SecureBuffer data;
    std::uint64_t createdAtUnixSeconds{ 0U };
};

// Payload comparison is constant-time.
[[nodiscard]] bool operator==(const KeyRecord& a, const KeyRecord& b) noexcept;

class KeyRecordBuilder final
{
public:
    explicit KeyRecordBuilder(kmslocal::security::SecureBuffer data) noexcept;

    KeyRecordBuilder& createdAt(std::uint64_t unixSeconds) & noexcept;
    [[nodiscard]] KeyRecordBuilder&& createdAt(std::uint64_t unixSeconds) && noexcept;

    // Stamps the current UNIX time unless createdAt() was called.
    [[nodiscard]] KeyRecord build() &&;

private:
    kmslocal::security::SecureBuffer m_data;
    std::optional<std::uint64_t> m_createdAt;
};

// Builder over `sizeBytes` bytes drawn from the OS CSPRNG.
[[nodiscard]] KeyStoreResult<KeyRecordBuilder> generateKeyRecord(std::size_t sizeBytes);

[[nodiscard]] std::uint64_t unixSecondsNow() noexcept;

} // namespace kmslocal::core

#endif // INCLUDE_KMSLOCAL_CORE_KEYRECORD_HPP
