#include "kmslocal/core/KeyRecord.hpp"

#include "kmslocal/security/MemoryWiper.hpp"
#include "kmslocal/security/SecureRandom.hpp"
#include <chrono>
#include <utility>

namespace kmslocal::core
{

bool operator==(const KeyRecord& a, const KeyRecord& b) noexcept
{
    return a.createdAtUnixSeconds == b.createdAtUnixSeconds &&
           kmslocal::security::secureEquals(kmslocal::security::asSpan(a.data), kmslocal::security::asSpan(b.data));
}

KeyRecordBuilder::KeyRecordBuilder(kmslocal::security::SecureBuffer data) noexcept : m_data{ std::move(data) }
{
}

KeyRecordBuilder& KeyRecordBuilder::createdAt(std::uint64_t unixSeconds) & noexcept
{
    m_createdAt = unixSeconds;
    return *this;
}

KeyRecordBuilder&& KeyRecordBuilder::createdAt(std::uint64_t unixSeconds) && noexcept
{
    m_createdAt = unixSeconds;
    return std::move(*this);
}

KeyRecord KeyRecordBuilder::build() &&
{
    KeyRecord record{};
    record.data = std::move(m_data);
    record.createdAtUnixSeconds = m_createdAt.value_or(unixSecondsNow());
    return record;
}

KeyStoreResult<KeyRecordBuilder> generateKeyRecord(std::size_t sizeBytes)
{
    auto data{ kmslocal::security::secureRandomBuffer(sizeBytes) };
    if (!data)
    {
        return KeyStoreError::RandomSourceFailure;
    }
    return KeyRecordBuilder{ std::move(*data) };
}

std::uint64_t unixSecondsNow() noexcept
{
    using Clock = std::chrono::system_clock;
    const auto secs{ std::chrono::duration_cast<std::chrono::seconds>(Clock::now().time_since_epoch()) };
    const auto count{ secs.count() };
    if (count < 0)
    {
        return 0U;
    }
    return static_cast<std::uint64_t>(count);
}

} // namespace kmslocal::core
