#include <gtest/gtest.h>

#include "kmslocal/core/IKeyManager.hpp"
#include "kmslocal/core/KeyRecord.hpp"
#include "kmslocal/core/KeyStore.hpp"
#include <cstdint>
#include <optional>
#include <variant>

namespace
{

using kmslocal::core::KeyRecord;
using kmslocal::core::KeyRecordBuilder;
using kmslocal::core::KeyStoreError;
using kmslocal::core::Version;
using kmslocal::security::SecureBuffer;

TEST(KeyRecordBuilder, ExplicitCreatedAtIsKept)
{
    const KeyRecord r{ KeyRecordBuilder{ SecureBuffer{ 9U } }.createdAt(2U).build() };
    EXPECT_EQ(r.createdAtUnixSeconds, 2U);
    EXPECT_EQ(r.data, SecureBuffer{ 9U });
}

TEST(KeyRecordBuilder, StampsCurrentTimeWhenUnset)
{
    const auto before{ kmslocal::core::unixSecondsNow() };
    const KeyRecord r{ KeyRecordBuilder{ SecureBuffer{ 1U, 2U } }.build() };
    const auto after{ kmslocal::core::unixSecondsNow() };
    EXPECT_GE(r.createdAtUnixSeconds, before);
    EXPECT_LE(r.createdAtUnixSeconds, after);
}

TEST(KeyRecord, EqualityComparesPayloadAndTimestamp)
{
    const KeyRecord a{ KeyRecordBuilder{ SecureBuffer{ 1U, 2U } }.createdAt(5U).build() };
    const KeyRecord b{ KeyRecordBuilder{ SecureBuffer{ 1U, 2U } }.createdAt(5U).build() };
    const KeyRecord otherTime{ KeyRecordBuilder{ SecureBuffer{ 1U, 2U } }.createdAt(6U).build() };
    const KeyRecord otherData{ KeyRecordBuilder{ SecureBuffer{ 1U, 3U } }.createdAt(5U).build() };
    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == otherTime);
    EXPECT_FALSE(a == otherData);
}

TEST(GenerateKeyRecord, ProducesRequestedLength)
{
    constexpr std::size_t kBytes{ 48U };
    auto res{ kmslocal::core::generateKeyRecord(kBytes) };
    ASSERT_TRUE(std::holds_alternative<KeyRecordBuilder>(res));
    const KeyRecord r{ std::move(std::get<KeyRecordBuilder>(res)).createdAt(1U).build() };
    EXPECT_EQ(r.data.size(), kBytes);

    auto again{ kmslocal::core::generateKeyRecord(kBytes) };
    ASSERT_TRUE(std::holds_alternative<KeyRecordBuilder>(again));
    const KeyRecord r2{ std::move(std::get<KeyRecordBuilder>(again)).createdAt(1U).build() };
    EXPECT_FALSE(r == r2);
}

TEST(LocalKeyManager, CreateGetLatestRemove)
{
    kmslocal::core::KeyStore store{};
    kmslocal::core::LocalKeyManager manager{ store };

    const auto v1{ manager.create(KeyRecordBuilder{ SecureBuffer{ 1U } }.createdAt(1U).build()) };
    const auto v2{ manager.create(KeyRecordBuilder{ SecureBuffer{ 2U } }.createdAt(2U).build()) };
    ASSERT_TRUE(std::holds_alternative<Version>(v1));
    ASSERT_TRUE(std::holds_alternative<Version>(v2));
    EXPECT_EQ(std::get<Version>(v1), 1U);
    EXPECT_EQ(std::get<Version>(v2), 2U);

    const auto latest{ manager.latest() };
    ASSERT_TRUE(std::holds_alternative<std::optional<kmslocal::core::VersionedKeyRecord>>(latest));
    const auto& latestRec{ std::get<std::optional<kmslocal::core::VersionedKeyRecord>>(latest) };
    ASSERT_TRUE(latestRec.has_value());
    EXPECT_EQ(latestRec->version, 2U);

    const auto removed{ manager.remove(2U) };
    ASSERT_TRUE(std::holds_alternative<std::optional<KeyRecord>>(removed));
    ASSERT_TRUE(std::get<std::optional<KeyRecord>>(removed).has_value());
    EXPECT_EQ(std::get<std::optional<KeyRecord>>(removed)->data, SecureBuffer{ 2U });

    const auto gone{ manager.get(2U) };
    ASSERT_TRUE(std::holds_alternative<std::optional<kmslocal::core::VersionedKeyRecord>>(gone));
    EXPECT_FALSE(std::get<std::optional<kmslocal::core::VersionedKeyRecord>>(gone).has_value());

    // The manager is a view: the store sees the same state.
    EXPECT_EQ(std::get<Version>(store.count()), 2U);
}

TEST(KeyStoreError, NamesAreStable)
{
    EXPECT_EQ(kmslocal::core::toString(KeyStoreError::Poisoned), "Poisoned");
    EXPECT_EQ(kmslocal::core::toString(KeyStoreError::AuthenticationFailure), "AuthenticationFailure");
}

} // namespace
