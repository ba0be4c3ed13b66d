#include <gtest/gtest.h>

#include "kmslocal/core/KeyRecord.hpp"
#include "kmslocal/core/KeyStore.hpp"
#include "kmslocal/core/VersionedStore.hpp"
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

namespace
{

using kmslocal::core::KeyStoreError;
using kmslocal::core::Version;
using kmslocal::core::VersionedStore;

// Copies fine; moving one built with explode=true throws, which lets a test fail a write mid-lock.
struct FragileRecord
{
    int value{ 0 };
    bool explode{ false };

    FragileRecord(int v, bool e = false) : value{ v }, explode{ e }
    {
    }
    FragileRecord(const FragileRecord&) = default;
    FragileRecord& operator=(const FragileRecord&) = default;
    FragileRecord(FragileRecord&& other) : value{ other.value }, explode{ other.explode }
    {
        if (explode)
        {
            throw std::runtime_error("FragileRecord: move failed");
        }
    }
    FragileRecord& operator=(FragileRecord&& other)
    {
        if (other.explode)
        {
            throw std::runtime_error("FragileRecord: move failed");
        }
        value = other.value;
        explode = other.explode;
        return *this;
    }
    ~FragileRecord() = default;
};

template <class T> [[nodiscard]] T expectOk(const kmslocal::core::KeyStoreResult<T>& r)
{
    EXPECT_TRUE(std::holds_alternative<T>(r));
    return std::get<T>(r);
}

TEST(VersionedStore, EmptyStore)
{
    const VersionedStore<int> store{};
    EXPECT_EQ(expectOk(store.count()), 0U);
    EXPECT_FALSE(expectOk(store.latest()).has_value());
    EXPECT_FALSE(expectOk(store.get(1U)).has_value());
}

TEST(VersionedStore, SequentialUpdatesAssignConsecutiveVersions)
{
    VersionedStore<int> store{};
    for (int i{ 1 }; i <= 5; ++i)
    {
        EXPECT_EQ(expectOk(store.update(i * 10)), static_cast<Version>(i));
    }
    EXPECT_EQ(expectOk(store.count()), 5U);
    EXPECT_EQ(expectOk(store.get(3U)), std::optional<int>{ 30 });
}

TEST(VersionedStore, ConcurrentUpdatesAssignEachVersionOnce)
{
    constexpr int kThreads{ 8 };
    constexpr int kPerThread{ 250 };

    VersionedStore<int> store{};
    std::mutex seenMutex;
    std::vector<Version> seen;

    std::vector<std::thread> workers;
    for (int t{}; t < kThreads; ++t)
    {
        workers.emplace_back([&store, &seenMutex, &seen, t]() {
            for (int i{}; i < kPerThread; ++i)
            {
                const auto r{ store.update((t * kPerThread) + i) };
                ASSERT_TRUE(std::holds_alternative<Version>(r));
                const std::lock_guard lock{ seenMutex };
                seen.push_back(std::get<Version>(r));
            }
        });
    }
    for (auto& w : workers)
    {
        w.join();
    }

    constexpr auto kTotal{ static_cast<Version>(kThreads * kPerThread) };
    const std::set<Version> unique(seen.begin(), seen.end());
    ASSERT_EQ(seen.size(), kTotal);
    ASSERT_EQ(unique.size(), kTotal);
    EXPECT_EQ(*unique.begin(), 1U);
    EXPECT_EQ(*unique.rbegin(), kTotal);
    EXPECT_EQ(expectOk(store.count()), kTotal);
}

TEST(VersionedStore, ReadersRunAlongsideWriters)
{
    VersionedStore<int> store{};
    std::thread writer{ [&store]() {
        for (int i{}; i < 500; ++i)
        {
            (void)store.update(i);
        }
    } };
    std::thread reader{ [&store]() {
        for (int i{}; i < 500; ++i)
        {
            const auto count{ expectOk(store.count()) };
            if (count > 0U)
            {
                // Nothing is dropped here, so the issued counter is always backed by an entry.
                EXPECT_TRUE(expectOk(store.get(count)).has_value());
            }
        }
    } };
    writer.join();
    reader.join();
    EXPECT_EQ(expectOk(store.count()), 500U);
}

TEST(VersionedStore, DropRetiresVersionWithoutTouchingCount)
{
    VersionedStore<int> store{};
    (void)store.update(1);
    (void)store.update(2);
    (void)store.update(3);

    EXPECT_EQ(expectOk(store.drop(2U)), std::optional<int>{ 2 });
    EXPECT_FALSE(expectOk(store.get(2U)).has_value());
    EXPECT_FALSE(expectOk(store.drop(2U)).has_value());
    EXPECT_EQ(expectOk(store.count()), 3U);

    // A dropped version is never handed out again.
    EXPECT_EQ(expectOk(store.update(4)), 4U);
}

TEST(VersionedStore, LatestFollowsHighestPresentVersion)
{
    VersionedStore<int> store{};
    (void)store.update(10);
    (void)store.update(20);
    (void)store.update(30);

    EXPECT_EQ(expectOk(store.latest()), expectOk(store.get(3U)));

    (void)store.drop(3U);
    const auto latest{ expectOk(store.latestWithVersion()) };
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->version, 2U);
    EXPECT_EQ(latest->record, 20);
    EXPECT_EQ(expectOk(store.count()), 3U);
}

TEST(VersionedStore, GetWithVersionReportsVersion)
{
    VersionedStore<int> store{};
    (void)store.update(7);
    const auto found{ expectOk(store.getWithVersion(1U)) };
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->version, 1U);
    EXPECT_EQ(found->record, 7);
    EXPECT_FALSE(expectOk(store.getWithVersion(2U)).has_value());
}

TEST(VersionedStore, ReaderIteratesInVersionOrder)
{
    VersionedStore<int> store{};
    for (int i{ 1 }; i <= 4; ++i)
    {
        (void)store.update(i * 100);
    }
    (void)store.drop(2U);

    auto readerRes{ store.storeReader() };
    ASSERT_TRUE((std::holds_alternative<kmslocal::core::StoreReader<int>>(readerRes)));
    const auto& reader{ std::get<kmslocal::core::StoreReader<int>>(readerRes) };

    std::vector<Version> versions;
    for (const auto& [version, value] : reader)
    {
        versions.push_back(version);
    }
    EXPECT_EQ(versions, (std::vector<Version>{ 1U, 3U, 4U }));
    EXPECT_EQ(reader.size(), 3U);
    EXPECT_NE(reader.find(4U), reader.end());
}

TEST(VersionedStore, SnapshotRestoresCountAndEntries)
{
    VersionedStore<int> store{};
    (void)store.update(1);
    (void)store.update(2);
    (void)store.drop(2U);

    auto snap{ expectOk(store.snapshot()) };
    EXPECT_EQ(snap.count, 2U);
    EXPECT_EQ(snap.entries.size(), 1U);

    const VersionedStore<int> restored{ std::move(snap) };
    EXPECT_EQ(expectOk(restored.count()), 2U);
    EXPECT_EQ(expectOk(restored.get(1U)), std::optional<int>{ 1 });
}

TEST(VersionedStore, RestoreRaisesCountToHighestEntry)
{
    kmslocal::core::StoreSnapshot<int> snap{};
    snap.count = 2U;
    snap.entries.emplace(5U, 50);

    VersionedStore<int> store{ std::move(snap) };
    EXPECT_EQ(expectOk(store.count()), 5U);
    EXPECT_EQ(expectOk(store.update(60)), 6U);
}

TEST(VersionedStore, ExhaustedVersionSpaceThrowsWithoutPoisoning)
{
    kmslocal::core::StoreSnapshot<int> snap{};
    snap.count = std::numeric_limits<Version>::max();

    VersionedStore<int> store{ std::move(snap) };
    EXPECT_THROW((void)store.update(1), std::overflow_error);
    EXPECT_EQ(expectOk(store.count()), std::numeric_limits<Version>::max());
}

TEST(VersionedStore, FailedWritePoisonsStore)
{
    VersionedStore<FragileRecord> store{};
    EXPECT_EQ(expectOk(store.update(FragileRecord{ 1 })), 1U);

    EXPECT_THROW((void)store.update(FragileRecord{ 2, true }), std::runtime_error);

    EXPECT_EQ(std::get<KeyStoreError>(store.count()), KeyStoreError::Poisoned);
    EXPECT_EQ(std::get<KeyStoreError>(store.get(1U)), KeyStoreError::Poisoned);
    EXPECT_EQ(std::get<KeyStoreError>(store.latest()), KeyStoreError::Poisoned);
    EXPECT_EQ(std::get<KeyStoreError>(store.update(FragileRecord{ 3 })), KeyStoreError::Poisoned);
    EXPECT_EQ(std::get<KeyStoreError>(store.drop(1U)), KeyStoreError::Poisoned);
    EXPECT_EQ(std::get<KeyStoreError>(store.snapshot()), KeyStoreError::Poisoned);
    EXPECT_TRUE(std::holds_alternative<KeyStoreError>(store.storeReader()));
}

TEST(VersionedStore, KeyRecordStore)
{
    kmslocal::core::KeyStore store{};
    const auto v{ expectOk(store.update(
        kmslocal::core::KeyRecordBuilder{ kmslocal::security::SecureBuffer{ 1U, 2U, 3U } }.createdAt(42U).build())) };
    EXPECT_EQ(v, 1U);

    const auto got{ expectOk(store.get(v)) };
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->createdAtUnixSeconds, 42U);
    EXPECT_EQ(got->data, (kmslocal::security::SecureBuffer{ 1U, 2U, 3U }));
}

} // namespace
