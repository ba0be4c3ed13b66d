#ifndef INCLUDE_KMSLOCAL_CORE_VERSIONEDSTORE_HPP
#define INCLUDE_KMSLOCAL_CORE_VERSIONEDSTORE_HPP

#include "kmslocal/core/KeyStoreError.hpp"
#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <utility>

namespace kmslocal::core
{

using Version = std::uint64_t;

template <class Record> struct VersionedKey final
{
    Version version{ 0U };
    Record record;
};

// Lock-free value form of a store. Codecs only ever see this type.
template <class Record> struct StoreSnapshot final
{
    std::uint64_t count{ 0U };
    std::map<Version, Record> entries;
};

namespace detail
{

// Sets the flag if the enclosing scope is left by an exception.
class PoisonOnUnwind final
{
public:
    explicit PoisonOnUnwind(std::atomic<bool>& poisoned) noexcept
        : m_poisoned{ poisoned }, m_exceptionsOnEntry{ std::uncaught_exceptions() }
    {
    }

    PoisonOnUnwind(const PoisonOnUnwind&) = delete;
    PoisonOnUnwind& operator=(const PoisonOnUnwind&) = delete;
    PoisonOnUnwind(PoisonOnUnwind&&) = delete;
    PoisonOnUnwind& operator=(PoisonOnUnwind&&) = delete;

    ~PoisonOnUnwind() noexcept
    {
        if (std::uncaught_exceptions() > m_exceptionsOnEntry)
        {
            m_poisoned.store(true, std::memory_order_release);
        }
    }

private:
    std::atomic<bool>& m_poisoned;
    int m_exceptionsOnEntry{ 0 };
};

} // namespace detail

// Read view over the whole mapping. Holds the shared lock until destroyed; writers block meanwhile.
template <class Record> class StoreReader final
{
public:
    using Map = std::map<Version, Record>;
    using const_iterator = typename Map::const_iterator;

    StoreReader(std::shared_lock<std::shared_mutex> lock, const Map& entries) noexcept
        : m_lock{ std::move(lock) }, m_entries{ &entries }
    {
    }

    [[nodiscard]] const_iterator begin() const noexcept
    {
        return m_entries->begin();
    }
    [[nodiscard]] const_iterator end() const noexcept
    {
        return m_entries->end();
    }
    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_entries->size();
    }
    [[nodiscard]] bool empty() const noexcept
    {
        return m_entries->empty();
    }
    [[nodiscard]] const_iterator find(Version version) const
    {
        return m_entries->find(version);
    }

private:
    std::shared_lock<std::shared_mutex> m_lock;
    const Map* m_entries{ nullptr };
};

// Monotonically versioned map of records, safe for concurrent use.
//
// Lock order: m_countMutex is always taken before m_storeMutex, and only update() and snapshot()
// hold both. Every other operation takes exactly one of them. Versions are handed out by update()
// alone, under m_countMutex, and the counter is committed only after the record is in the map, so
// a reader that sees count() == n can always find version n unless it was dropped.
template <class Record>
    requires std::copy_constructible<Record>
class VersionedStore final
{
public:
    using RecordType = Record;
    using Snapshot = StoreSnapshot<Record>;

    VersionedStore() = default;

    // Restores a persisted store. A snapshot whose entries run past its counter is trusted on the
    // entries: the counter is raised to the highest present version.
    explicit VersionedStore(Snapshot snapshot)
        : m_count{ recoveredCount(snapshot) }, m_entries{ std::move(snapshot.entries) }
    {
    }

    VersionedStore(const VersionedStore&) = delete;
    VersionedStore& operator=(const VersionedStore&) = delete;
    VersionedStore(VersionedStore&&) = delete;
    VersionedStore& operator=(VersionedStore&&) = delete;
    ~VersionedStore() = default;

    // Highest version ever issued.
    [[nodiscard]] KeyStoreResult<Version> count() const
    {
        const std::lock_guard countLock{ m_countMutex };
        if (m_countPoisoned.load(std::memory_order_acquire))
        {
            return KeyStoreError::Poisoned;
        }
        return m_count;
    }

    // Inserts `record` under the next version and returns that version.
    // Throws std::overflow_error if every version has been issued.
    [[nodiscard]] KeyStoreResult<Version> update(Record record)
    {
        const std::unique_lock countLock{ m_countMutex };
        if (m_countPoisoned.load(std::memory_order_acquire))
        {
            return KeyStoreError::Poisoned;
        }
        if (m_count == std::numeric_limits<Version>::max())
        {
            throw std::overflow_error("update: version space exhausted");
        }
        const detail::PoisonOnUnwind countGuard{ m_countPoisoned };

        const Version candidate{ m_count + 1U };
        {
            const std::unique_lock storeLock{ m_storeMutex };
            if (m_storePoisoned.load(std::memory_order_acquire))
            {
                return KeyStoreError::Poisoned;
            }
            const detail::PoisonOnUnwind storeGuard{ m_storePoisoned };
            m_entries.insert_or_assign(candidate, std::move(record));
        }

        m_count = candidate;
        return candidate;
    }

    // Removes and returns the record at `version`. The version stays retired.
    [[nodiscard]] KeyStoreResult<std::optional<Record>> drop(Version version)
    {
        const std::unique_lock storeLock{ m_storeMutex };
        if (m_storePoisoned.load(std::memory_order_acquire))
        {
            return KeyStoreError::Poisoned;
        }
        const detail::PoisonOnUnwind storeGuard{ m_storePoisoned };

        auto node{ m_entries.extract(version) };
        if (node.empty())
        {
            return std::optional<Record>{};
        }
        return std::optional<Record>{ std::move(node.mapped()) };
    }

    [[nodiscard]] KeyStoreResult<std::optional<Record>> get(Version version) const
    {
        const std::shared_lock storeLock{ m_storeMutex };
        if (m_storePoisoned.load(std::memory_order_acquire))
        {
            return KeyStoreError::Poisoned;
        }

        const auto it{ m_entries.find(version) };
        if (it == m_entries.end())
        {
            return std::optional<Record>{};
        }
        return std::optional<Record>{ it->second };
    }

    [[nodiscard]] KeyStoreResult<std::optional<VersionedKey<Record>>> getWithVersion(Version version) const
    {
        const std::shared_lock storeLock{ m_storeMutex };
        if (m_storePoisoned.load(std::memory_order_acquire))
        {
            return KeyStoreError::Poisoned;
        }

        const auto it{ m_entries.find(version) };
        if (it == m_entries.end())
        {
            return std::optional<VersionedKey<Record>>{};
        }
        return std::optional<VersionedKey<Record>>{ VersionedKey<Record>{ it->first, it->second } };
    }

    // Record at the highest version still present, which is below count() if that one was dropped.
    [[nodiscard]] KeyStoreResult<std::optional<Record>> latest() const
    {
        const std::shared_lock storeLock{ m_storeMutex };
        if (m_storePoisoned.load(std::memory_order_acquire))
        {
            return KeyStoreError::Poisoned;
        }

        if (m_entries.empty())
        {
            return std::optional<Record>{};
        }
        return std::optional<Record>{ m_entries.rbegin()->second };
    }

    [[nodiscard]] KeyStoreResult<std::optional<VersionedKey<Record>>> latestWithVersion() const
    {
        const std::shared_lock storeLock{ m_storeMutex };
        if (m_storePoisoned.load(std::memory_order_acquire))
        {
            return KeyStoreError::Poisoned;
        }

        if (m_entries.empty())
        {
            return std::optional<VersionedKey<Record>>{};
        }
        const auto last{ m_entries.rbegin() };
        return std::optional<VersionedKey<Record>>{ VersionedKey<Record>{ last->first, last->second } };
    }

    [[nodiscard]] KeyStoreResult<StoreReader<Record>> storeReader() const
    {
        std::shared_lock storeLock{ m_storeMutex };
        if (m_storePoisoned.load(std::memory_order_acquire))
        {
            return KeyStoreError::Poisoned;
        }
        return StoreReader<Record>{ std::move(storeLock), m_entries };
    }

    // Consistent copy of counter and entries, taken under both locks in update() order.
    [[nodiscard]] KeyStoreResult<Snapshot> snapshot() const
    {
        const std::lock_guard countLock{ m_countMutex };
        if (m_countPoisoned.load(std::memory_order_acquire))
        {
            return KeyStoreError::Poisoned;
        }
        const std::shared_lock storeLock{ m_storeMutex };
        if (m_storePoisoned.load(std::memory_order_acquire))
        {
            return KeyStoreError::Poisoned;
        }

        Snapshot out{};
        out.count = m_count;
        out.entries = m_entries;
        return out;
    }

private:
    [[nodiscard]] static Version recoveredCount(const Snapshot& snapshot) noexcept
    {
        if (snapshot.entries.empty())
        {
            return snapshot.count;
        }
        const Version highest{ snapshot.entries.rbegin()->first };
        return (highest > snapshot.count) ? highest : snapshot.count;
    }

    mutable std::mutex m_countMutex;
    Version m_count{ 0U };
    std::atomic<bool> m_countPoisoned{ false };

    mutable std::shared_mutex m_storeMutex;
    std::map<Version, Record> m_entries;
    std::atomic<bool> m_storePoisoned{ false };
};

} // namespace kmslocal::core

#endif // INCLUDE_KMSLOCAL_CORE_VERSIONEDSTORE_HPP
