#ifndef KMSLOCAL_TESTS_TEST_UTILS_KEYSTORESCENARIOS_HPP
#define KMSLOCAL_TESTS_TEST_UTILS_KEYSTORESCENARIOS_HPP

#include <gtest/gtest.h>

#include "kmslocal/core/KeyRecord.hpp"
#include "kmslocal/core/KeyStore.hpp"
#include "kmslocal/persistence/IPersistenceAdapter.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

namespace kmslocal::test_utils
{

// Four single-byte keys, stored as versions 1..4.
inline constexpr std::array<std::uint8_t, 4> g_scenarioValues{ 10U, 1U, 2U, 4U };
inline constexpr std::uint64_t g_scenarioCreatedAt{ 1700000000U };

[[nodiscard]] inline kmslocal::core::KeyRecord scenarioRecord(std::uint8_t value)
{
    return kmslocal::core::KeyRecordBuilder{ kmslocal::security::SecureBuffer{ value } }
        .createdAt(g_scenarioCreatedAt + value)
        .build();
}

inline void fillScenario(kmslocal::persistence::IPersistenceAdapter& adapter)
{
    for (std::size_t i{}; i < g_scenarioValues.size(); ++i)
    {
        const auto v{ adapter.update(scenarioRecord(g_scenarioValues[i])) };
        ASSERT_TRUE(std::holds_alternative<kmslocal::core::Version>(v));
        EXPECT_EQ(std::get<kmslocal::core::Version>(v), i + 1U);
    }
}

inline void expectScenario(const kmslocal::persistence::IPersistenceAdapter& adapter)
{
    const auto count{ adapter.count() };
    ASSERT_TRUE(std::holds_alternative<kmslocal::core::Version>(count));
    EXPECT_EQ(std::get<kmslocal::core::Version>(count), g_scenarioValues.size());

    for (std::size_t i{}; i < g_scenarioValues.size(); ++i)
    {
        const auto got{ adapter.get(i + 1U) };
        ASSERT_TRUE(std::holds_alternative<std::optional<kmslocal::core::KeyRecord>>(got));
        const auto& record{ std::get<std::optional<kmslocal::core::KeyRecord>>(got) };
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(*record, scenarioRecord(g_scenarioValues[i]));
    }

    const auto latest{ adapter.latest() };
    ASSERT_TRUE(std::holds_alternative<std::optional<kmslocal::core::KeyRecord>>(latest));
    ASSERT_TRUE(std::get<std::optional<kmslocal::core::KeyRecord>>(latest).has_value());
    EXPECT_EQ(*std::get<std::optional<kmslocal::core::KeyRecord>>(latest), scenarioRecord(g_scenarioValues.back()));
}

} // namespace kmslocal::test_utils

#endif // KMSLOCAL_TESTS_TEST_UTILS_KEYSTORESCENARIOS_HPP
