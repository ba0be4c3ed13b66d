#include <gtest/gtest.h>

#include "kmslocal/codec/BinarySnapshotCodec.hpp"
#include "kmslocal/codec/CodecErrors.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace
{

using kmslocal::codec::CodecError;
using kmslocal::codec::decodeBinarySnapshot;
using kmslocal::codec::encodeBinarySnapshot;
using kmslocal::core::KeyRecord;
using kmslocal::core::KeySnapshot;
using Bytes = std::vector<std::uint8_t>;

KeyRecord record(std::initializer_list<std::uint8_t> data, std::uint64_t createdAt)
{
    return KeyRecord{ kmslocal::security::SecureBuffer(data), createdAt };
}

Bytes encoded(const KeySnapshot& s)
{
    const auto out{ encodeBinarySnapshot(s) };
    return { out.begin(), out.end() };
}

void putU64(Bytes& b, std::size_t offset, std::uint64_t v)
{
    for (std::size_t i{}; i < 8U; ++i)
    {
        b[offset + i] = static_cast<std::uint8_t>(v >> (8U * i));
    }
}

constexpr std::size_t g_kHeaderBytes{ 8U + 4U + 8U + 8U };
constexpr std::size_t g_kFirstVersionOffset{ g_kHeaderBytes };
constexpr std::size_t g_kSecondVersionOffset{ g_kHeaderBytes + 24U + 2U };

KeySnapshot twoEntries()
{
    KeySnapshot s{};
    s.count = 3U;
    s.entries.emplace(1U, record({ 0xAAU, 0xBBU }, 100U));
    s.entries.emplace(3U, record({ 0x01U }, 200U));
    return s;
}

TEST(BinarySnapshotCodec, EncodesDocumentedLayout)
{
    const Bytes b{ encoded(twoEntries()) };

    const Bytes expected{
        'K',  'M',  'S',  'L', 'S', 'N', 'A', 'P', // magic
        1,    0,    0,    0,                       // format version
        3,    0,    0,    0,   0,   0,   0,   0,   // count
        2,    0,    0,    0,   0,   0,   0,   0,   // entry count
        1,    0,    0,    0,   0,   0,   0,   0,   // version
        100,  0,    0,    0,   0,   0,   0,   0,   // created
        2,    0,    0,    0,   0,   0,   0,   0,   // data length
        0xAA, 0xBB,                                //
        3,    0,    0,    0,   0,   0,   0,   0,   //
        200,  0,    0,    0,   0,   0,   0,   0,   //
        1,    0,    0,    0,   0,   0,   0,   0,   //
        0x01,
    };
    EXPECT_EQ(b, expected);
}

TEST(BinarySnapshotCodec, DecodesWhatItEncodes)
{
    const KeySnapshot in{ twoEntries() };
    const KeySnapshot out{ decodeBinarySnapshot(encoded(in)) };
    EXPECT_EQ(out.count, in.count);
    EXPECT_EQ(out.entries, in.entries);
}

TEST(BinarySnapshotCodec, EmptyStoreIsHeaderOnly)
{
    const KeySnapshot out{ decodeBinarySnapshot(encoded(KeySnapshot{})) };
    EXPECT_EQ(out.count, 0U);
    EXPECT_TRUE(out.entries.empty());
    EXPECT_EQ(encoded(KeySnapshot{}).size(), g_kHeaderBytes);
}

TEST(BinarySnapshotCodec, EmptyPayloadSurvives)
{
    KeySnapshot in{};
    in.count = 1U;
    in.entries.emplace(1U, record({}, 7U));
    const KeySnapshot out{ decodeBinarySnapshot(encoded(in)) };
    ASSERT_EQ(out.entries.size(), 1U);
    EXPECT_TRUE(out.entries.at(1U).data.empty());
    EXPECT_EQ(out.entries.at(1U).createdAtUnixSeconds, 7U);
}

TEST(BinarySnapshotCodec, ToleratesCountBelowHighestEntry)
{
    KeySnapshot in{ twoEntries() };
    in.count = 1U;
    const KeySnapshot out{ decodeBinarySnapshot(encoded(in)) };
    EXPECT_EQ(out.count, 1U);
    EXPECT_EQ(out.entries.size(), 2U);
}

TEST(BinarySnapshotCodec, RejectsBadMagic)
{
    Bytes b{ encoded(twoEntries()) };
    b[0] = 'X';
    EXPECT_THROW((void)decodeBinarySnapshot(b), CodecError);
}

TEST(BinarySnapshotCodec, RejectsUnknownFormatVersion)
{
    Bytes b{ encoded(twoEntries()) };
    b[8] = 2U;
    EXPECT_THROW((void)decodeBinarySnapshot(b), CodecError);
}

TEST(BinarySnapshotCodec, RejectsEveryTruncation)
{
    const Bytes b{ encoded(twoEntries()) };
    for (std::size_t n{}; n < b.size(); ++n)
    {
        const Bytes cut(b.begin(), b.begin() + static_cast<std::ptrdiff_t>(n));
        EXPECT_THROW((void)decodeBinarySnapshot(cut), CodecError) << "length " << n;
    }
}

TEST(BinarySnapshotCodec, RejectsTrailingBytes)
{
    Bytes b{ encoded(twoEntries()) };
    b.push_back(0U);
    EXPECT_THROW((void)decodeBinarySnapshot(b), CodecError);
}

TEST(BinarySnapshotCodec, RejectsZeroVersion)
{
    Bytes b{ encoded(twoEntries()) };
    putU64(b, g_kFirstVersionOffset, 0U);
    EXPECT_THROW((void)decodeBinarySnapshot(b), CodecError);
}

TEST(BinarySnapshotCodec, RejectsNonIncreasingVersions)
{
    Bytes b{ encoded(twoEntries()) };
    putU64(b, g_kSecondVersionOffset, 1U);
    EXPECT_THROW((void)decodeBinarySnapshot(b), CodecError);
}

TEST(BinarySnapshotCodec, RejectsOversizedEntryCount)
{
    Bytes b{ encoded(twoEntries()) };
    putU64(b, 8U + 4U + 8U, 0xFFFFFFFFFFFFFFFFULL);
    EXPECT_THROW((void)decodeBinarySnapshot(b), CodecError);
}

TEST(BinarySnapshotCodec, RejectsOversizedDataLength)
{
    Bytes b{ encoded(twoEntries()) };
    putU64(b, g_kFirstVersionOffset + 16U, 1000U);
    EXPECT_THROW((void)decodeBinarySnapshot(b), CodecError);
}

} // namespace
