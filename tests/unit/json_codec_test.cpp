#include <gtest/gtest.h>

#include "kmslocal/codec/CodecErrors.hpp"
#include "kmslocal/codec/JsonSnapshotCodec.hpp"
#include <cstdint>
#include <initializer_list>
#include <string>

namespace
{

using kmslocal::codec::CodecError;
using kmslocal::codec::decodeJsonSnapshot;
using kmslocal::codec::encodeJsonSnapshot;
using kmslocal::core::KeyRecord;
using kmslocal::core::KeySnapshot;

KeyRecord record(std::initializer_list<std::uint8_t> data, std::uint64_t createdAt)
{
    return KeyRecord{ kmslocal::security::SecureBuffer(data), createdAt };
}

TEST(JsonSnapshotCodec, EncodesCountThenStore)
{
    KeySnapshot s{};
    s.count = 2U;
    s.entries.emplace(2U, record({ 1U, 255U }, 42U));

    EXPECT_EQ(encodeJsonSnapshot(s), R"({"count":2,"store":{"2":{"data":[1,255],"created":42}}})");
}

TEST(JsonSnapshotCodec, EmptyStore)
{
    EXPECT_EQ(encodeJsonSnapshot(KeySnapshot{}), R"({"count":0,"store":{}})");
    const KeySnapshot out{ decodeJsonSnapshot(R"({"count":0,"store":{}})") };
    EXPECT_EQ(out.count, 0U);
    EXPECT_TRUE(out.entries.empty());
}

TEST(JsonSnapshotCodec, DecodesHandWrittenDocument)
{
    const std::string text{ R"({
        "store": {
            "10": { "created": 5, "data": [] },
            "3":  { "data": [7, 8, 9], "created": 1700000000 }
        },
        "count": 12
    })" };

    const KeySnapshot out{ decodeJsonSnapshot(text) };
    EXPECT_EQ(out.count, 12U);
    ASSERT_EQ(out.entries.size(), 2U);
    EXPECT_EQ(out.entries.at(3U), record({ 7U, 8U, 9U }, 1700000000U));
    EXPECT_EQ(out.entries.at(10U), record({}, 5U));
}

TEST(JsonSnapshotCodec, DecodesWhatItEncodes)
{
    KeySnapshot in{};
    in.count = 9U;
    in.entries.emplace(1U, record({ 0U }, 1U));
    in.entries.emplace(9U, record({ 10U, 1U, 2U, 4U }, 2U));

    const KeySnapshot out{ decodeJsonSnapshot(encodeJsonSnapshot(in)) };
    EXPECT_EQ(out.count, in.count);
    EXPECT_EQ(out.entries, in.entries);
}

TEST(JsonSnapshotCodec, RejectsMalformedJson)
{
    EXPECT_THROW((void)decodeJsonSnapshot(""), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":1,"store":{)"), CodecError);
}

TEST(JsonSnapshotCodec, RejectsWrongShape)
{
    EXPECT_THROW((void)decodeJsonSnapshot("[]"), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"store":{}})"), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":0})"), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":-1,"store":{}})"), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":0,"store":[]})"), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":1,"store":{"1":{"data":[1]}}})"), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":1,"store":{"1":{"data":"01","created":0}}})"), CodecError);
}

TEST(JsonSnapshotCodec, RejectsNonByteData)
{
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":1,"store":{"1":{"data":[256],"created":0}}})"), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":1,"store":{"1":{"data":[-1],"created":0}}})"), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":1,"store":{"1":{"data":[1.5],"created":0}}})"), CodecError);
}

TEST(JsonSnapshotCodec, RejectsBadVersionKeys)
{
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":1,"store":{"0":{"data":[],"created":0}}})"), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":1,"store":{"v1":{"data":[],"created":0}}})"), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":1,"store":{"1x":{"data":[],"created":0}}})"), CodecError);
    EXPECT_THROW((void)decodeJsonSnapshot(R"({"count":1,"store":{"":{"data":[],"created":0}}})"), CodecError);
}

TEST(JsonSnapshotCodec, RejectsDuplicateNumericVersions)
{
    EXPECT_THROW(
        (void)decodeJsonSnapshot(R"({"count":1,"store":{"1":{"data":[],"created":0},"01":{"data":[],"created":0}}})"),
        CodecError);
}

} // namespace
