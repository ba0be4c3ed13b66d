#include "kmslocal/codec/JsonSnapshotCodec.hpp"
#include "kmslocal/codec/CodecErrors.hpp"
#include <charconv>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace kmslocal::codec
{
namespace
{

using Json = nlohmann::ordered_json;

constexpr std::uint64_t g_kMaxByteValue{ std::numeric_limits<std::uint8_t>::max() };

[[nodiscard]] kmslocal::core::Version parseVersionKey(std::string_view key)
{
    kmslocal::core::Version v{ 0U };
    const auto* first{ key.data() };
    const auto* last{ key.data() + key.size() };
    const auto [ptr, ec]{ std::from_chars(first, last, v) };
    if (key.empty() || ec != std::errc{} || ptr != last || v == 0U)
    {
        throw CodecError("json snapshot: invalid version key");
    }
    return v;
}

[[nodiscard]] std::uint64_t requireUnsigned(const Json& j, const char* what)
{
    if (!j.is_number_unsigned())
    {
        throw CodecError(what);
    }
    return j.get<std::uint64_t>();
}

[[nodiscard]] kmslocal::core::KeyRecord decodeRecord(const Json& j)
{
    if (!j.is_object() || !j.contains("data") || !j.contains("created"))
    {
        throw CodecError("json snapshot: record needs 'data' and 'created'");
    }
    const Json& data{ j.at("data") };
    if (!data.is_array())
    {
        throw CodecError("json snapshot: 'data' is not an array");
    }

    kmslocal::core::KeyRecord record{};
    record.data.reserve(data.size());
    for (const Json& b : data)
    {
        const std::uint64_t v{ requireUnsigned(b, "json snapshot: 'data' element is not a byte") };
        if (v > g_kMaxByteValue)
        {
            throw CodecError("json snapshot: 'data' element is not a byte");
        }
        record.data.push_back(static_cast<std::uint8_t>(v));
    }
    record.createdAtUnixSeconds = requireUnsigned(j.at("created"), "json snapshot: 'created' is not unsigned");
    return record;
}

} // namespace

std::string encodeJsonSnapshot(const kmslocal::core::KeySnapshot& snapshot)
{
    Json store = Json::object();
    for (const auto& [version, record] : snapshot.entries)
    {
        Json data = Json::array();
        for (const std::uint8_t b : record.data)
        {
            data.push_back(b);
        }
        Json entry = Json::object();
        entry["data"] = std::move(data);
        entry["created"] = record.createdAtUnixSeconds;
        store[std::to_string(version)] = std::move(entry);
    }

    Json root = Json::object();
    root["count"] = snapshot.count;
    root["store"] = std::move(store);
    return root.dump();
}

kmslocal::core::KeySnapshot decodeJsonSnapshot(std::string_view text)
{
    Json root{};
    try
    {
        root = Json::parse(text.begin(), text.end());
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw CodecError(std::string{ "json snapshot: " } + e.what());
    }

    if (!root.is_object() || !root.contains("count") || !root.contains("store"))
    {
        throw CodecError("json snapshot: document needs 'count' and 'store'");
    }
    const Json& store{ root.at("store") };
    if (!store.is_object())
    {
        throw CodecError("json snapshot: 'store' is not an object");
    }

    kmslocal::core::KeySnapshot out{};
    out.count = requireUnsigned(root.at("count"), "json snapshot: 'count' is not unsigned");
    for (const auto& [key, value] : store.items())
    {
        const kmslocal::core::Version version{ parseVersionKey(key) };
        if (!out.entries.emplace(version, decodeRecord(value)).second)
        {
            throw CodecError("json snapshot: duplicate version");
        }
    }
    return out;
}

} // namespace kmslocal::codec
