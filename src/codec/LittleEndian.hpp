#ifndef KMSLOCAL_SRC_CODEC_LITTLEENDIAN_HPP
#define KMSLOCAL_SRC_CODEC_LITTLEENDIAN_HPP

#include "kmslocal/codec/CodecErrors.hpp"
#include "kmslocal/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace kmslocal::codec::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };
constexpr std::size_t g_kU64Bytes{ sizeof(std::uint64_t) };
constexpr unsigned g_kBitsPerByte{ 8U };

// Appends fixed-width little-endian integers and raw bytes to a wiping buffer.
class LeWriter final
{
public:
    explicit LeWriter(kmslocal::security::SecureBuffer& out) noexcept : m_out{ &out }
    {
    }

    void u32(std::uint32_t v)
    {
        for (std::size_t i{}; i < g_kU32Bytes; ++i)
        {
            m_out->push_back(static_cast<std::uint8_t>(v >> (i * g_kBitsPerByte)));
        }
    }

    void u64(std::uint64_t v)
    {
        for (std::size_t i{}; i < g_kU64Bytes; ++i)
        {
            m_out->push_back(static_cast<std::uint8_t>(v >> (i * g_kBitsPerByte)));
        }
    }

    void bytes(std::span<const std::uint8_t> b)
    {
        m_out->insert(m_out->end(), b.begin(), b.end());
    }

private:
    kmslocal::security::SecureBuffer* m_out{ nullptr };
};

// Bounds-checked cursor; every read past the end throws CodecError.
class LeReader final
{
public:
    explicit LeReader(std::span<const std::uint8_t> in) noexcept : m_in{ in }
    {
    }

    [[nodiscard]] std::uint32_t u32()
    {
        const auto b{ take(g_kU32Bytes) };
        std::uint32_t v{ 0U };
        for (std::size_t i{}; i < g_kU32Bytes; ++i)
        {
            v |= static_cast<std::uint32_t>(b[i]) << (i * g_kBitsPerByte);
        }
        return v;
    }

    [[nodiscard]] std::uint64_t u64()
    {
        const auto b{ take(g_kU64Bytes) };
        std::uint64_t v{ 0U };
        for (std::size_t i{}; i < g_kU64Bytes; ++i)
        {
            v |= static_cast<std::uint64_t>(b[i]) << (i * g_kBitsPerByte);
        }
        return v;
    }

    [[nodiscard]] std::span<const std::uint8_t> take(std::size_t n)
    {
        if (n > remaining())
        {
            throw CodecError("snapshot: truncated input");
        }
        const auto out{ m_in.subspan(m_pos, n) };
        m_pos += n;
        return out;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_in.size() - m_pos;
    }

private:
    std::span<const std::uint8_t> m_in;
    std::size_t m_pos{ 0U };
};

} // namespace kmslocal::codec::detail

#endif // KMSLOCAL_SRC_CODEC_LITTLEENDIAN_HPP
