#ifndef INCLUDE_KMSLOCAL_SECURITY_SECURESTRING_HPP
#define INCLUDE_KMSLOCAL_SECURITY_SECURESTRING_HPP

#include "kmslocal/security/SecureBuffer.hpp"
#include <cstddef>
#include <istream>
#include <span>
#include <string_view>
#include <vector>

namespace kmslocal::security
{

// Typed secrets (hex keys at a prompt) live here instead of std::string.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

// asStringView() without surrounding blanks, a trailing '\r' included.
[[nodiscard]] inline std::string_view trimmedView(const SecureString& s) noexcept
{
    constexpr std::string_view kBlanks{ " \t\r\n" };
    std::string_view v{ asStringView(s) };
    const auto first{ v.find_first_not_of(kBlanks) };
    if (first == std::string_view::npos)
    {
        return {};
    }
    v.remove_prefix(first);
    v.remove_suffix(v.size() - (v.find_last_not_of(kBlanks) + 1U));
    return v;
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(std::span{ s.data(), s.size() });
    SecureString empty{};
    s.swap(empty);
}

// Reads up to the next '\n' straight into `out`, so the line never passes through a std::string.
// Returns false if nothing could be read.
inline bool readSecureLine(std::istream& in, SecureString& out)
{
    secureRelease(out);
    std::istream::sentry ok{ in, true };
    if (!ok)
    {
        return false;
    }

    bool any{ false };
    for (int c{ in.rdbuf()->sbumpc() }; c != std::istream::traits_type::eof(); c = in.rdbuf()->sbumpc())
    {
        any = true;
        if (c == '\n')
        {
            return true;
        }
        out.push_back(static_cast<char>(c));
    }
    in.setstate(any ? std::ios::eofbit : (std::ios::eofbit | std::ios::failbit));
    return any;
}

} // namespace kmslocal::security

#endif // INCLUDE_KMSLOCAL_SECURITY_SECURESTRING_HPP
