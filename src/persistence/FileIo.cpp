#include "FileIo.hpp"
#include "kmslocal/persistence/PersistenceErrors.hpp"
#include "kmslocal/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace kmslocal::persistence::detail
{
namespace
{

constexpr std::size_t g_kTempTokenBytes{ 8U };

[[noreturn]] void throwIo(const std::string& what, int err)
{
    throw IoError(what + ": " + std::error_code{ err, std::generic_category() }.message());
}

[[nodiscard]] std::filesystem::path tempPathFor(const std::filesystem::path& target)
{
    const auto token{ kmslocal::security::randomHexToken(g_kTempTokenBytes) };
    if (!token)
    {
        throw IoError("atomicReplaceFile: cannot draw temporary file name");
    }

    std::filesystem::path tmp{ target };
    tmp += ".tmp." + *token;
    return tmp;
}

// Removes the temporary file unless released after a successful rename.
class TempFileGuard final
{
public:
    explicit TempFileGuard(std::filesystem::path path) : m_path{ std::move(path) }
    {
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;
    TempFileGuard(TempFileGuard&&) = delete;
    TempFileGuard& operator=(TempFileGuard&&) = delete;

    ~TempFileGuard()
    {
        if (m_active)
        {
            std::error_code ec{};
            (void)std::filesystem::remove(m_path, ec);
        }
    }

    void release() noexcept
    {
        m_active = false;
    }

private:
    std::filesystem::path m_path;
    bool m_active{ true };
};

#if defined(_WIN32)

struct HandleCloser final
{
    void operator()(HANDLE h) const noexcept
    {
        if (h != INVALID_HANDLE_VALUE)
        {
            (void)::CloseHandle(h);
        }
    }
};

void writeAndFlush(const std::filesystem::path& tmp, std::span<const std::uint8_t> bytes)
{
    HANDLE raw{ ::CreateFileW(tmp.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW, FILE_ATTRIBUTE_NORMAL, nullptr) };
    if (raw == INVALID_HANDLE_VALUE)
    {
        throw IoError("atomicReplaceFile: cannot create temporary file");
    }
    const std::unique_ptr<void, HandleCloser> handle{ raw };

    std::size_t written{ 0U };
    while (written < bytes.size())
    {
        const std::size_t remaining{ bytes.size() - written };
        const DWORD chunk{ static_cast<DWORD>((remaining > MAXDWORD) ? MAXDWORD : remaining) };
        DWORD n{ 0 };
        if (::WriteFile(raw, bytes.data() + written, chunk, &n, nullptr) == 0)
        {
            throw IoError("atomicReplaceFile: write failed");
        }
        written += n;
    }
    if (::FlushFileBuffers(raw) == 0)
    {
        throw IoError("atomicReplaceFile: flush failed");
    }
}

void renameOver(const std::filesystem::path& tmp, const std::filesystem::path& target)
{
    if (::MoveFileExW(tmp.c_str(), target.c_str(), MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH) == 0)
    {
        throw IoError("atomicReplaceFile: rename failed");
    }
}

void syncDirectory([[maybe_unused]] const std::filesystem::path& dir)
{
    // MOVEFILE_WRITE_THROUGH already flushed the rename.
}

#else

class FdGuard final
{
public:
    explicit FdGuard(int fd) noexcept : m_fd{ fd }
    {
    }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    FdGuard(FdGuard&&) = delete;
    FdGuard& operator=(FdGuard&&) = delete;

    ~FdGuard()
    {
        if (m_fd >= 0)
        {
            (void)::close(m_fd);
        }
    }

    [[nodiscard]] int get() const noexcept
    {
        return m_fd;
    }

    [[nodiscard]] int close() noexcept
    {
        const int rc{ ::close(m_fd) };
        m_fd = -1;
        return rc;
    }

private:
    int m_fd{ -1 };
};

void writeAndFlush(const std::filesystem::path& tmp, std::span<const std::uint8_t> bytes)
{
    constexpr mode_t g_kOwnerReadWrite{ S_IRUSR | S_IWUSR };
    FdGuard fd{ ::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, g_kOwnerReadWrite) };
    if (fd.get() < 0)
    {
        throwIo("atomicReplaceFile: cannot create temporary file", errno);
    }

    std::size_t written{ 0U };
    while (written < bytes.size())
    {
        const ssize_t n{ ::write(fd.get(), bytes.data() + written, bytes.size() - written) };
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throwIo("atomicReplaceFile: write failed", errno);
        }
        written += static_cast<std::size_t>(n);
    }

    if (::fsync(fd.get()) != 0)
    {
        throwIo("atomicReplaceFile: fsync failed", errno);
    }
    if (fd.close() != 0)
    {
        throwIo("atomicReplaceFile: close failed", errno);
    }
}

void renameOver(const std::filesystem::path& tmp, const std::filesystem::path& target)
{
    if (::rename(tmp.c_str(), target.c_str()) != 0)
    {
        throwIo("atomicReplaceFile: rename failed", errno);
    }
}

void syncDirectory(const std::filesystem::path& dir)
{
    FdGuard fd{ ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC) };
    if (fd.get() < 0)
    {
        throwIo("atomicReplaceFile: cannot open directory", errno);
    }
    if (::fsync(fd.get()) != 0 && errno != EINVAL)
    {
        throwIo("atomicReplaceFile: directory fsync failed", errno);
    }
}

#endif

} // namespace

kmslocal::security::SecureBuffer readFileBytes(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw IoError("readFileBytes: cannot open " + path.string());
    }

    std::error_code ec{};
    const auto size{ std::filesystem::file_size(path, ec) };
    if (ec)
    {
        throw IoError("readFileBytes: cannot stat " + path.string() + ": " + ec.message());
    }

    kmslocal::security::SecureBuffer out(static_cast<std::size_t>(size));
    if (!out.empty())
    {
        in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    }
    if (!in || in.peek() != std::ifstream::traits_type::eof())
    {
        throw IoError("readFileBytes: short read from " + path.string());
    }
    return out;
}

void atomicReplaceFile(const std::filesystem::path& target, std::span<const std::uint8_t> bytes)
{
    const std::filesystem::path dir{ target.has_parent_path() ? target.parent_path() : std::filesystem::path{ "." } };
    const std::filesystem::path tmp{ tempPathFor(target) };

    TempFileGuard guard{ tmp };
    writeAndFlush(tmp, bytes);
    renameOver(tmp, target);
    guard.release();

    syncDirectory(dir);
}

} // namespace kmslocal::persistence::detail
