#include "ConsoleUtils.hpp"

#include <iostream>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace kmslocal::ui::cli
{

namespace
{

// Turns echo off for its lifetime when stdin is a terminal.
class EchoOff final
{
public:
    EchoOff() noexcept
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        if (GetConsoleMode(m_handle, &m_saved) != 0)
        {
            m_active = SetConsoleMode(m_handle, m_saved & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
        }
#else
        if (isatty(STDIN_FILENO) == 1 && tcgetattr(STDIN_FILENO, &m_saved) == 0)
        {
            termios quiet{ m_saved };
            quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            m_active = tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0;
        }
#endif
    }

    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;
    EchoOff(EchoOff&&) = delete;
    EchoOff& operator=(EchoOff&&) = delete;

    ~EchoOff()
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        (void)SetConsoleMode(m_handle, m_saved);
#else
        (void)tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
#if defined(_WIN32)
    HANDLE m_handle{ nullptr };
    DWORD m_saved{ 0 };
#else
    termios m_saved{};
#endif
    bool m_active{ false };
};

} // namespace

void lockProcessMemory() noexcept
{
#if defined(__linux__)
    (void)mlockall(MCL_CURRENT | MCL_FUTURE);
    const rlimit noCore{ 0, 0 };
    (void)setrlimit(RLIMIT_CORE, &noCore);
#endif
}

kmslocal::security::SecureString readSecret(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    kmslocal::security::SecureString line;
    {
        const EchoOff echoOff{};
        (void)kmslocal::security::readSecureLine(std::cin, line);
    }
    std::cout << "\n";
    return line;
}

} // namespace kmslocal::ui::cli
