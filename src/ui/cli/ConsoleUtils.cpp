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

namespace itemcrypt::ui::cli
{

namespace
{

// Restores the terminal echo state it found, also when reading throws.
class EchoGuard final
{
public:
    EchoGuard() noexcept
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        if (GetConsoleMode(m_handle, &m_mode) != 0)
        {
            m_active = SetConsoleMode(m_handle, m_mode & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
        }
#elif defined(__linux__)
        if (isatty(STDIN_FILENO) == 1 && tcgetattr(STDIN_FILENO, &m_saved) == 0)
        {
            struct termios silent = m_saved;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            m_active = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
        }
#endif
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;
    EchoGuard(EchoGuard&&) = delete;
    EchoGuard& operator=(EchoGuard&&) = delete;

    ~EchoGuard() noexcept
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        (void)SetConsoleMode(m_handle, m_mode);
#elif defined(__linux__)
        (void)tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
#if defined(_WIN32)
    HANDLE m_handle{};
    DWORD m_mode{};
#elif defined(__linux__)
    struct termios m_saved
    {
    };
#endif
    bool m_active{ false };
};

} // namespace

void lockProcessMemory() noexcept
{
#if defined(__linux__)
    (void)mlockall(MCL_CURRENT | MCL_FUTURE);
    struct rlimit lim
    {
        0, 0
    };
    (void)setrlimit(RLIMIT_CORE, &lim);
#endif
}

itemcrypt::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line;
    {
        const EchoGuard noEcho{};
        std::getline(std::cin, line);
    }
    std::cout << "\n";

    auto sec = itemcrypt::security::secureStringFrom(line);
    itemcrypt::security::secureWipe(std::span<char>{ line.data(), line.size() });
    return sec;
}

} // namespace itemcrypt::ui::cli
