#include "ConsoleUtils.hpp"

#include <iostream>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <io.h>
#elif defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace credhash::ui::cli
{

namespace
{

// Turns echo off on the console for its lifetime and restores the saved mode afterwards,
// also when reading throws.
class EchoOff final
{
public:
    EchoOff() noexcept
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        if (_isatty(_fileno(stdin)) == 0 || GetConsoleMode(m_handle, &m_saved) == 0)
        {
            return;
        }
        m_active = SetConsoleMode(m_handle, m_saved & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
#elif defined(__linux__)
        if (::isatty(STDIN_FILENO) != 1 || tcgetattr(STDIN_FILENO, &m_saved) != 0)
        {
            return;
        }
        struct termios quiet = m_saved;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        m_active = tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet) == 0;
#endif
    }

    EchoOff(const EchoOff&) = delete;
    EchoOff& operator=(const EchoOff&) = delete;

    ~EchoOff() noexcept
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        SetConsoleMode(m_handle, m_saved);
#elif defined(__linux__)
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &m_saved);
#endif
    }

    [[nodiscard]] bool active() const noexcept
    {
        return m_active;
    }

private:
#if defined(_WIN32)
    HANDLE m_handle{ nullptr };
    DWORD m_saved{};
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
#if defined(_WIN32)
    // Not implemented on Windows.
#elif defined(__linux__)
    mlockall(MCL_CURRENT | MCL_FUTURE);
    const struct rlimit noCore
    {
        0, 0
    };
    setrlimit(RLIMIT_CORE, &noCore);
#endif
}

credhash::security::SecureString readPassword(const std::string& promptText, std::istream& in, std::ostream& prompt)
{
    prompt << promptText << std::flush;

    std::string line;
    bool echoWasOff{ false };
    {
        std::optional<EchoOff> echo;
        if (&in == &std::cin)
        {
            echo.emplace();
            echoWasOff = echo->active();
        }
        std::getline(in, line);
    }
    if (echoWasOff)
    {
        prompt << '\n';
    }

    if (!line.empty() && line.back() == '\r')
    {
        line.pop_back();
    }
    return credhash::security::secureStringTake(line);
}

credhash::security::SecureString readPassword(const std::string& promptText)
{
    return readPassword(promptText, std::cin, std::cerr);
}

} // namespace credhash::ui::cli
