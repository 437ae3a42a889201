#include "platform.h"

#ifdef _WIN32
#    ifndef NOMINMAX
#        define NOMINMAX 1
#    endif
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/ioctl.h>
#    include <sys/select.h>
#    include <termios.h>
#    include <unistd.h>
#endif

#include <csignal>
#include <cstdlib>
#include <string>

namespace rls {

namespace {

constexpr int kInterruptedStatus = 130;

#ifndef _WIN32

// Sends a device status report request and parses the "ESC[row;colR" reply.
std::optional<int> queryCursorRow()
{
    int fd = ::open("/dev/tty", O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) {
        return std::nullopt;
    }

    termios original{};
    if (tcgetattr(fd, &original) != 0) {
        ::close(fd);
        return std::nullopt;
    }

    termios modified = original;
    modified.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
    modified.c_cc[VMIN] = 0;
    modified.c_cc[VTIME] = 0;
    if (tcsetattr(fd, TCSANOW, &modified) != 0) {
        ::close(fd);
        return std::nullopt;
    }

    static constexpr char kRequest[] = "\x1b[6n";
    if (::write(fd, kRequest, sizeof(kRequest) - 1) != static_cast<ssize_t>(sizeof(kRequest) - 1)) {
        tcsetattr(fd, TCSANOW, &original);
        ::close(fd);
        return std::nullopt;
    }

    std::string buffer;
    buffer.reserve(32);
    while (buffer.size() < 32) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(fd, &read_fds);
        timeval timeout{};
        timeout.tv_sec = 0;
        timeout.tv_usec = 200000;
        if (::select(fd + 1, &read_fds, nullptr, nullptr, &timeout) <= 0) {
            break;
        }
        char ch = 0;
        if (::read(fd, &ch, 1) <= 0) {
            break;
        }
        buffer.push_back(ch);
        if (ch == 'R') {
            break;
        }
    }

    // Drop a reply that arrived late so it is not echoed once ECHO is back.
    tcflush(fd, TCIFLUSH);
    tcsetattr(fd, TCSANOW, &original);
    ::close(fd);

    std::size_t start = buffer.find("\x1b[");
    std::size_t separator = buffer.find(';', start);
    if (start == std::string::npos || separator == std::string::npos || buffer.back() != 'R') {
        return std::nullopt;
    }
    int row = 0;
    for (std::size_t i = start + 2; i < separator; ++i) {
        char ch = buffer[i];
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        row = row * 10 + (ch - '0');
    }
    if (row <= 0) {
        return std::nullopt;
    }
    return row;
}

#endif // !_WIN32

void onInterrupt(int)
{
#ifdef _WIN32
    std::_Exit(kInterruptedStatus);
#else
    static constexpr char kMessage[] = "\nInterrupted.\n";
    ssize_t ignored = ::write(STDOUT_FILENO, kMessage, sizeof(kMessage) - 1);
    (void)ignored;
    ::_exit(kInterruptedStatus);
#endif
}

} // namespace

bool Platform::enableVirtualTerminal()
{
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    SetConsoleOutputCP(CP_UTF8);

    if (hOut == INVALID_HANDLE_VALUE) {
        return false;
    }

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode)) {
        return false;
    }

    if ((dwMode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0) {
        return true;
    }

    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    return SetConsoleMode(hOut, dwMode) != 0;
#else
    return true;
#endif
}

bool Platform::isOutputTerminal()
{
#ifdef _WIN32
    HANDLE handle = GetStdHandle(STD_OUTPUT_HANDLE);
    if (handle == INVALID_HANDLE_VALUE) {
        return false;
    }
    DWORD mode = 0;
    return GetConsoleMode(handle, &mode) != 0;
#else
    return ::isatty(STDOUT_FILENO) != 0;
#endif
}

int Platform::terminalHeight()
{
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (GetConsoleScreenBufferInfo(hOut, &csbi)) {
        return (csbi.srWindow.Bottom - csbi.srWindow.Top + 1);
    }
    return 24;
#else
    struct winsize w {
    };
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_row > 0) {
        return w.ws_row;
    }
    return 24;
#endif
}

std::optional<int> Platform::cursorRow()
{
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (GetConsoleScreenBufferInfo(hOut, &csbi)) {
        return csbi.dwCursorPosition.Y - csbi.srWindow.Top + 1;
    }
    return std::nullopt;
#else
    if (!isOutputTerminal()) {
        return std::nullopt;
    }
    return queryCursorRow();
#endif
}

void Platform::installInterruptHandler()
{
    std::signal(SIGINT, onInterrupt);
}

}  // namespace rls
