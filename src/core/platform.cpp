#include "dotsweep/platform.h"

#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#else
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace dotsweep::platform {

OsFamily detect_os() noexcept {
#if defined(__APPLE__)
    return OsFamily::MacOS;
#elif defined(__linux__)
    return OsFamily::Linux;
#else
    return OsFamily::Other;
#endif
}

std::string_view os_name(OsFamily os) noexcept {
    switch (os) {
        case OsFamily::MacOS:
            return "macos";
        case OsFamily::Linux:
            return "linux";
        case OsFamily::Other:
            return "other";
    }
    return "unknown";
}

bool stdout_supports_color() {
    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
#ifdef _WIN32
    HANDLE handle = ::GetStdHandle(STD_OUTPUT_HANDLE);
    if (handle == INVALID_HANDLE_VALUE) {
        return false;
    }
    DWORD mode = 0;
    if (!::GetConsoleMode(handle, &mode)) {
        return false;
    }
    mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    ::SetConsoleMode(handle, mode);
    return true;
#else
    return ::isatty(STDOUT_FILENO) != 0;
#endif
}

bool stderr_is_terminal() {
#ifdef _WIN32
    return ::_isatty(_fileno(stderr)) != 0;
#else
    return ::isatty(STDERR_FILENO) != 0;
#endif
}

int terminal_width() {
#ifdef _WIN32
    HANDLE handle = ::GetStdHandle(STD_ERROR_HANDLE);
    if (handle == INVALID_HANDLE_VALUE) {
        return 80;
    }
    CONSOLE_SCREEN_BUFFER_INFO info{};
    if (!::GetConsoleScreenBufferInfo(handle, &info)) {
        return 80;
    }
    return static_cast<int>(info.srWindow.Right - info.srWindow.Left + 1);
#else
    struct winsize ws {
    };
    if (::ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return static_cast<int>(ws.ws_col);
    }
    return 80;
#endif
}

} // namespace dotsweep::platform
