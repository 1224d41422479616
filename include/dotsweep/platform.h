#pragma once

#include <string_view>

namespace dotsweep::platform {

enum class OsFamily {
    MacOS,
    Linux,
    Other
};

// Identity of the running operating system, fixed at compile time.
OsFamily detect_os() noexcept;
std::string_view os_name(OsFamily os) noexcept;

bool stdout_supports_color();
bool stderr_is_terminal();
int terminal_width();

} // namespace dotsweep::platform
