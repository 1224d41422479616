#pragma once

#include <string>
#include <string_view>

namespace dotsweep {

// Shell-style glob match of a single name: '*', '?' and '[...]' classes with
// ranges and '!' negation. Case-sensitive; '/' has no special meaning.
[[nodiscard]] bool wildcard_match(std::string_view pattern, std::string_view text);

// Single-quotes a value for /bin/sh.
[[nodiscard]] std::string shell_quote(std::string_view value);

} // namespace dotsweep
