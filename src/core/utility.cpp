#include "dotsweep/utility.h"

namespace dotsweep {

namespace {
constexpr std::size_t npos = std::string_view::npos;

// Index of the ']' closing the class opened at pattern[open], or npos.
std::size_t class_end(std::string_view pattern, std::size_t open) {
    std::size_t i = open + 1;
    if (i < pattern.size() && pattern[i] == '!') {
        ++i;
    }
    if (i < pattern.size() && pattern[i] == ']') {
        ++i;
    }
    while (i < pattern.size() && pattern[i] != ']') {
        ++i;
    }
    return i < pattern.size() ? i : npos;
}

bool class_contains(std::string_view body, char ch) {
    bool negate = false;
    if (!body.empty() && body.front() == '!') {
        negate = true;
        body.remove_prefix(1);
    }

    bool found = false;
    for (std::size_t i = 0; i < body.size() && !found; ++i) {
        if (i + 2 < body.size() && body[i + 1] == '-') {
            const auto lo = static_cast<unsigned char>(body[i]);
            const auto hi = static_cast<unsigned char>(body[i + 2]);
            const auto c = static_cast<unsigned char>(ch);
            found = lo <= c && c <= hi;
            i += 2;
        } else {
            found = body[i] == ch;
        }
    }
    return found != negate;
}

// Matches one non-star pattern element at pattern[p] against ch and stores the
// index of the following element in next.
bool match_one(std::string_view pattern, std::size_t p, char ch, std::size_t& next) {
    const char token = pattern[p];
    if (token == '?') {
        next = p + 1;
        return true;
    }
    if (token == '[') {
        const std::size_t end = class_end(pattern, p);
        if (end != npos) {
            next = end + 1;
            return class_contains(pattern.substr(p + 1, end - p - 1), ch);
        }
    }
    next = p + 1;
    return token == ch;
}
} // namespace

bool wildcard_match(std::string_view pattern, std::string_view text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = npos;
    std::size_t match = 0;

    while (t < text.size()) {
        std::size_t next = 0;
        if (p < pattern.size() && pattern[p] == '*') {
            star = ++p;
            match = t;
        } else if (p < pattern.size() && match_one(pattern, p, text[t], next)) {
            p = next;
            ++t;
        } else if (star != npos) {
            p = star;
            t = ++match;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }

    return p == pattern.size();
}

std::string shell_quote(std::string_view value) {
    std::string result = "'";
    for (char ch : value) {
        if (ch == '\'') {
            result += "'\\''";
        } else {
            result += ch;
        }
    }
    result += "'";
    return result;
}

} // namespace dotsweep
