#pragma once

#include <array>
#include <filesystem>
#include <string_view>

namespace dotsweep::rules {

// Basenames of OS-generated artifacts, compared literally.
inline constexpr std::array<std::string_view, 12> kJunkNames{
    ".DS_Store",
    "Thumbs.db",
    "desktop.ini",
    ".AppleDouble",
    ".LSOverride",
    ".Trash-*",
    ".fseventsd",
    ".Spotlight-V100",
    ".DocumentRevisions-V100",
    ".TemporaryItems",
    "lost+found",
    ".directory",
};

// Glob patterns matched against the basename only.
inline constexpr std::array<std::string_view, 7> kJunkPatterns{
    "._*",
    "*.swp",
    "*.swo",
    "*.tmp",
    "*.bak",
    "*~",
    ".nfs*",
};

// Alternate-stream files copied off NTFS carry this token in their path.
inline constexpr std::string_view kProvenanceToken = ":Zone.Identifier";

// Always swept, ahead of any user-supplied attribute names.
inline constexpr std::string_view kDefaultAttribute = "user.Zone.Identifier";

// Directory names skipped when version-control exclusion is on.
inline constexpr std::array<std::string_view, 6> kVcsDirectories{
    ".git",
    ".hg",
    ".svn",
    ".bzr",
    "CVS",
    "_darcs",
};

[[nodiscard]] bool is_junk_name(std::string_view basename);
[[nodiscard]] bool is_junk_file(const std::filesystem::path& path);
[[nodiscard]] bool is_provenance_marker(const std::filesystem::path& path);
[[nodiscard]] bool is_vcs_directory(std::string_view name);

} // namespace dotsweep::rules
