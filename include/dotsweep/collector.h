#pragma once

#include <filesystem>
#include <vector>

#include "dotsweep/config.h"

namespace dotsweep {

// Enumerates the files under a root before any of them is processed.
class FileCollector {
public:
    explicit FileCollector(const Config::Options& options);

    // Recursive mode lists every non-directory entry below the root without
    // following directory symlinks; flat mode lists the root's regular files.
    // Unreadable directories are logged and skipped.
    std::vector<std::filesystem::path> collect() const;

private:
    void walk(const std::filesystem::path& root, std::vector<std::filesystem::path>& out) const;
    void list(const std::filesystem::path& root, std::vector<std::filesystem::path>& out) const;

    const Config::Options& options_;
};

} // namespace dotsweep
