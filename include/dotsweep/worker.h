#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "dotsweep/config.h"
#include "dotsweep/xattr.h"

namespace dotsweep {

struct FileTask {
    std::filesystem::path path;
    const Config::Options* options = nullptr;
};

struct Outcome {
    bool file = false;               // provenance marker deleted
    std::vector<std::string> attrs;  // attributes removed, in sweep order
    bool junk = false;               // junk rule matched and file deleted

    bool any() const noexcept { return file || junk || !attrs.empty(); }
};

// Built-in attribute followed by the user-supplied names.
std::vector<std::string> attribute_candidates(const Config::Options& options);

bool remove_file(const std::filesystem::path& path, bool dry_run);

// Runs the junk check, the provenance check and the attribute sweep on one
// file. Every step is attempted; failures are reported as false and never
// thrown.
Outcome process_file(const FileTask& task, const XattrBackend& backend);

} // namespace dotsweep
