#include "dotsweep/rules.h"

#include <algorithm>
#include <string>

#include "dotsweep/utility.h"

namespace dotsweep::rules {

bool is_junk_name(std::string_view basename) {
    if (basename.empty()) {
        return false;
    }
    if (std::find(kJunkNames.begin(), kJunkNames.end(), basename) != kJunkNames.end()) {
        return true;
    }
    return std::any_of(kJunkPatterns.begin(), kJunkPatterns.end(), [basename](std::string_view pattern) {
        return wildcard_match(pattern, basename);
    });
}

bool is_junk_file(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    return is_junk_name(name);
}

bool is_provenance_marker(const std::filesystem::path& path) {
    return path.string().find(kProvenanceToken) != std::string::npos;
}

bool is_vcs_directory(std::string_view name) {
    return std::find(kVcsDirectories.begin(), kVcsDirectories.end(), name) != kVcsDirectories.end();
}

} // namespace dotsweep::rules
