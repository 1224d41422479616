#include "dotsweep/worker.h"

#include <system_error>

#include "dotsweep/logger.h"
#include "dotsweep/rules.h"

namespace dotsweep {

std::vector<std::string> attribute_candidates(const Config::Options& options) {
    std::vector<std::string> names;
    names.reserve(options.extra_attributes.size() + 1);
    names.emplace_back(rules::kDefaultAttribute);
    names.insert(names.end(), options.extra_attributes.begin(), options.extra_attributes.end());
    return names;
}

bool remove_file(const std::filesystem::path& path, bool dry_run) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
    if (dry_run) {
        return true;
    }

    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        Logger::instance().info("cannot remove {}: {}", path.string(), ec.message());
        return false;
    }
    return removed;
}

Outcome process_file(const FileTask& task, const XattrBackend& backend) {
    static const Config::Options kDefaults{};
    const Config::Options& options = task.options != nullptr ? *task.options : kDefaults;
    auto& log = Logger::instance();

    Outcome outcome;
    if (rules::is_junk_file(task.path) && remove_file(task.path, options.dry_run)) {
        outcome.junk = true;
        log.debug("junk {}", task.path.string());
    }

    if (rules::is_provenance_marker(task.path) && remove_file(task.path, options.dry_run)) {
        outcome.file = true;
        log.debug("provenance marker {}", task.path.string());
    }

    for (const auto& attribute : attribute_candidates(options)) {
        if (remove_attribute(backend, task.path, attribute, options.dry_run, options.removal_policy)) {
            outcome.attrs.push_back(attribute);
            log.debug("attribute {} on {}", attribute, task.path.string());
        }
    }

    log.trace("processed {}", task.path.string());
    return outcome;
}

} // namespace dotsweep
