#include "dotsweep/collector.h"

#include <string>
#include <system_error>

#include "dotsweep/logger.h"
#include "dotsweep/rules.h"

namespace dotsweep {

FileCollector::FileCollector(const Config::Options& options)
    : options_{options} {}

std::vector<std::filesystem::path> FileCollector::collect() const {
    std::vector<std::filesystem::path> files;
    files.reserve(256);

    std::error_code ec;
    if (!std::filesystem::is_directory(options_.root, ec)) {
        Logger::instance().warn("{} is not a directory", options_.root.string());
        return files;
    }

    if (options_.recursive) {
        walk(options_.root, files);
    } else {
        list(options_.root, files);
    }
    Logger::instance().info("collected {} files under {}", files.size(), options_.root.string());
    return files;
}

void FileCollector::walk(const std::filesystem::path& root, std::vector<std::filesystem::path>& out) const {
    auto& log = Logger::instance();
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it{
        root, std::filesystem::directory_options::skip_permission_denied, ec};
    if (ec) {
        log.warn("cannot open {}: {}", root.string(), ec.message());
        return;
    }

    const std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        std::error_code type_ec;
        if (!entry.is_directory(type_ec)) {
            out.push_back(entry.path());
        } else if (options_.exclude_vcs && !entry.is_symlink(type_ec) &&
                   rules::is_vcs_directory(entry.path().filename().string())) {
            log.debug("skipping {}", entry.path().string());
            it.disable_recursion_pending();
        }

        it.increment(ec);
        if (ec) {
            log.warn("stopped walking {}: {}", root.string(), ec.message());
            break;
        }
    }
}

void FileCollector::list(const std::filesystem::path& root, std::vector<std::filesystem::path>& out) const {
    std::error_code ec;
    std::filesystem::directory_iterator it{root, ec};
    if (ec) {
        Logger::instance().warn("cannot open {}: {}", root.string(), ec.message());
        return;
    }

    const std::filesystem::directory_iterator end;
    while (it != end) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            out.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            Logger::instance().warn("stopped listing {}: {}", root.string(), ec.message());
            break;
        }
    }
}

} // namespace dotsweep
