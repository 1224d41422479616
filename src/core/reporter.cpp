#include "dotsweep/reporter.h"

#include <ostream>
#include <string_view>

namespace dotsweep {

namespace {
constexpr std::string_view kBold = "\x1b[1m";
constexpr std::string_view kYellow = "\x1b[33m";
constexpr std::string_view kCyan = "\x1b[36m";
constexpr std::string_view kReset = "\x1b[0m";
} // namespace

void Report::add(const std::filesystem::path& path, const Outcome& outcome) {
    ++processed_;
    if (outcome.file) {
        ++files_;
    }
    attributes_ += outcome.attrs.size();
    if (outcome.junk) {
        ++junk_;
    }
    if (outcome.any()) {
        affected_.push_back(path);
    }
}

void print_report(std::ostream& out, const RunResult& result, const Config::Options& options, bool color) {
    if (options.quiet) {
        return;
    }

    auto paint = [color](std::string_view code) { return color ? code : std::string_view{}; };
    const Report& report = result.report;

    if (result.interrupted) {
        out << paint(kYellow) << "Interrupted" << paint(kReset) << ": reporting " << report.processed() << " of "
            << result.total << " files\n";
    } else if (result.stalled) {
        out << paint(kYellow) << "Stopped waiting" << paint(kReset) << " after " << options.task_timeout.count()
            << "s without progress: reporting " << report.processed() << " of " << result.total << " files\n";
    }

    if (options.summary && !report.affected().empty()) {
        out << paint(kBold) << "Affected files:" << paint(kReset) << '\n';
        for (const auto& path : report.affected()) {
            out << "  " << paint(kCyan) << path.string() << paint(kReset) << '\n';
        }
    }

    const std::string_view prefix = options.dry_run ? "[dry-run] " : "";
    out << prefix << "Zone.Identifier files removed: " << report.files_removed() << '\n';
    out << prefix << "Extended attributes removed: " << report.attributes_removed() << '\n';
    out << prefix << "Junk files removed: " << report.junk_removed() << '\n';
}

} // namespace dotsweep
