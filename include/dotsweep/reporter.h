#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <vector>

#include "dotsweep/config.h"
#include "dotsweep/worker.h"

namespace dotsweep {

// Running totals over the outcomes aggregated so far.
class Report {
public:
    void add(const std::filesystem::path& path, const Outcome& outcome);

    std::size_t processed() const noexcept { return processed_; }
    std::size_t files_removed() const noexcept { return files_; }
    std::size_t attributes_removed() const noexcept { return attributes_; }
    std::size_t junk_removed() const noexcept { return junk_; }

    // Paths with at least one removal, in aggregation order.
    const std::vector<std::filesystem::path>& affected() const noexcept { return affected_; }

private:
    std::size_t processed_ = 0;
    std::size_t files_ = 0;
    std::size_t attributes_ = 0;
    std::size_t junk_ = 0;
    std::vector<std::filesystem::path> affected_;
};

struct RunResult {
    Report report;
    std::size_t total = 0;      // tasks collected
    std::size_t dispatched = 0; // tasks a worker had started when the run ended
    bool interrupted = false;
    bool stalled = false;

    bool partial() const noexcept { return interrupted || stalled; }
};

void print_report(std::ostream& out, const RunResult& result, const Config::Options& options, bool color);

} // namespace dotsweep
